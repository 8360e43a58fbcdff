/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vesting/ticket.hpp"

namespace tv::vesting {

  /**
   * How granted amount unlocks after the cliff
   */
  enum class UnlockRule {
    /**
     * amount * days_lapsed / vesting_days, rounded down, up to amount
     */
    kLinear,
    /**
     * floor(days_lapsed / vesting_days) * amount: nothing until the whole
     * vesting period lapsed, then everything
     */
    kStep,
  };

  /**
   * Whole days lapsed since ticket creation, 0 before creation
   */
  Days daysLapsed(const Ticket &ticket, UnixTime now);

  /**
   * Cliff is reached strictly after created_at + cliff_days
   */
  bool hasCliffed(const Ticket &ticket, UnixTime now);

  /**
   * Total amount unlocked since creation, regardless of claims.
   * Ticket without vesting period unlocks everything at the cliff.
   * @return 0 before cliff, never more than ticket amount
   */
  TokenAmount unlockedTotal(const Ticket &ticket,
                            UnixTime now,
                            UnlockRule rule);

  /**
   * Amount beneficiary may withdraw now: unlocked minus already claimed,
   * bounded by [0, balance]
   */
  TokenAmount claimable(const Ticket &ticket, UnixTime now, UnlockRule rule);

}  // namespace tv::vesting
