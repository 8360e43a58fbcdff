/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace tv::vesting {
  using clock::UnixTime;
  using primitives::Days;
  using primitives::TicketId;
  using primitives::TokenAmount;
  using primitives::address::Address;

  enum class TicketState {
    /** Not revoked, balance left */
    kActive,
    /** Everything claimed */
    kExhausted,
    kRevoked,
  };

  /**
   * Vesting grant of a fungible asset from grantor to beneficiary
   */
  struct Ticket {
    TicketId id{};
    Address asset;
    /** Funded the ticket, may revoke it unless irrevocable */
    Address grantor;
    /** Entitled to claim */
    Address beneficiary;
    Days cliff_days{};
    Days vesting_days{};
    /** Total granted */
    TokenAmount amount{};
    /** Total already withdrawn by beneficiary */
    TokenAmount claimed{};
    /** Still escrowed for the ticket */
    TokenAmount balance{};
    UnixTime created_at{};
    UnixTime last_claimed_at{};
    uint64_t num_claims{};
    bool irrevocable{false};
    bool is_revoked{false};
    UnixTime revoked_at{};

    TicketState state() const;

    bool operator==(const Ticket &other) const;
    bool operator!=(const Ticket &other) const;
  };

}  // namespace tv::vesting
