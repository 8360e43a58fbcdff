/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vesting/ticket.hpp"

namespace tv::vesting {

  TicketState Ticket::state() const {
    if (is_revoked) {
      return TicketState::kRevoked;
    }
    if (balance == 0) {
      return TicketState::kExhausted;
    }
    return TicketState::kActive;
  }

  bool Ticket::operator==(const Ticket &other) const {
    return id == other.id && asset == other.asset && grantor == other.grantor
           && beneficiary == other.beneficiary
           && cliff_days == other.cliff_days
           && vesting_days == other.vesting_days && amount == other.amount
           && claimed == other.claimed && balance == other.balance
           && created_at == other.created_at
           && last_claimed_at == other.last_claimed_at
           && num_claims == other.num_claims
           && irrevocable == other.irrevocable
           && is_revoked == other.is_revoked
           && revoked_at == other.revoked_at;
  }

  bool Ticket::operator!=(const Ticket &other) const {
    return !(*this == other);
  }

}  // namespace tv::vesting
