/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vesting/vesting_math.hpp"

#include <algorithm>

namespace tv::vesting {
  using clock::Day;
  using primitives::bigdiv;

  Days daysLapsed(const Ticket &ticket, UnixTime now) {
    if (now <= ticket.created_at) {
      return 0;
    }
    return static_cast<Days>(
        std::chrono::duration_cast<Day>(now - ticket.created_at).count());
  }

  bool hasCliffed(const Ticket &ticket, UnixTime now) {
    if (now <= ticket.created_at) {
      return false;
    }
    // compare whole days first, cliff in seconds may overflow
    const auto full_days{daysLapsed(ticket, now)};
    if (full_days != ticket.cliff_days) {
      return full_days > ticket.cliff_days;
    }
    return now - ticket.created_at > Day{static_cast<int64_t>(full_days)};
  }

  TokenAmount unlockedTotal(const Ticket &ticket,
                            UnixTime now,
                            UnlockRule rule) {
    if (!hasCliffed(ticket, now)) {
      return 0;
    }
    if (ticket.vesting_days == 0) {
      return ticket.amount;
    }
    const auto lapsed{daysLapsed(ticket, now)};
    TokenAmount unlocked;
    switch (rule) {
      case UnlockRule::kStep:
        unlocked = TokenAmount{lapsed / ticket.vesting_days} * ticket.amount;
        break;
      case UnlockRule::kLinear:
        unlocked = bigdiv(ticket.amount * lapsed, ticket.vesting_days);
        break;
    }
    return std::min(unlocked, ticket.amount);
  }

  TokenAmount claimable(const Ticket &ticket, UnixTime now, UnlockRule rule) {
    const auto unlocked{unlockedTotal(ticket, now, rule)};
    if (unlocked <= ticket.claimed) {
      return 0;
    }
    return std::min(TokenAmount{unlocked - ticket.claimed}, ticket.balance);
  }

}  // namespace tv::vesting
