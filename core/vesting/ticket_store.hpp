/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "common/outcome.hpp"
#include "vesting/ticket.hpp"

namespace tv::vesting {

  enum class TicketStoreError {
    kNotFound = 1,
  };

  /**
   * Ticket with the lock serializing its mutations
   */
  struct TicketSlot {
    std::mutex mutex;
    Ticket ticket;
  };

  /**
   * Arena of tickets keyed by sequential id with grantor and beneficiary
   * indexes. Tickets are never removed, so slot pointers stay valid for the
   * store lifetime.
   */
  class TicketStore {
   public:
    /**
     * Called for inserted ticket before it becomes visible to other callers
     */
    using OnInserted = std::function<void(const Ticket &)>;

    /**
     * Assigns next id to ticket and indexes it
     * @return assigned id
     */
    TicketId insert(Ticket ticket, const OnInserted &on_inserted = {});

    /**
     * Inserts all tickets under one lock, so ids are consecutive
     * @return assigned ids in order of tickets
     */
    std::vector<TicketId> insertAll(std::vector<Ticket> tickets,
                                    const OnInserted &on_inserted = {});

    /**
     * Slot to lock and mutate ticket in place
     */
    outcome::result<TicketSlot *> slot(TicketId id) const;

    /**
     * Consistent copy of ticket
     */
    outcome::result<Ticket> snapshot(TicketId id) const;

    std::vector<TicketId> byGrantor(const Address &grantor) const;

    std::vector<TicketId> byBeneficiary(const Address &beneficiary) const;

    /**
     * Number of tickets, also the id of next ticket
     */
    size_t size() const;

   private:
    TicketId insertLocked(Ticket ticket, const OnInserted &on_inserted);

    std::vector<std::unique_ptr<TicketSlot>> slots_;
    std::map<Address, std::vector<TicketId>> by_grantor_;
    std::map<Address, std::vector<TicketId>> by_beneficiary_;
    mutable std::shared_mutex mutex_;
  };

}  // namespace tv::vesting

OUTCOME_HPP_DECLARE_ERROR(tv::vesting, TicketStoreError);
