/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vesting/ticket_store.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tv::vesting, TicketStoreError, e) {
  using tv::vesting::TicketStoreError;
  if (e == TicketStoreError::kNotFound) {
    return "TicketStore: ticket not found";
  }
  return "TicketStore: unknown error";
}

namespace tv::vesting {

  TicketId TicketStore::insert(Ticket ticket, const OnInserted &on_inserted) {
    std::unique_lock lock(mutex_);
    return insertLocked(std::move(ticket), on_inserted);
  }

  std::vector<TicketId> TicketStore::insertAll(std::vector<Ticket> tickets,
                                               const OnInserted &on_inserted) {
    std::vector<TicketId> ids;
    ids.reserve(tickets.size());
    std::unique_lock lock(mutex_);
    for (auto &ticket : tickets) {
      ids.push_back(insertLocked(std::move(ticket), on_inserted));
    }
    return ids;
  }

  outcome::result<TicketSlot *> TicketStore::slot(TicketId id) const {
    std::shared_lock lock(mutex_);
    if (id >= slots_.size()) {
      return outcome::failure(TicketStoreError::kNotFound);
    }
    return slots_[id].get();
  }

  outcome::result<Ticket> TicketStore::snapshot(TicketId id) const {
    OUTCOME_TRY(found, slot(id));
    std::lock_guard lock(found->mutex);
    return found->ticket;
  }

  std::vector<TicketId> TicketStore::byGrantor(const Address &grantor) const {
    std::shared_lock lock(mutex_);
    auto it = by_grantor_.find(grantor);
    if (it == by_grantor_.end()) {
      return {};
    }
    return it->second;
  }

  std::vector<TicketId> TicketStore::byBeneficiary(
      const Address &beneficiary) const {
    std::shared_lock lock(mutex_);
    auto it = by_beneficiary_.find(beneficiary);
    if (it == by_beneficiary_.end()) {
      return {};
    }
    return it->second;
  }

  size_t TicketStore::size() const {
    std::shared_lock lock(mutex_);
    return slots_.size();
  }

  TicketId TicketStore::insertLocked(Ticket ticket,
                                     const OnInserted &on_inserted) {
    const TicketId id{slots_.size()};
    ticket.id = id;
    auto slot{std::make_unique<TicketSlot>()};
    slot->ticket = std::move(ticket);
    slots_.push_back(std::move(slot));
    const auto &inserted{slots_.back()->ticket};
    by_grantor_[inserted.grantor].push_back(id);
    by_beneficiary_[inserted.beneficiary].push_back(id);
    if (on_inserted) {
      on_inserted(inserted);
    }
    return id;
  }

}  // namespace tv::vesting
