/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vesting/ticket_store.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using tv::vesting::Address;
using tv::vesting::Ticket;
using tv::vesting::TicketId;
using tv::vesting::TicketState;
using tv::vesting::TicketStore;
using tv::vesting::TicketStoreError;
using ::testing::ElementsAre;

class TicketStoreTest : public ::testing::Test {
 public:
  Ticket makeTicket(const Address &grantor, const Address &beneficiary) {
    Ticket ticket;
    ticket.asset = asset;
    ticket.grantor = grantor;
    ticket.beneficiary = beneficiary;
    ticket.amount = 100;
    ticket.balance = 100;
    return ticket;
  }

  Address asset = Address::makeFromId(500);
  Address grantor = Address::makeFromId(1);
  Address other_grantor = Address::makeFromId(2);
  Address beneficiary = Address::makeFromId(10);
  Address other_beneficiary = Address::makeFromId(11);

  TicketStore store;
};

/**
 * @given empty store
 * @when insert tickets
 * @then sequential ids from 0 assigned, tickets readable by id
 */
TEST_F(TicketStoreTest, InsertAssignsIds) {
  EXPECT_EQ(store.size(), 0);
  EXPECT_EQ(store.insert(makeTicket(grantor, beneficiary)), 0);
  EXPECT_EQ(store.insert(makeTicket(other_grantor, beneficiary)), 1);
  EXPECT_EQ(store.size(), 2);

  EXPECT_OUTCOME_TRUE(ticket, store.snapshot(1));
  EXPECT_EQ(ticket.id, 1);
  EXPECT_EQ(ticket.grantor, other_grantor);
  EXPECT_EQ(ticket.state(), TicketState::kActive);
}

/**
 * @given store with one ticket
 * @when read unknown id
 * @then kNotFound
 */
TEST_F(TicketStoreTest, NotFound) {
  store.insert(makeTicket(grantor, beneficiary));
  EXPECT_OUTCOME_ERROR(TicketStoreError::kNotFound, store.snapshot(1));
  EXPECT_OUTCOME_ERROR(TicketStoreError::kNotFound, store.slot(42));
}

/**
 * @given tickets of several grantors and beneficiaries
 * @when list by party
 * @then ids in creation order, unknown party has none
 */
TEST_F(TicketStoreTest, Indexes) {
  store.insert(makeTicket(grantor, beneficiary));
  store.insert(makeTicket(other_grantor, other_beneficiary));
  store.insert(makeTicket(grantor, other_beneficiary));

  EXPECT_THAT(store.byGrantor(grantor), ElementsAre(0, 2));
  EXPECT_THAT(store.byGrantor(other_grantor), ElementsAre(1));
  EXPECT_THAT(store.byBeneficiary(beneficiary), ElementsAre(0));
  EXPECT_THAT(store.byBeneficiary(other_beneficiary), ElementsAre(1, 2));
  EXPECT_TRUE(store.byGrantor(beneficiary).empty());
}

/**
 * @given batch of tickets
 * @when insert all
 * @then consecutive ids, callback sees every ticket with its id
 */
TEST_F(TicketStoreTest, InsertAll) {
  store.insert(makeTicket(grantor, beneficiary));

  std::vector<TicketId> seen;
  auto ids = store.insertAll(
      {makeTicket(grantor, beneficiary), makeTicket(grantor, other_beneficiary)},
      [&](const Ticket &ticket) { seen.push_back(ticket.id); });

  EXPECT_THAT(ids, ElementsAre(1, 2));
  EXPECT_EQ(seen, ids);
  EXPECT_EQ(store.size(), 3);
}

/**
 * @given ticket in store
 * @when mutate it through its slot
 * @then snapshot reflects the change
 */
TEST_F(TicketStoreTest, MutateThroughSlot) {
  auto id = store.insert(makeTicket(grantor, beneficiary));
  EXPECT_OUTCOME_TRUE(slot, store.slot(id));
  {
    std::lock_guard lock(slot->mutex);
    slot->ticket.balance = 0;
    slot->ticket.claimed = 100;
  }
  EXPECT_OUTCOME_TRUE(ticket, store.snapshot(id));
  EXPECT_EQ(ticket.state(), TicketState::kExhausted);
  EXPECT_EQ(ticket.claimed, 100);
}
