/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "asset/impl/in_memory_asset_book.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using tv::asset::InMemoryAssetBook;
using tv::primitives::TokenAmount;
using tv::primitives::address::Address;

class InMemoryAssetBookTest : public ::testing::Test {
 public:
  Address custody = Address::makeFromId(100);
  Address token = Address::makeFromId(200);
  Address other_token = Address::makeFromId(201);
  Address alice = Address::makeFromId(1);
  Address bob = Address::makeFromId(2);

  InMemoryAssetBook book{custody};
};

/**
 * @given alice holding 100 tokens
 * @when pull 60 into custody and pay 25 out to bob
 * @then balances moved accordingly, other asset untouched
 */
TEST_F(InMemoryAssetBookTest, MoveThroughCustody) {
  book.mint(token, alice, 100);
  book.mint(other_token, alice, 7);

  EXPECT_OUTCOME_EQ(book.transferIn(token, alice, 60), true);
  EXPECT_OUTCOME_EQ(book.transferOut(token, bob, 25), true);

  EXPECT_EQ(book.balanceOf(token, alice), 40);
  EXPECT_EQ(book.balanceOf(token, custody), 35);
  EXPECT_EQ(book.balanceOf(token, bob), 25);
  EXPECT_EQ(book.balanceOf(other_token, alice), 7);
  EXPECT_EQ(book.custody(), custody);
}

/**
 * @given alice holding 10 tokens and empty custody
 * @when pull 11 or pay anything out
 * @then transfers rejected, balances unchanged
 */
TEST_F(InMemoryAssetBookTest, InsufficientFunds) {
  book.mint(token, alice, 10);

  EXPECT_OUTCOME_EQ(book.transferIn(token, alice, 11), false);
  EXPECT_OUTCOME_EQ(book.transferOut(token, bob, 1), false);
  EXPECT_OUTCOME_EQ(book.transferIn(token, alice, TokenAmount{-1}), false);

  EXPECT_EQ(book.balanceOf(token, alice), 10);
  EXPECT_EQ(book.balanceOf(token, custody), 0);
  EXPECT_EQ(book.balanceOf(token, bob), 0);
}
