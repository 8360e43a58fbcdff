/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vesting/vesting_math.hpp"

#include <limits>

#include <gtest/gtest.h>

using tv::clock::Day;
using tv::clock::UnixTime;
using tv::vesting::claimable;
using tv::vesting::daysLapsed;
using tv::vesting::hasCliffed;
using tv::vesting::Ticket;
using tv::vesting::TokenAmount;
using tv::vesting::UnlockRule;
using tv::vesting::unlockedTotal;

class VestingMathTest : public ::testing::Test {
 public:
  void SetUp() override {
    ticket.cliff_days = 30;
    ticket.vesting_days = 90;
    ticket.amount = 900;
    ticket.balance = 900;
    ticket.created_at = t0;
  }

  UnixTime at(int64_t days) const {
    return t0 + UnixTime{Day{days}};
  }

  UnixTime t0{1600000000};
  Ticket ticket;
};

/**
 * @given ticket created at t0
 * @when count days at and around t0
 * @then whole days counted, 0 before creation
 */
TEST_F(VestingMathTest, DaysLapsed) {
  EXPECT_EQ(daysLapsed(ticket, t0 - UnixTime{1}), 0);
  EXPECT_EQ(daysLapsed(ticket, t0), 0);
  EXPECT_EQ(daysLapsed(ticket, at(1) - UnixTime{1}), 0);
  EXPECT_EQ(daysLapsed(ticket, at(1)), 1);
  EXPECT_EQ(daysLapsed(ticket, at(45) + UnixTime{3600}), 45);
}

/**
 * @given ticket with 30 days cliff
 * @when check cliff around 30 days
 * @then cliff passed strictly after 30 days
 */
TEST_F(VestingMathTest, CliffBoundary) {
  EXPECT_FALSE(hasCliffed(ticket, t0));
  EXPECT_FALSE(hasCliffed(ticket, at(29)));
  EXPECT_FALSE(hasCliffed(ticket, at(30)));
  EXPECT_TRUE(hasCliffed(ticket, at(30) + UnixTime{1}));
  EXPECT_TRUE(hasCliffed(ticket, at(31)));
}

/**
 * @given ticket without cliff
 * @when check cliff at creation and one second later
 * @then cliff passed after creation only
 */
TEST_F(VestingMathTest, ZeroCliff) {
  ticket.cliff_days = 0;
  EXPECT_FALSE(hasCliffed(ticket, t0));
  EXPECT_TRUE(hasCliffed(ticket, t0 + UnixTime{1}));
}

/**
 * @given ticket with huge cliff
 * @when check cliff far in the future
 * @then not cliffed
 */
TEST_F(VestingMathTest, HugeCliff) {
  ticket.cliff_days = std::numeric_limits<uint64_t>::max();
  EXPECT_FALSE(hasCliffed(ticket, at(1000000)));
}

/**
 * @given 900 granted over 90 days with 30 days cliff
 * @when compute unlocked amount with linear rule
 * @then nothing before cliff, proportional after, everything at the end
 */
TEST_F(VestingMathTest, Linear) {
  EXPECT_EQ(unlockedTotal(ticket, at(29), UnlockRule::kLinear), 0);
  EXPECT_EQ(unlockedTotal(ticket, at(31), UnlockRule::kLinear), 310);
  EXPECT_EQ(unlockedTotal(ticket, at(45), UnlockRule::kLinear), 450);
  EXPECT_EQ(unlockedTotal(ticket, at(90), UnlockRule::kLinear), 900);
  EXPECT_EQ(unlockedTotal(ticket, at(365), UnlockRule::kLinear), 900);
}

/**
 * @given amount not divisible by vesting days
 * @when compute unlocked amount with linear rule
 * @then rounded down
 */
TEST_F(VestingMathTest, LinearRoundsDown) {
  ticket.amount = 100;
  ticket.balance = 100;
  ticket.cliff_days = 0;
  ticket.vesting_days = 3;
  EXPECT_EQ(unlockedTotal(ticket, at(1), UnlockRule::kLinear), 33);
  EXPECT_EQ(unlockedTotal(ticket, at(2), UnlockRule::kLinear), 66);
  EXPECT_EQ(unlockedTotal(ticket, at(3), UnlockRule::kLinear), 100);
}

/**
 * @given 900 granted over 90 days with 30 days cliff
 * @when compute unlocked amount with step rule
 * @then nothing until 90 days lapsed, then everything
 */
TEST_F(VestingMathTest, Step) {
  EXPECT_EQ(unlockedTotal(ticket, at(29), UnlockRule::kStep), 0);
  EXPECT_EQ(unlockedTotal(ticket, at(45), UnlockRule::kStep), 0);
  EXPECT_EQ(unlockedTotal(ticket, at(89), UnlockRule::kStep), 0);
  EXPECT_EQ(unlockedTotal(ticket, at(90), UnlockRule::kStep), 900);
  EXPECT_EQ(unlockedTotal(ticket, at(200), UnlockRule::kStep), 900);
}

/**
 * @given ticket without vesting period
 * @when compute unlocked amount after cliff
 * @then everything unlocked by both rules
 */
TEST_F(VestingMathTest, NoVestingPeriod) {
  ticket.cliff_days = 0;
  ticket.vesting_days = 0;
  EXPECT_EQ(unlockedTotal(ticket, t0, UnlockRule::kLinear), 0);
  EXPECT_EQ(unlockedTotal(ticket, t0 + UnixTime{1}, UnlockRule::kLinear), 900);
  EXPECT_EQ(unlockedTotal(ticket, t0 + UnixTime{1}, UnlockRule::kStep), 900);
}

/**
 * @given ticket with 450 already claimed
 * @when compute claimable amount
 * @then unlocked minus claimed, bounded by balance
 */
TEST_F(VestingMathTest, Claimable) {
  ticket.claimed = 450;
  ticket.balance = 450;
  EXPECT_EQ(claimable(ticket, at(45), UnlockRule::kLinear), 0);
  EXPECT_EQ(claimable(ticket, at(60), UnlockRule::kLinear), 150);
  EXPECT_EQ(claimable(ticket, at(90), UnlockRule::kLinear), 450);

  ticket.balance = 100;
  EXPECT_EQ(claimable(ticket, at(90), UnlockRule::kLinear), 100);

  ticket.balance = 0;
  EXPECT_EQ(claimable(ticket, at(90), UnlockRule::kLinear), 0);
}
