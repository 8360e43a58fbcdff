/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tv::clock {
  /// Seconds since unix epoch, supplied by host with every ledger call
  using UnixTime = std::chrono::seconds;

  /// Length of one vesting day
  using Day = std::chrono::duration<int64_t, std::ratio<86400>>;

  /// "2020-08-24T10:00:00Z", used in ledger logs
  std::string unixTimeToString(UnixTime time);
}  // namespace tv::clock
