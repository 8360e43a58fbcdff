/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/big_int.hpp"

namespace tv::primitives {
  using TokenAmount = BigInt;

  /** Sequential vesting ticket id, starts from 0 */
  using TicketId = uint64_t;

  /** Whole days of a vesting schedule */
  using Days = uint64_t;
}  // namespace tv::primitives
