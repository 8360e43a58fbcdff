/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace tv::vesting {

  enum class VestingLedgerError {
    kInvalidArgument = 1,
    kUnauthorized,
    kAlreadyRevoked,
    kIrrevocable,
    kNoBalance,
    kTransferFailed,
    kTicketNotFound,
    kNothingToClaim,
  };

}  // namespace tv::vesting

OUTCOME_HPP_DECLARE_ERROR(tv::vesting, VestingLedgerError);
