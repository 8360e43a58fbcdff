/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vesting/impl/vesting_ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tv::vesting, VestingLedgerError, e) {
  using E = tv::vesting::VestingLedgerError;
  switch (e) {
    case E::kInvalidArgument:
      return "VestingLedger: invalid ticket parameters";
    case E::kUnauthorized:
      return "VestingLedger: caller is not allowed to access ticket";
    case E::kAlreadyRevoked:
      return "VestingLedger: ticket is revoked";
    case E::kIrrevocable:
      return "VestingLedger: ticket is irrevocable";
    case E::kNoBalance:
      return "VestingLedger: ticket has no balance";
    case E::kTransferFailed:
      return "VestingLedger: asset transfer failed";
    case E::kTicketNotFound:
      return "VestingLedger: ticket not found";
    case E::kNothingToClaim:
      return "VestingLedger: nothing to claim yet";
  }
  return "VestingLedger: unknown error";
}
