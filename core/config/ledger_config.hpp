/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "config/config.hpp"
#include "vesting/vesting_math.hpp"

namespace tv::config {
  using vesting::UnlockRule;

  /**
   * What claim does when nothing is claimable yet
   */
  enum class ZeroClaimPolicy {
    /** Succeed with 0, no transfer and no state change */
    kAllow,
    /** Fail with NothingToClaim */
    kReject,
  };

  const ConfigKey kUnlockRuleKey{"vesting.unlock_rule"};
  const ConfigKey kZeroClaimKey{"vesting.zero_claim"};

  struct LedgerConfig {
    UnlockRule unlock_rule{UnlockRule::kLinear};
    ZeroClaimPolicy zero_claim{ZeroClaimPolicy::kAllow};
  };

  /**
   * Reads ledger options, missing keys keep defaults
   * {"vesting": {"unlock_rule": "linear"|"step", "zero_claim": "allow"|"reject"}}
   * @return options or ConfigError::kBadValue for unknown values
   */
  outcome::result<LedgerConfig> ledgerConfigFromConfig(const Config &config);

  outcome::result<LedgerConfig> ledgerConfigFromFile(
      const std::string &filename);

  outcome::result<void> ledgerConfigToConfig(const LedgerConfig &ledger_config,
                                             Config &config);

  std::string toString(UnlockRule rule);
  std::string toString(ZeroClaimPolicy policy);

}  // namespace tv::config
