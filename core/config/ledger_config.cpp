/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/ledger_config.hpp"

namespace tv::config {
  namespace {
    outcome::result<UnlockRule> unlockRuleFromString(const std::string &s) {
      if (s == "linear") {
        return UnlockRule::kLinear;
      }
      if (s == "step") {
        return UnlockRule::kStep;
      }
      return outcome::failure(ConfigError::kBadValue);
    }

    outcome::result<ZeroClaimPolicy> zeroClaimFromString(
        const std::string &s) {
      if (s == "allow") {
        return ZeroClaimPolicy::kAllow;
      }
      if (s == "reject") {
        return ZeroClaimPolicy::kReject;
      }
      return outcome::failure(ConfigError::kBadValue);
    }
  }  // namespace

  std::string toString(UnlockRule rule) {
    return rule == UnlockRule::kStep ? "step" : "linear";
  }

  std::string toString(ZeroClaimPolicy policy) {
    return policy == ZeroClaimPolicy::kReject ? "reject" : "allow";
  }

  outcome::result<LedgerConfig> ledgerConfigFromConfig(const Config &config) {
    LedgerConfig ledger_config;
    if (config.has(kUnlockRuleKey)) {
      OUTCOME_TRY(rule, config.get<std::string>(kUnlockRuleKey));
      OUTCOME_TRY(unlock_rule, unlockRuleFromString(rule));
      ledger_config.unlock_rule = unlock_rule;
    }
    if (config.has(kZeroClaimKey)) {
      OUTCOME_TRY(policy, config.get<std::string>(kZeroClaimKey));
      OUTCOME_TRY(zero_claim, zeroClaimFromString(policy));
      ledger_config.zero_claim = zero_claim;
    }
    return ledger_config;
  }

  outcome::result<LedgerConfig> ledgerConfigFromFile(
      const std::string &filename) {
    Config config;
    OUTCOME_TRY(config.load(filename));
    return ledgerConfigFromConfig(config);
  }

  outcome::result<void> ledgerConfigToConfig(const LedgerConfig &ledger_config,
                                             Config &config) {
    OUTCOME_TRY(
        config.set(kUnlockRuleKey, toString(ledger_config.unlock_rule)));
    OUTCOME_TRY(config.set(kZeroClaimKey, toString(ledger_config.zero_claim)));
    return outcome::success();
  }

}  // namespace tv::config
