/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace tv::config {

  /**
   * @brief Config returns these types of errors
   */
  enum class ConfigError {
    kJSONParserError = 1,
    kBadPath,
    kCannotOpenFile,
    kBadValue,
  };

}  // namespace tv::config

OUTCOME_HPP_DECLARE_ERROR(tv::config, ConfigError);
