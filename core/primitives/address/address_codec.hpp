/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "primitives/address/address.hpp"

namespace tv::primitives::address {

  /**
   * @brief Encodes an Address to a string, "v0<id>" or "v1<hex key hash>"
   */
  std::string encodeToString(const Address &address);

}  // namespace tv::primitives::address
