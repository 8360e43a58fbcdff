/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

namespace tv::primitives {
  using BigInt = boost::multiprecision::cpp_int;

  /**
   * Integer division of non-negative values rounded towards zero
   */
  inline BigInt bigdiv(const BigInt &n, const BigInt &d) {
    return n / d;
  }
}  // namespace tv::primitives
