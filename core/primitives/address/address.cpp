/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <algorithm>

namespace tv::primitives::address {

  Protocol Address::getProtocol() const {
    return isId() ? Protocol::ID : Protocol::KEY_HASH;
  }

  bool Address::isId() const {
    return boost::get<uint64_t>(&data) != nullptr;
  }

  uint64_t Address::getId() const {
    return boost::get<uint64_t>(data);
  }

  bool Address::isZero() const {
    if (const auto *id = boost::get<uint64_t>(&data)) {
      return *id == 0;
    }
    const auto &hash = boost::get<KeyHash>(data);
    return std::all_of(
        hash.begin(), hash.end(), [](uint8_t byte) { return byte == 0; });
  }

  Address Address::makeFromId(uint64_t id) {
    return {id};
  }

  Address Address::makeFromKeyHash(const KeyHash &hash) {
    return {hash};
  }

  bool operator==(const Address &lhs, const Address &rhs) {
    return lhs.data == rhs.data;
  }

  bool operator!=(const Address &lhs, const Address &rhs) {
    return !(lhs == rhs);
  }

  bool operator<(const Address &lhs, const Address &rhs) {
    return lhs.data < rhs.data;
  }

}  // namespace tv::primitives::address
