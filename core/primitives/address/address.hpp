/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

#include <boost/variant.hpp>

namespace tv::primitives::address {

  /**
   * @brief Known Address protocols
   */
  enum Protocol : uint8_t { ID = 0x0, KEY_HASH = 0x1 };

  constexpr size_t kKeyHashSize{20};

  using KeyHash = std::array<uint8_t, kKeyHashSize>;

  using Payload = boost::variant<uint64_t, KeyHash>;

  /**
   * @brief Address identifies a party of the ledger: grantor, beneficiary,
   * caller or fungible asset. Either a numeric id assigned by the host
   * environment or a hash of the owner's public key.
   */
  struct Address {
    /**
     * @brief Returns the address protocol: ID or KEY_HASH
     */
    Protocol getProtocol() const;

    bool isId() const;

    uint64_t getId() const;

    /**
     * @brief Null identity: id 0 or hash of all zero bytes
     */
    bool isZero() const;

    static Address makeFromId(uint64_t id);

    static Address makeFromKeyHash(const KeyHash &hash);

    Payload data;
  };

  /**
   * @brief Addresses equality operator
   */
  bool operator==(const Address &lhs, const Address &rhs);

  /**
   * @brief Addresses not equality operator
   */
  bool operator!=(const Address &lhs, const Address &rhs);

  /**
   * @brief Addresses "less than" operator
   */
  bool operator<(const Address &lhs, const Address &rhs);

}  // namespace tv::primitives::address

