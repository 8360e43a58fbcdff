/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address_codec.hpp"

#include <boost/algorithm/hex.hpp>

namespace tv::primitives::address {
  constexpr char kPrefix{'v'};

  std::string encodeToString(const Address &address) {
    std::string res{kPrefix};
    res += static_cast<char>('0' + address.getProtocol());
    if (address.isId()) {
      res += std::to_string(address.getId());
    } else {
      const auto &hash = boost::get<KeyHash>(address.data);
      boost::algorithm::hex_lower(
          hash.begin(), hash.end(), std::back_inserter(res));
    }
    return res;
  }

}  // namespace tv::primitives::address
