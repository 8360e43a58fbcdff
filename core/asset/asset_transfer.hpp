/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace tv::asset {
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * Moves fungible assets between holders and the custody account of the
   * vesting ledger. Result `false` or error means that nothing was moved.
   */
  class AssetTransfer {
   public:
    virtual ~AssetTransfer() = default;

    /**
     * Pulls amount of asset from holder into custody
     * @param asset - fungible asset identifier
     * @param from - holder who pays
     * @param amount - quantity to move
     * @return true if moved
     */
    virtual outcome::result<bool> transferIn(const Address &asset,
                                             const Address &from,
                                             const TokenAmount &amount) = 0;

    /**
     * Pays amount of asset out of custody
     * @param asset - fungible asset identifier
     * @param to - receiver
     * @param amount - quantity to move
     * @return true if moved
     */
    virtual outcome::result<bool> transferOut(const Address &asset,
                                              const Address &to,
                                              const TokenAmount &amount) = 0;
  };
}  // namespace tv::asset
