/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "asset/asset_transfer.hpp"

namespace tv::asset {

  /**
   * Simple asset book that conforms AssetTransfer interface.
   * Keeps balances of every (asset, holder) pair and a custody account in
   * memory. Mostly needed in tests and when ledger is embedded without an
   * external token system.
   */
  class InMemoryAssetBook : public AssetTransfer {
   public:
    /**
     * @param custody - holder of escrowed assets
     */
    explicit InMemoryAssetBook(Address custody);

    ~InMemoryAssetBook() override = default;

    outcome::result<bool> transferIn(const Address &asset,
                                     const Address &from,
                                     const TokenAmount &amount) override;

    outcome::result<bool> transferOut(const Address &asset,
                                      const Address &to,
                                      const TokenAmount &amount) override;

    /**
     * Credits holder with newly issued amount of asset
     */
    void mint(const Address &asset,
              const Address &holder,
              const TokenAmount &amount);

    TokenAmount balanceOf(const Address &asset, const Address &holder) const;

    const Address &custody() const;

   private:
    using Key = std::pair<Address, Address>;

    bool move(const Address &asset,
              const Address &from,
              const Address &to,
              const TokenAmount &amount);

    Address custody_;
    std::map<Key, TokenAmount> balances_;
    mutable std::mutex mutex_;
  };

}  // namespace tv::asset
