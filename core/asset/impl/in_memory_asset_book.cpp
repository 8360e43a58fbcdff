/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "asset/impl/in_memory_asset_book.hpp"

namespace tv::asset {

  InMemoryAssetBook::InMemoryAssetBook(Address custody)
      : custody_{std::move(custody)} {}

  outcome::result<bool> InMemoryAssetBook::transferIn(
      const Address &asset, const Address &from, const TokenAmount &amount) {
    std::lock_guard lock{mutex_};
    return move(asset, from, custody_, amount);
  }

  outcome::result<bool> InMemoryAssetBook::transferOut(
      const Address &asset, const Address &to, const TokenAmount &amount) {
    std::lock_guard lock{mutex_};
    return move(asset, custody_, to, amount);
  }

  void InMemoryAssetBook::mint(const Address &asset,
                               const Address &holder,
                               const TokenAmount &amount) {
    std::lock_guard lock{mutex_};
    balances_[{asset, holder}] += amount;
  }

  TokenAmount InMemoryAssetBook::balanceOf(const Address &asset,
                                           const Address &holder) const {
    std::lock_guard lock{mutex_};
    auto it = balances_.find({asset, holder});
    if (it == balances_.end()) {
      return 0;
    }
    return it->second;
  }

  const Address &InMemoryAssetBook::custody() const {
    return custody_;
  }

  bool InMemoryAssetBook::move(const Address &asset,
                               const Address &from,
                               const Address &to,
                               const TokenAmount &amount) {
    if (amount < 0) {
      return false;
    }
    auto &from_balance = balances_[{asset, from}];
    if (from_balance < amount) {
      return false;
    }
    from_balance -= amount;
    balances_[{asset, to}] += amount;
    return true;
  }

}  // namespace tv::asset
