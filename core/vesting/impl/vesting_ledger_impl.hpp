/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "asset/asset_transfer.hpp"
#include "common/logger.hpp"
#include "config/ledger_config.hpp"
#include "vesting/events.hpp"
#include "vesting/ticket_store.hpp"
#include "vesting/vesting_ledger.hpp"

namespace tv::vesting {
  using asset::AssetTransfer;
  using config::LedgerConfig;

  /**
   * Keeps tickets in memory, moves assets with AssetTransfer.
   * Mutations of one ticket are serialized by its slot lock which is held
   * across the transfer, ticket is changed only after transfer succeeded.
   */
  class VestingLedgerImpl : public VestingLedger {
   public:
    VestingLedgerImpl(std::shared_ptr<AssetTransfer> assets,
                      std::shared_ptr<events::Events> events,
                      LedgerConfig config);

    outcome::result<TicketId> create(const CreateParams &params,
                                     const Address &grantor,
                                     UnixTime now) override;

    outcome::result<std::vector<TicketId>> createBatch(
        const Address &asset,
        const std::vector<BatchEntry> &entries,
        const Address &grantor,
        UnixTime now) override;

    outcome::result<TokenAmount> claim(TicketId id,
                                       const Address &caller,
                                       UnixTime now) override;

    outcome::result<void> revoke(TicketId id,
                                 const Address &caller,
                                 UnixTime now) override;

    outcome::result<TokenAmount> available(TicketId id,
                                           const Address &caller,
                                           UnixTime now) const override;

    outcome::result<bool> hasCliffed(TicketId id,
                                     const Address &caller,
                                     UnixTime now) const override;

    outcome::result<Ticket> getTicket(TicketId id) const override;

    std::vector<TicketId> listByGrantor(const Address &grantor) const override;

    std::vector<TicketId> listByBeneficiary(
        const Address &beneficiary) const override;

    size_t ticketCount() const override;

   private:
    /**
     * Checks grant parameters: non-zero parties and amount, vesting period
     * not shorter than cliff
     */
    outcome::result<void> validateGrant(const Address &grantor,
                                        const BatchEntry &entry) const;

    outcome::result<TicketSlot *> findSlot(TicketId id) const;

    outcome::result<void> pullIn(const Address &asset,
                                 const Address &from,
                                 const TokenAmount &amount);

    outcome::result<void> payOut(const Address &asset,
                                 const Address &to,
                                 const TokenAmount &amount);

    void signalCreated(const Ticket &ticket);

    std::shared_ptr<AssetTransfer> assets_;
    std::shared_ptr<events::Events> events_;
    LedgerConfig config_;
    TicketStore store_;
    common::Logger logger_;
  };

}  // namespace tv::vesting
