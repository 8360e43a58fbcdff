/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/outcome.hpp"
#include "vesting/ticket.hpp"

namespace tv::vesting {

  /**
   * Create method parameters
   */
  struct CreateParams {
    Address asset;
    Address beneficiary;
    Days cliff_days{};
    Days vesting_days{};
    TokenAmount amount;
    bool irrevocable{false};
  };

  /**
   * One ticket of createBatch, asset is shared by the batch
   */
  struct BatchEntry {
    Address beneficiary;
    Days cliff_days{};
    Days vesting_days{};
    TokenAmount amount;
    bool irrevocable{false};
  };

  /**
   * VestingLedger keeps vesting tickets and the escrowed assets backing them.
   * Grantor deposits amount for beneficiary, beneficiary claims what has
   * unlocked, grantor may revoke the rest unless ticket is irrevocable.
   * Caller identity and current time are supplied by the host with every call.
   */
  class VestingLedger {
   public:
    virtual ~VestingLedger() = default;

    /**
     * Pulls amount from grantor into custody and records new ticket
     * @param params - asset, beneficiary and schedule
     * @param grantor - caller funding the ticket
     * @param now - grant start
     * @return id of created ticket
     */
    virtual outcome::result<TicketId> create(const CreateParams &params,
                                             const Address &grantor,
                                             UnixTime now) = 0;

    /**
     * Creates tickets of one asset funded by single transfer of their sum.
     * Either all tickets are created or none.
     * @return consecutive ids in order of entries
     */
    virtual outcome::result<std::vector<TicketId>> createBatch(
        const Address &asset,
        const std::vector<BatchEntry> &entries,
        const Address &grantor,
        UnixTime now) = 0;

    /**
     * Pays everything claimable now to beneficiary
     * @param caller - must be beneficiary
     * @return amount paid, zero claim is still recorded when allowed
     */
    virtual outcome::result<TokenAmount> claim(TicketId id,
                                               const Address &caller,
                                               UnixTime now) = 0;

    /**
     * Returns remaining balance to grantor and closes ticket
     * @param caller - must be grantor, irrevocable ticket refuses anyone
     */
    virtual outcome::result<void> revoke(TicketId id,
                                         const Address &caller,
                                         UnixTime now) = 0;

    /**
     * Amount claimable now, ticket is not changed
     * @param caller - grantor or beneficiary
     */
    virtual outcome::result<TokenAmount> available(TicketId id,
                                                   const Address &caller,
                                                   UnixTime now) const = 0;

    /**
     * @param caller - grantor or beneficiary
     * @return true if cliff of ticket is passed
     */
    virtual outcome::result<bool> hasCliffed(TicketId id,
                                             const Address &caller,
                                             UnixTime now) const = 0;

    virtual outcome::result<Ticket> getTicket(TicketId id) const = 0;

    /**
     * Tickets funded by grantor in order of creation
     */
    virtual std::vector<TicketId> listByGrantor(
        const Address &grantor) const = 0;

    /**
     * Tickets granted to beneficiary in order of creation
     */
    virtual std::vector<TicketId> listByBeneficiary(
        const Address &beneficiary) const = 0;

    virtual size_t ticketCount() const = 0;
  };

}  // namespace tv::vesting
