/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vesting/impl/vesting_ledger_impl.hpp"

#include "primitives/address/address_codec.hpp"
#include "vesting/impl/vesting_ledger_error.hpp"
#include "vesting/vesting_math.hpp"

namespace tv::vesting {
  using clock::unixTimeToString;
  using config::ZeroClaimPolicy;
  using primitives::address::encodeToString;

  namespace {
    Ticket makeTicket(const Address &asset,
                      const Address &grantor,
                      const BatchEntry &entry,
                      UnixTime now) {
      Ticket ticket;
      ticket.asset = asset;
      ticket.grantor = grantor;
      ticket.beneficiary = entry.beneficiary;
      ticket.cliff_days = entry.cliff_days;
      ticket.vesting_days = entry.vesting_days;
      ticket.amount = entry.amount;
      ticket.claimed = 0;
      ticket.balance = entry.amount;
      ticket.created_at = now;
      ticket.irrevocable = entry.irrevocable;
      return ticket;
    }

    bool isParty(const Ticket &ticket, const Address &caller) {
      return caller == ticket.grantor || caller == ticket.beneficiary;
    }
  }  // namespace

  VestingLedgerImpl::VestingLedgerImpl(std::shared_ptr<AssetTransfer> assets,
                                       std::shared_ptr<events::Events> events,
                                       LedgerConfig config)
      : assets_{std::move(assets)},
        events_{std::move(events)},
        config_{config},
        logger_{common::createLogger("vesting_ledger")} {}

  outcome::result<TicketId> VestingLedgerImpl::create(
      const CreateParams &params, const Address &grantor, UnixTime now) {
    const BatchEntry entry{params.beneficiary,
                           params.cliff_days,
                           params.vesting_days,
                           params.amount,
                           params.irrevocable};
    OUTCOME_TRY(validateGrant(grantor, entry));
    OUTCOME_TRY(pullIn(params.asset, grantor, params.amount));

    const auto id = store_.insert(
        makeTicket(params.asset, grantor, entry, now),
        [this](const Ticket &ticket) { signalCreated(ticket); });
    logger_->info("ticket {} created by {} for {}: {} of {}, cliff {} days, "
                  "vesting {} days, starts {}",
                  id,
                  encodeToString(grantor),
                  encodeToString(params.beneficiary),
                  params.amount.str(),
                  encodeToString(params.asset),
                  params.cliff_days,
                  params.vesting_days,
                  unixTimeToString(now));
    return id;
  }

  outcome::result<std::vector<TicketId>> VestingLedgerImpl::createBatch(
      const Address &asset,
      const std::vector<BatchEntry> &entries,
      const Address &grantor,
      UnixTime now) {
    if (entries.empty()) {
      return outcome::failure(VestingLedgerError::kInvalidArgument);
    }
    TokenAmount total{0};
    for (const auto &entry : entries) {
      OUTCOME_TRY(validateGrant(grantor, entry));
      total += entry.amount;
    }
    OUTCOME_TRY(pullIn(asset, grantor, total));

    std::vector<Ticket> tickets;
    tickets.reserve(entries.size());
    for (const auto &entry : entries) {
      tickets.push_back(makeTicket(asset, grantor, entry, now));
    }
    auto ids = store_.insertAll(
        std::move(tickets),
        [this](const Ticket &ticket) { signalCreated(ticket); });
    logger_->info("tickets {}..{} created by {}: {} of {} in total",
                  ids.front(),
                  ids.back(),
                  encodeToString(grantor),
                  total.str(),
                  encodeToString(asset));
    return ids;
  }

  outcome::result<TokenAmount> VestingLedgerImpl::claim(TicketId id,
                                                        const Address &caller,
                                                        UnixTime now) {
    OUTCOME_TRY(slot, findSlot(id));
    std::lock_guard lock{slot->mutex};
    auto &ticket{slot->ticket};

    if (caller != ticket.beneficiary) {
      return outcome::failure(VestingLedgerError::kUnauthorized);
    }
    if (ticket.is_revoked) {
      return outcome::failure(VestingLedgerError::kAlreadyRevoked);
    }
    if (ticket.balance == 0) {
      return outcome::failure(VestingLedgerError::kNoBalance);
    }

    const auto amount{claimable(ticket, now, config_.unlock_rule)};
    if (amount == 0) {
      if (config_.zero_claim == ZeroClaimPolicy::kReject) {
        return outcome::failure(VestingLedgerError::kNothingToClaim);
      }
      logger_->debug("ticket {}: nothing to claim at {}",
                     id,
                     unixTimeToString(now));
    } else {
      OUTCOME_TRY(payOut(ticket.asset, caller, amount));
      ticket.claimed += amount;
      ticket.balance -= amount;
    }
    ticket.last_claimed_at = now;
    ++ticket.num_claims;

    logger_->info("ticket {}: claimed {}, total claimed {} of {}",
                  id,
                  amount.str(),
                  ticket.claimed.str(),
                  ticket.amount.str());
    events_->signalClaimed({ticket.id, ticket.asset, amount});
    return amount;
  }

  outcome::result<void> VestingLedgerImpl::revoke(TicketId id,
                                                  const Address &caller,
                                                  UnixTime now) {
    OUTCOME_TRY(slot, findSlot(id));
    std::lock_guard lock{slot->mutex};
    auto &ticket{slot->ticket};

    if (ticket.irrevocable) {
      return VestingLedgerError::kIrrevocable;
    }
    if (caller != ticket.grantor) {
      return VestingLedgerError::kUnauthorized;
    }
    if (ticket.is_revoked) {
      return VestingLedgerError::kAlreadyRevoked;
    }
    if (ticket.balance == 0) {
      return VestingLedgerError::kNoBalance;
    }

    const TokenAmount remaining{ticket.balance};
    OUTCOME_TRY(payOut(ticket.asset, ticket.grantor, remaining));
    ticket.is_revoked = true;
    ticket.revoked_at = now;
    ticket.balance = 0;

    logger_->info("ticket {}: revoked at {}, {} returned to {}",
                  id,
                  unixTimeToString(now),
                  remaining.str(),
                  encodeToString(ticket.grantor));
    events_->signalRevoked({ticket.id, remaining});
    return outcome::success();
  }

  outcome::result<TokenAmount> VestingLedgerImpl::available(
      TicketId id, const Address &caller, UnixTime now) const {
    OUTCOME_TRY(ticket, getTicket(id));
    if (!isParty(ticket, caller)) {
      return outcome::failure(VestingLedgerError::kUnauthorized);
    }
    if (ticket.is_revoked) {
      return outcome::failure(VestingLedgerError::kAlreadyRevoked);
    }
    if (ticket.balance == 0) {
      return outcome::failure(VestingLedgerError::kNoBalance);
    }
    return claimable(ticket, now, config_.unlock_rule);
  }

  outcome::result<bool> VestingLedgerImpl::hasCliffed(TicketId id,
                                                      const Address &caller,
                                                      UnixTime now) const {
    OUTCOME_TRY(ticket, getTicket(id));
    if (!isParty(ticket, caller)) {
      return outcome::failure(VestingLedgerError::kUnauthorized);
    }
    return vesting::hasCliffed(ticket, now);
  }

  outcome::result<Ticket> VestingLedgerImpl::getTicket(TicketId id) const {
    auto ticket{store_.snapshot(id)};
    if (!ticket) {
      return outcome::failure(VestingLedgerError::kTicketNotFound);
    }
    return std::move(ticket.value());
  }

  std::vector<TicketId> VestingLedgerImpl::listByGrantor(
      const Address &grantor) const {
    return store_.byGrantor(grantor);
  }

  std::vector<TicketId> VestingLedgerImpl::listByBeneficiary(
      const Address &beneficiary) const {
    return store_.byBeneficiary(beneficiary);
  }

  size_t VestingLedgerImpl::ticketCount() const {
    return store_.size();
  }

  outcome::result<void> VestingLedgerImpl::validateGrant(
      const Address &grantor, const BatchEntry &entry) const {
    if (grantor.isZero() || entry.beneficiary.isZero()) {
      logger_->debug("grant rejected: zero grantor or beneficiary");
      return VestingLedgerError::kInvalidArgument;
    }
    if (entry.amount <= 0) {
      logger_->debug("grant rejected: amount {} is not positive",
                     entry.amount.str());
      return VestingLedgerError::kInvalidArgument;
    }
    if (entry.vesting_days < entry.cliff_days) {
      logger_->debug("grant rejected: vesting {} days shorter than cliff {}",
                     entry.vesting_days,
                     entry.cliff_days);
      return VestingLedgerError::kInvalidArgument;
    }
    return outcome::success();
  }

  outcome::result<TicketSlot *> VestingLedgerImpl::findSlot(
      TicketId id) const {
    auto slot{store_.slot(id)};
    if (!slot) {
      return outcome::failure(VestingLedgerError::kTicketNotFound);
    }
    return slot.value();
  }

  outcome::result<void> VestingLedgerImpl::pullIn(const Address &asset,
                                                  const Address &from,
                                                  const TokenAmount &amount) {
    auto moved{assets_->transferIn(asset, from, amount)};
    if (!moved) {
      logger_->warn("transfer of {} {} from {} failed: {}",
                    amount.str(),
                    encodeToString(asset),
                    encodeToString(from),
                    moved.error().message());
      return VestingLedgerError::kTransferFailed;
    }
    if (!moved.value()) {
      logger_->warn("transfer of {} {} from {} rejected",
                    amount.str(),
                    encodeToString(asset),
                    encodeToString(from));
      return VestingLedgerError::kTransferFailed;
    }
    return outcome::success();
  }

  outcome::result<void> VestingLedgerImpl::payOut(const Address &asset,
                                                  const Address &to,
                                                  const TokenAmount &amount) {
    auto moved{assets_->transferOut(asset, to, amount)};
    if (!moved) {
      logger_->warn("transfer of {} {} to {} failed: {}",
                    amount.str(),
                    encodeToString(asset),
                    encodeToString(to),
                    moved.error().message());
      return VestingLedgerError::kTransferFailed;
    }
    if (!moved.value()) {
      logger_->warn("transfer of {} {} to {} rejected",
                    amount.str(),
                    encodeToString(asset),
                    encodeToString(to));
      return VestingLedgerError::kTransferFailed;
    }
    return outcome::success();
  }

  void VestingLedgerImpl::signalCreated(const Ticket &ticket) {
    events_->signalTicketCreated(
        {ticket.id, ticket.asset, ticket.amount, ticket.irrevocable});
  }

}  // namespace tv::vesting
