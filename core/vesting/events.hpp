/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/signals2.hpp>

#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace tv::vesting::events {
  using primitives::TicketId;
  using primitives::TokenAmount;
  using primitives::address::Address;

  using Connection = boost::signals2::scoped_connection;

  struct TicketCreated {
    TicketId id{};
    Address asset;
    TokenAmount amount;
    bool irrevocable{};
  };

  struct Claimed {
    TicketId id{};
    Address asset;
    TokenAmount amount;
  };

  struct Revoked {
    TicketId id{};
    /** Balance returned to grantor */
    TokenAmount remaining_balance;
  };

  /**
   * Ledger notifications. Delivered on io_context in the order they were
   * signalled, signalling never blocks on subscribers.
   * Must be owned by shared_ptr, events signalled otherwise are dropped.
   */
  struct Events : std::enable_shared_from_this<Events> {
    explicit Events(std::shared_ptr<boost::asio::io_context> io_context)
        : io_context_(std::move(io_context)) {}

    /**
     * Drops notifications which were not delivered yet
     */
    void stop() {
      stopped_ = true;
    }

#define DEFINE_EVENT(STRUCT)                                             \
  using STRUCT##Callback = void(const STRUCT &);                         \
  Connection subscribe##STRUCT(std::function<STRUCT##Callback> cb) {     \
    return STRUCT##_signal_.connect(cb);                                 \
  }                                                                      \
  void signal##STRUCT(STRUCT event) {                                    \
    boost::asio::post(                                                   \
        *io_context_, [wptr = weak_from_this(), event = std::move(event)] { \
          auto self = wptr.lock();                                       \
          if (self && !self->stopped_) {                                 \
            self->STRUCT##_signal_(event);                               \
          }                                                              \
        });                                                              \
  }                                                                      \
  boost::signals2::signal<STRUCT##Callback> STRUCT##_signal_

    DEFINE_EVENT(TicketCreated);
    DEFINE_EVENT(Claimed);
    DEFINE_EVENT(Revoked);

#undef DEFINE_EVENT

   private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::atomic_bool stopped_{false};
  };

}  // namespace tv::vesting::events
