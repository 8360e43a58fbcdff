/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tv::common {
  namespace {
    std::mutex &loggersMutex() {
      static std::mutex mutex;
      return mutex;
    }

    spdlog::sink_ptr stdoutSink() {
      static auto sink{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
      return sink;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{loggersMutex()};
    if (auto logger = spdlog::get(tag)) {
      return logger;
    }
    auto logger{std::make_shared<spdlog::logger>(tag, stdoutSink())};
    logger->set_level(spdlog::default_logger()->level());
    spdlog::register_logger(logger);
    return logger;
  }
}  // namespace tv::common
