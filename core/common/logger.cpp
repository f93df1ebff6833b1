/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rf::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %^%L%$ [%n] %v"};

    std::mutex &loggersMutex() {
      static std::mutex mutex;
      return mutex;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{loggersMutex()};
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    auto logger{spdlog::stdout_color_mt(tag)};
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::get_level());
    return logger;
  }

  spdlog::level::level_enum parseLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }
}  // namespace rf::common
