/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace rf::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object, loggers are shared by tag
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /// Level from its first letter [e,w,i,d,t], info for anything else
  spdlog::level::level_enum parseLogLevel(char level);
}  // namespace rf::common

/**
 * Error codes in log lines:
 * logger->warn("{}", make_error_code(RaffleError::kNotOpen));
 * // "Raffle error 2: Raffle: raffle is not open"
 */
template <>
struct fmt::formatter<std::error_code> : fmt::formatter<fmt::string_view> {
  template <typename FormatContext>
  auto format(const std::error_code &e, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(),
                          "{} error {}: {}",
                          e.category().name(),
                          e.value(),
                          e.message());
  }
};
