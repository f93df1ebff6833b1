/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/outcome.hpp"

namespace rf::common {
  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    kNotEnoughInput = 1,
    kNonHexInput,
    kIncorrectLength,
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes - input bytes
   * @return hex string without prefix
   */
  std::string hex_lower(const uint8_t *bytes, size_t size);

  /**
   * @brief Converts hex representation to bytes
   * @param hex - hex string, optionally prefixed with "0x"
   * @return bytes or UnhexError
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Converts hex representation to exactly N bytes
   */
  template <size_t N>
  outcome::result<std::array<uint8_t, N>> unhexFixed(std::string_view hex);
}  // namespace rf::common

OUTCOME_HPP_DECLARE_ERROR(rf::common, UnhexError);

namespace rf::common {
  template <size_t N>
  outcome::result<std::array<uint8_t, N>> unhexFixed(std::string_view hex) {
    OUTCOME_TRY(bytes, unhex(hex));
    if (bytes.size() != N) {
      return UnhexError::kIncorrectLength;
    }
    std::array<uint8_t, N> result{};
    std::copy(bytes.begin(), bytes.end(), result.begin());
    return result;
  }
}  // namespace rf::common
