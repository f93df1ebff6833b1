/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(rf::common, UnhexError, e) {
  using rf::common::UnhexError;
  switch (e) {
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    case UnhexError::kIncorrectLength:
      return "Input has incorrect length, not matching the expected size";
  }
  return "Unknown unhex error";
}

namespace rf::common {
  std::string hex_lower(const uint8_t *bytes, size_t size) {
    std::string result;
    result.reserve(size * 2);
    boost::algorithm::hex_lower(bytes, bytes + size, std::back_inserter(result));
    return result;
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
      hex.remove_prefix(2);
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::kNonHexInput;
    }
    return bytes;
  }
}  // namespace rf::common
