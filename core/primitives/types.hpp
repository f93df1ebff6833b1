/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "common/outcome.hpp"

namespace rf::primitives {
  using BigInt = boost::multiprecision::cpp_int;

  using TokenAmount = BigInt;

  /// Value delivered by the randomness oracle
  using RandomWord = boost::multiprecision::uint256_t;

  /// 10^18 wei
  inline const TokenAmount kEther{"1000000000000000000"};

  enum class TokenAmountError {
    kInvalidFormat = 1,
    kNegativeAmount,
    kFractionalWei,
  };

  /**
   * Parses token amount. Accepts plain wei ("1500"), wei with unit
   * ("1500 wei") and ether with optional fraction ("1.5 ether", "2ether").
   */
  outcome::result<TokenAmount> parseTokenAmount(std::string_view input);

  /// Renders amount as ether with up to 18 fractional digits, e.g. "1.5 ether"
  std::string formatEther(const TokenAmount &amount);
}  // namespace rf::primitives

OUTCOME_HPP_DECLARE_ERROR(rf::primitives, TokenAmountError);
