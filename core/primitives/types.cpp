/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

OUTCOME_CPP_DEFINE_CATEGORY(rf::primitives, TokenAmountError, e) {
  using E = rf::primitives::TokenAmountError;
  switch (e) {
    case E::kInvalidFormat:
      return "Token amount must be a decimal number with optional "
             "\"wei\" or \"ether\" unit";
    case E::kNegativeAmount:
      return "Token amount cannot be negative";
    case E::kFractionalWei:
      return "Token amount is finer than 1 wei";
  }
  return "Unknown token amount error";
}

namespace rf::primitives {
  namespace {
    constexpr size_t kEtherDecimals = 18;

    std::string_view trim(std::string_view s) {
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
      }
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
      }
      return s;
    }

    bool endsWith(std::string_view s, std::string_view suffix) {
      return s.size() >= suffix.size()
             && s.substr(s.size() - suffix.size()) == suffix;
    }

    bool isDigits(std::string_view s) {
      return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      });
    }
  }  // namespace

  outcome::result<TokenAmount> parseTokenAmount(std::string_view input) {
    auto value{trim(input)};
    if (!value.empty() && value.front() == '-') {
      return outcome::failure(TokenAmountError::kNegativeAmount);
    }
    size_t decimals{0};
    if (endsWith(value, "ether")) {
      decimals = kEtherDecimals;
      value = trim(value.substr(0, value.size() - 5));
    } else if (endsWith(value, "wei")) {
      value = trim(value.substr(0, value.size() - 3));
    }

    auto integer{value};
    std::string_view fraction;
    if (const auto dot{value.find('.')}; dot != std::string_view::npos) {
      integer = value.substr(0, dot);
      fraction = value.substr(dot + 1);
    }
    if ((integer.empty() && fraction.empty()) || !isDigits(integer)
        || !isDigits(fraction)) {
      return outcome::failure(TokenAmountError::kInvalidFormat);
    }
    while (!fraction.empty() && fraction.back() == '0') {
      fraction.remove_suffix(1);
    }
    if (fraction.size() > decimals) {
      return outcome::failure(TokenAmountError::kFractionalWei);
    }

    std::string digits{integer};
    digits += fraction;
    digits.append(decimals - fraction.size(), '0');
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size()));
    if (digits.empty()) {
      return TokenAmount{0};
    }
    return TokenAmount{digits.c_str()};
  }

  std::string formatEther(const TokenAmount &amount) {
    const TokenAmount whole{amount / kEther};
    TokenAmount rest{amount % kEther};
    if (rest < 0) {
      rest = -rest;
    }
    auto result{whole.str()};
    if (amount < 0 && whole == 0) {
      result = "-" + result;
    }
    if (rest != 0) {
      auto fraction{rest.str()};
      fraction.insert(0, kEtherDecimals - fraction.size(), '0');
      fraction.erase(fraction.find_last_not_of('0') + 1);
      result += "." + fraction;
    }
    return result + " ether";
  }
}  // namespace rf::primitives
