/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/types.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using rf::primitives::formatEther;
using rf::primitives::kEther;
using rf::primitives::parseTokenAmount;
using rf::primitives::TokenAmount;
using rf::primitives::TokenAmountError;

/// Plain numbers and "wei" unit are wei
TEST(TokenAmountTest, ParseWei) {
  EXPECT_OUTCOME_EQ(parseTokenAmount("1500"), TokenAmount{1500});
  EXPECT_OUTCOME_EQ(parseTokenAmount(" 1500 wei "), TokenAmount{1500});
  EXPECT_OUTCOME_EQ(parseTokenAmount("0"), TokenAmount{0});
}

/// Ether amounts are scaled by 10^18
TEST(TokenAmountTest, ParseEther) {
  EXPECT_OUTCOME_EQ(parseTokenAmount("2ether"), TokenAmount{2 * kEther});
  EXPECT_OUTCOME_EQ(parseTokenAmount("1.5 ether"),
                    TokenAmount{3 * kEther / 2});
  EXPECT_OUTCOME_EQ(parseTokenAmount("0.000000000000000001 ether"),
                    TokenAmount{1});
  EXPECT_OUTCOME_EQ(parseTokenAmount(".25 ether"), TokenAmount{kEther / 4});
}

/// Malformed, negative and sub-wei amounts are rejected
TEST(TokenAmountTest, ParseInvalid) {
  EXPECT_OUTCOME_ERROR(TokenAmountError::kInvalidFormat, parseTokenAmount(""));
  EXPECT_OUTCOME_ERROR(TokenAmountError::kInvalidFormat,
                       parseTokenAmount("ten ether"));
  EXPECT_OUTCOME_ERROR(TokenAmountError::kInvalidFormat,
                       parseTokenAmount("1.2.3"));
  EXPECT_OUTCOME_ERROR(TokenAmountError::kNegativeAmount,
                       parseTokenAmount("-1 ether"));
  EXPECT_OUTCOME_ERROR(TokenAmountError::kFractionalWei,
                       parseTokenAmount("1.5"));
  EXPECT_OUTCOME_ERROR(TokenAmountError::kFractionalWei,
                       parseTokenAmount("0.0000000000000000001 ether"));
}

/// Ether rendering drops trailing zeros of the fraction
TEST(TokenAmountTest, FormatEther) {
  EXPECT_EQ(formatEther(0), "0 ether");
  EXPECT_EQ(formatEther(6 * kEther), "6 ether");
  EXPECT_EQ(formatEther(54 * kEther / 10), "5.4 ether");
  EXPECT_EQ(formatEther(TokenAmount{1}), "0.000000000000000001 ether");
}
