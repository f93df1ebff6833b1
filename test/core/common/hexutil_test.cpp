/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using rf::common::hex_lower;
using rf::common::unhex;
using rf::common::unhexFixed;
using rf::common::UnhexError;

/**
 * @given bytes
 * @when hex_lower is applied
 * @then lowercase hex without prefix is produced
 */
TEST(UnhexTest, HexLower) {
  const std::vector<uint8_t> bytes{0x00, 0xAB, 0x7f};
  EXPECT_EQ(hex_lower(bytes.data(), bytes.size()), "00ab7f");
}

/// Prefixed and bare hex decode to the same bytes
TEST(UnhexTest, Prefix) {
  const std::vector<uint8_t> expected{0xde, 0xad};
  EXPECT_OUTCOME_EQ(unhex("0xdead"), expected);
  EXPECT_OUTCOME_EQ(unhex("DEAD"), expected);
  EXPECT_OUTCOME_EQ(unhex("0x"), std::vector<uint8_t>{});
}

/// Malformed hex is rejected
TEST(UnhexTest, Malformed) {
  EXPECT_OUTCOME_ERROR(UnhexError::kNotEnoughInput, unhex("abc"));
  EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput, unhex("0xzz"));
}

/// Fixed size decoding requires exact length
TEST(UnhexTest, Fixed) {
  EXPECT_OUTCOME_EQ(unhexFixed<2>("0102"), (std::array<uint8_t, 2>{1, 2}));
  EXPECT_OUTCOME_ERROR(UnhexError::kIncorrectLength, unhexFixed<2>("010203"));
  EXPECT_OUTCOME_ERROR(UnhexError::kIncorrectLength, unhexFixed<2>("01"));
}
