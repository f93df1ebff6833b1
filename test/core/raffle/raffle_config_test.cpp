/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/raffle_config.hpp"

#include <gtest/gtest.h>
#include <boost/program_options.hpp>
#include <limits>

#include "common/hexutil.hpp"
#include "testutil/outcome.hpp"

namespace rf::raffle {
  namespace po = boost::program_options;

  struct RaffleConfigTest : testing::Test {
    void parse(std::vector<std::string> args) {
      auto desc{configRaffle(config)};
      po::variables_map vm;
      po::store(po::command_line_parser(args).options(desc).run(), vm);
      po::notify(vm);
    }

    RaffleConfig config;
  };

  /// Winner request uses 3 confirmations and 1 word
  TEST_F(RaffleConfigTest, Defaults) {
    parse({});
    EXPECT_OUTCOME_EQ(parseKeyHash(kDefaultKeyHash), config.key_hash);
    EXPECT_EQ(config.payout_policy, PayoutPolicy::kAtomic);

    const auto request{config.winnerRequest()};
    EXPECT_EQ(request.request_confirmations, 3);
    EXPECT_EQ(request.num_words, 1);
    EXPECT_EQ(request.callback_gas_limit, kDefaultCallbackGasLimit);
    EXPECT_EQ(request.subscription_id, 0);
    EXPECT_FALSE(request.native_payment);
    EXPECT_EQ(request.key_hash, config.key_hash);
    EXPECT_OUTCOME_TRUE_1(vrf::validateRequest(request));
  }

  /// Options override defaults
  TEST_F(RaffleConfigTest, Options) {
    const std::string key_hash{
        "0x0101010101010101010101010101010101010101010101010101010101010101"};
    parse({"--key-hash",
           key_hash,
           "--subscription-id",
           "115792089237316195423570985008687907853269984665640564039457584007913129639935",
           "--callback-gas-limit",
           "40000",
           "--native-payment",
           "--payout-policy",
           "partial"});
    vrf::KeyHash expected;
    expected.fill(1);
    EXPECT_EQ(config.key_hash, expected);
    EXPECT_EQ(config.subscription_id,
              std::numeric_limits<vrf::SubscriptionId>::max());
    EXPECT_EQ(config.callback_gas_limit, 40000);
    EXPECT_TRUE(config.native_payment);
    EXPECT_EQ(config.payout_policy, PayoutPolicy::kPartialCommit);
  }

  /// Malformed values are rejected
  TEST_F(RaffleConfigTest, InvalidOptions) {
    EXPECT_THROW(parse({"--payout-policy", "eventual"}), po::error);
    EXPECT_THROW(parse({"--key-hash", "0x0102"}), po::error);
    EXPECT_THROW(parse({"--callback-gas-limit", "many"}), po::error);
  }

  /// Policy names map to payout policies
  TEST(ParsePayoutPolicyTest, Names) {
    EXPECT_EQ(parsePayoutPolicy("atomic").value(), PayoutPolicy::kAtomic);
    EXPECT_EQ(parsePayoutPolicy("partial").value(),
              PayoutPolicy::kPartialCommit);
    EXPECT_FALSE(parsePayoutPolicy("Atomic"));
    EXPECT_FALSE(parsePayoutPolicy(""));
  }

  /// Key hash must be 32 bytes
  TEST(ParseKeyHashTest, Length) {
    EXPECT_OUTCOME_ERROR(common::UnhexError::kIncorrectLength,
                         parseKeyHash("0x0102"));
    EXPECT_OUTCOME_ERROR(common::UnhexError::kNonHexInput,
                         parseKeyHash(std::string(64, 'g')));
  }
}  // namespace rf::raffle
