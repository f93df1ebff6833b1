/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "simulation/config.hpp"

#include <gtest/gtest.h>
#include <boost/program_options/errors.hpp>
#include <fstream>

namespace rf::sim {
  using primitives::kEther;

  Config readArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "raffle_sim");
    std::vector<char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    return Config::read(static_cast<int>(argv.size()), argv.data());
  }

  /// Without options three players pay the default fee
  TEST(SimConfigTest, Defaults) {
    const auto config{readArgs({})};
    EXPECT_EQ(config.owner, Address::makeFromId(1));
    EXPECT_EQ(config.players.size(), 3);
    EXPECT_EQ(config.entrance_fee, kEther);
    EXPECT_EQ(config.payment(2), kEther);
    EXPECT_EQ(config.block_time, std::chrono::milliseconds{1000});
    EXPECT_FALSE(config.seed);
    EXPECT_EQ(config.raffle.payout_policy, raffle::PayoutPolicy::kAtomic);
  }

  /**
   * @given players with explicit payments
   * @when options are read
   * @then payments follow player order and missing ones default to fee
   */
  TEST(SimConfigTest, Options) {
    const auto config{readArgs({"--owner",
                                "0x00000000000000000000000000000000000000aa",
                                "--player",
                                "0x00000000000000000000000000000000000000b1",
                                "--player",
                                "0x00000000000000000000000000000000000000b2",
                                "--entrance-fee",
                                "0.5 ether",
                                "--payment",
                                "2 ether",
                                "--block-time-ms",
                                "5",
                                "--seed",
                                "9",
                                "--payout-policy",
                                "partial",
                                "-l",
                                "w"})};
    EXPECT_EQ(config.owner, Address::makeFromId(0xaa));
    ASSERT_EQ(config.players.size(), 2);
    EXPECT_EQ(config.players[1], Address::makeFromId(0xb2));
    EXPECT_EQ(config.entrance_fee, TokenAmount{kEther / 2});
    EXPECT_EQ(config.payment(0), TokenAmount{2 * kEther});
    EXPECT_EQ(config.payment(1), TokenAmount{kEther / 2});
    EXPECT_EQ(config.block_time, std::chrono::milliseconds{5});
    ASSERT_TRUE(config.seed);
    EXPECT_EQ(*config.seed, 9);
    EXPECT_EQ(config.raffle.payout_policy,
              raffle::PayoutPolicy::kPartialCommit);
    EXPECT_EQ(config.log_level, spdlog::level::warn);
    spdlog::set_level(spdlog::level::info);
  }

  /// Options are also read from config file
  TEST(SimConfigTest, ConfigFile) {
    const auto path{testing::TempDir() + "raffle_sim_test.cfg"};
    {
      std::ofstream file{path};
      file << "entrance-fee=3 wei\n"
           << "player=0x00000000000000000000000000000000000000c1\n"
           << "callback-gas-limit=70000\n";
    }
    const auto config{readArgs({"--config", path})};
    EXPECT_EQ(config.entrance_fee, 3);
    ASSERT_EQ(config.players.size(), 1);
    EXPECT_EQ(config.players[0], Address::makeFromId(0xc1));
    EXPECT_EQ(config.raffle.callback_gas_limit, 70000);
  }

  /// Malformed amounts and addresses are rejected
  TEST(SimConfigTest, Invalid) {
    EXPECT_THROW(readArgs({"--entrance-fee", "lots"}),
                 boost::program_options::error);
    EXPECT_THROW(readArgs({"--player", "0x01"}), boost::program_options::error);
  }
}  // namespace rf::sim
