/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <vector>

#include <spdlog/spdlog.h>
#include <boost/optional.hpp>

#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "raffle/raffle_config.hpp"

namespace rf::sim {
  using primitives::TokenAmount;
  using primitives::address::Address;

  struct Config {
    Address owner{Address::makeFromId(1)};
    std::vector<Address> players;
    TokenAmount entrance_fee;
    /// Payments in player order, missing ones default to entrance fee
    std::vector<TokenAmount> payments;

    Address raffle_address{Address::makeFromId(1000)};
    Address coordinator_address{Address::makeFromId(1001)};
    raffle::RaffleConfig raffle;

    std::chrono::milliseconds block_time{1000};
    boost::optional<uint64_t> seed;

    spdlog::level::level_enum log_level{spdlog::level::info};

    TokenAmount payment(size_t player) const;

    /// Parses command line and optional config file, exits on --help
    static Config read(int argc, char **argv);
  };
}  // namespace rf::sim
