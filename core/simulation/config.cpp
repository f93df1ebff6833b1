/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "simulation/config.hpp"

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

#include "cli/validate/address.hpp"
#include "common/logger.hpp"

namespace rf::sim {
  namespace po = boost::program_options;

  namespace {
    TokenAmount parseAmountOption(const std::string &value) {
      auto amount{primitives::parseTokenAmount(value)};
      if (!amount) {
        boost::throw_exception(po::invalid_option_value{value});
      }
      return amount.value();
    }
  }  // namespace

  TokenAmount Config::payment(size_t player) const {
    if (player < payments.size()) {
      return payments[player];
    }
    return entrance_fee;
  }

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      std::string entrance_fee;
      std::vector<std::string> payments;
      boost::optional<std::string> config_path;
      boost::optional<uint64_t> block_time_ms;
    } raw;

    po::options_description desc("Raffle simulation options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config", po::value(&raw.config_path), "read options from file");
    option("owner", po::value(&config.owner), "session owner address");
    option("player",
           po::value(&config.players)->composing(),
           "player address, repeatable");
    option("entrance-fee",
           po::value(&raw.entrance_fee)->default_value("1 ether"),
           "minimal payment to enter, wei or ether");
    option("payment",
           po::value(&raw.payments)->composing(),
           "payment of the next player, repeatable");
    option("block-time-ms",
           po::value(&raw.block_time_ms),
           "oracle block time in milliseconds");
    option("seed", po::value(&config.seed), "oracle word generator seed");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    desc.add(raffle::configRaffle(config.raffle));

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    if (raw.config_path) {
      std::ifstream config_file{*raw.config_path};
      if (!config_file.good()) {
        std::cerr << "Config file " << *raw.config_path << " can not be read"
                  << std::endl;
        exit(EXIT_FAILURE);
      }
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    config.log_level = common::parseLogLevel(raw.log_level);
    spdlog::set_level(config.log_level);

    config.entrance_fee = parseAmountOption(raw.entrance_fee);
    for (const auto &payment : raw.payments) {
      config.payments.push_back(parseAmountOption(payment));
    }
    if (raw.block_time_ms) {
      config.block_time = std::chrono::milliseconds{*raw.block_time_ms};
    }
    if (config.players.empty()) {
      for (uint64_t id = 101; id <= 103; ++id) {
        config.players.push_back(Address::makeFromId(id));
      }
    }
    return config;
  }
}  // namespace rf::sim
