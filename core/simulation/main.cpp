/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/asio/io_context.hpp>
#include <boost/program_options/errors.hpp>
#include <iostream>

#include "common/logger.hpp"
#include "ledger/impl/in_memory_ledger.hpp"
#include "raffle/raffle.hpp"
#include "simulation/config.hpp"
#include "vrf/impl/asio_coordinator.hpp"

namespace rf {
  using ledger::InMemoryLedger;
  using primitives::formatEther;
  using raffle::EventLog;
  using raffle::Raffle;
  using vrf::AsioRandomnessCoordinator;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("sim");
      return logger.get();
    }

    void printBalance(const InMemoryLedger &ledger,
                      const std::string &name,
                      const Address &address) {
      auto balance{ledger.getBalance(address)};
      if (!balance) {
        log()->error("balance of {}: {}", address.toHex(), balance.error());
        return;
      }
      std::cout << name << " " << address.toHex() << ": "
                << formatEther(balance.value()) << std::endl;
    }
  }  // namespace

  int run(const sim::Config &config) {
    auto io{std::make_shared<boost::asio::io_context>()};
    auto ledger{std::make_shared<InMemoryLedger>()};
    auto coordinator{std::make_shared<AsioRandomnessCoordinator>(
        io,
        AsioRandomnessCoordinator::Config{
            config.coordinator_address, config.block_time, config.seed})};
    auto event_log{std::make_shared<EventLog>()};
    auto connection{event_log->subscribe([](const raffle::RaffleEvent &event) {
      log()->info("event {}", raffle::events::toString(event));
    })};
    auto raffle{std::make_shared<Raffle>(
        config.raffle_address, config.raffle, ledger, coordinator, event_log)};

    for (size_t i = 0; i < config.players.size(); ++i) {
      if (auto deposited{ledger->deposit(config.players[i], config.payment(i))};
          !deposited) {
        log()->error("deposit to {}: {}",
                     config.players[i].toHex(),
                     deposited.error());
        return EXIT_FAILURE;
      }
    }

    if (auto opened{raffle->open(config.owner, config.entrance_fee)};
        !opened) {
      log()->error("open: {}", opened.error().code);
      return EXIT_FAILURE;
    }
    for (size_t i = 0; i < config.players.size(); ++i) {
      if (auto entered{raffle->enter(config.players[i], config.payment(i))};
          !entered) {
        log()->warn("{} not entered: {}",
                    config.players[i].toHex(),
                    entered.error().code);
      }
    }
    if (auto ended{raffle->end(config.owner)}; !ended) {
      log()->error("end: {}", ended.error().code);
      return EXIT_FAILURE;
    }

    // returns once the winner request is fulfilled
    io->run();

    auto winner{raffle->getRecentWinner()};
    if (!winner) {
      std::cout << "no winner" << std::endl;
    } else {
      std::cout << "winner " << winner->toHex() << " of "
                << raffle->getPreviousSessionPlayersCount() << " player(s)"
                << std::endl;
    }
    printBalance(*ledger, "owner", config.owner);
    for (const auto &player : config.players) {
      printBalance(*ledger, "player", player);
    }
    printBalance(*ledger, "raffle", config.raffle_address);
    return raffle->getPendingRequestId() ? EXIT_FAILURE : EXIT_SUCCESS;
  }
}  // namespace rf

int main(int argc, char **argv) {
  rf::sim::Config config;
  try {
    config = rf::sim::Config::read(argc, argv);
  } catch (const boost::program_options::error &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return rf::run(config);
}
