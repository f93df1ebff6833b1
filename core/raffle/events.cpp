/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/events.hpp"

#include <spdlog/fmt/fmt.h>

namespace rf::raffle::events {
  namespace {
    struct Printer : boost::static_visitor<std::string> {
      std::string operator()(const RaffleOpened &e) const {
        return fmt::format(
            "RaffleOpened({}, {})", e.owner.toHex(), primitives::formatEther(e.fee));
      }
      std::string operator()(const RaffleEntered &e) const {
        return fmt::format("RaffleEntered({})", e.player.toHex());
      }
      std::string operator()(const RaffleWinnerPicked &e) const {
        return fmt::format("RaffleWinnerPicked({})", e.winner.toHex());
      }
      std::string operator()(const RequestedRaffleWinner &e) const {
        return fmt::format("RequestedRaffleWinner({})", e.request_id);
      }
    };
  }  // namespace

  std::string toString(const RaffleEvent &event) {
    return boost::apply_visitor(Printer{}, event);
  }
}  // namespace rf::raffle::events
