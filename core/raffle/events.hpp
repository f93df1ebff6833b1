/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/variant.hpp>

#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "vrf/randomness_coordinator.hpp"

namespace rf::raffle::events {
  using primitives::TokenAmount;
  using primitives::address::Address;
  using vrf::RequestId;

  struct RaffleOpened {
    Address owner;
    TokenAmount fee;
  };

  struct RaffleEntered {
    Address player;
  };

  struct RaffleWinnerPicked {
    Address winner;
  };

  struct RequestedRaffleWinner {
    RequestId request_id;
  };

  using RaffleEvent = boost::variant<RaffleOpened,
                                     RaffleEntered,
                                     RaffleWinnerPicked,
                                     RequestedRaffleWinner>;

  /// Event name and fields in one line, e.g. "RaffleEntered(0x..)"
  std::string toString(const RaffleEvent &event);
}  // namespace rf::raffle::events
