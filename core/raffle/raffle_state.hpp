/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "vrf/randomness_coordinator.hpp"

namespace rf::raffle {
  using primitives::TokenAmount;
  using primitives::address::Address;
  using vrf::RequestId;

  enum class RaffleStatus {
    kClosed,
    kOpen,
  };

  /// State of the single raffle owned by Raffle actor
  struct RaffleState {
    /** Owner of the current session, receives the fee */
    boost::optional<Address> owner;

    /** Owner of the last completed payout cycle */
    boost::optional<Address> previous_owner;

    TokenAmount entrance_fee{0};

    RaffleStatus status{RaffleStatus::kClosed};

    /** Entrants in entry order, index is used for winner selection */
    std::vector<Address> players;

    /** Players of the last session, taken at winner selection */
    std::vector<Address> previous_session_players;

    boost::optional<Address> recent_winner;

    /** Outstanding randomness request */
    boost::optional<RequestId> pending_request_id;

    /** Owner fee already paid for the pending request */
    boost::optional<TokenAmount> paid_owner_fee;

    /// Clears session fields after payout or an empty end
    void resetSession() {
      owner = boost::none;
      entrance_fee = 0;
      pending_request_id = boost::none;
      paid_owner_fee = boost::none;
    }
  };
}  // namespace rf::raffle
