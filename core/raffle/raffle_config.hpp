/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/program_options/options_description.hpp>

#include "raffle/payout_engine.hpp"
#include "vrf/randomness_coordinator.hpp"

namespace rf::raffle {
  using boost::program_options::options_description;

  constexpr uint16_t kRequestConfirmations = 3;
  constexpr uint32_t kNumWords = 1;
  constexpr uint32_t kDefaultCallbackGasLimit = 500'000;

  /// Gas lane of the public test network oracle
  constexpr auto kDefaultKeyHash{
      "0x787d74caea10b2b357790d5b5247c2f63d1d91572a9846f780606e4d953677ae"};

  struct RaffleConfig {
    RaffleConfig();

    vrf::KeyHash key_hash{};
    vrf::SubscriptionId subscription_id{0};
    uint32_t callback_gas_limit{kDefaultCallbackGasLimit};
    bool native_payment{false};
    PayoutPolicy payout_policy{PayoutPolicy::kAtomic};

    /// Winner randomness request: 3 confirmations, 1 word
    vrf::RandomWordsRequest winnerRequest() const;
  };

  /// "atomic" or "partial"
  boost::optional<PayoutPolicy> parsePayoutPolicy(const std::string &name);

  /// Parses 32-byte hex key hash
  outcome::result<vrf::KeyHash> parseKeyHash(const std::string &hex);

  /**
   * Creates program option description for raffle parameters, values are
   * stored into config on notify
   */
  options_description configRaffle(RaffleConfig &config);
}  // namespace rf::raffle
