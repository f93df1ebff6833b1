/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <memory>
#include <vector>

#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "vrf/vrf_error.hpp"

namespace rf::vrf {
  using primitives::RandomWord;
  using primitives::address::Address;

  /// Correlates a randomness request with its fulfillment
  using RequestId = uint64_t;

  /// Gas lane of the oracle network, bounds the price paid per request
  using KeyHash = std::array<uint8_t, 32>;

  using SubscriptionId = boost::multiprecision::uint256_t;

  constexpr uint16_t kMinRequestConfirmations = 3;
  constexpr uint16_t kMaxRequestConfirmations = 200;
  constexpr uint32_t kMaxCallbackGasLimit = 2'500'000;
  constexpr uint32_t kMaxNumWords = 500;

  struct RandomWordsRequest {
    KeyHash key_hash{};
    SubscriptionId subscription_id{0};
    uint16_t request_confirmations{kMinRequestConfirmations};
    uint32_t callback_gas_limit{0};
    uint32_t num_words{1};
    /// Pay for the request in native token instead of oracle token
    bool native_payment{false};
  };

  /**
   * Receiver of randomness, invoked by the coordinator exactly once per
   * accepted request
   */
  class VrfConsumer {
   public:
    virtual ~VrfConsumer() = default;

    /**
     * @param caller - address of the invoking coordinator
     * @param request_id - id returned by requestRandomWords
     * @param random_words - non-empty sequence of 256-bit values
     */
    virtual outcome::result<void> rawFulfillRandomWords(
        const Address &caller,
        RequestId request_id,
        const std::vector<RandomWord> &random_words) = 0;
  };

  /**
   * Randomness oracle. Requests are fire-and-forget, fulfillment arrives
   * later through VrfConsumer
   */
  class RandomnessCoordinator {
   public:
    virtual ~RandomnessCoordinator() = default;

    /// Caller address used when fulfilling requests
    virtual const Address &address() const = 0;

    /**
     * Accepts request for randomness
     * @param request - request parameters
     * @param consumer - receiver of the fulfillment
     * @return id of the accepted request
     */
    virtual outcome::result<RequestId> requestRandomWords(
        const RandomWordsRequest &request,
        std::weak_ptr<VrfConsumer> consumer) = 0;
  };

  /// Checks request against oracle network limits
  outcome::result<void> validateRequest(const RandomWordsRequest &request);
}  // namespace rf::vrf
