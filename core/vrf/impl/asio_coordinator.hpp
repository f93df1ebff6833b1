/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <map>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/optional.hpp>
#include <boost/random/independent_bits.hpp>
#include <boost/random/mersenne_twister.hpp>

#include "common/logger.hpp"
#include "vrf/randomness_coordinator.hpp"

namespace rf::vrf {
  using boost::asio::io_context;

  /**
   * Coordinator delivering fulfillment asynchronously on io_context after
   * the requested number of block confirmations
   */
  class AsioRandomnessCoordinator
      : public RandomnessCoordinator,
        public std::enable_shared_from_this<AsioRandomnessCoordinator> {
   public:
    struct Config {
      /** Address the coordinator fulfills from */
      Address address;

      /** Time between two blocks */
      std::chrono::milliseconds block_time{std::chrono::seconds{12}};

      /** Seed of the word generator, random_device is used when none */
      boost::optional<uint64_t> seed;
    };

    AsioRandomnessCoordinator(std::shared_ptr<io_context> io, Config config);

    const Address &address() const override;

    outcome::result<RequestId> requestRandomWords(
        const RandomWordsRequest &request,
        std::weak_ptr<VrfConsumer> consumer) override;

    /// Number of requests accepted but not fulfilled yet
    size_t pendingRequests() const;

   private:
    struct Pending {
      RandomWordsRequest request;
      std::weak_ptr<VrfConsumer> consumer;
      std::shared_ptr<boost::asio::steady_timer> timer;
    };

    using WordEngine = boost::random::
        independent_bits_engine<boost::random::mt19937_64, 256, RandomWord>;

    void fulfill(RequestId request_id);

    std::vector<RandomWord> generateWords(uint32_t num_words);

    std::shared_ptr<io_context> io_;
    Config config_;

    mutable std::mutex mutex_;
    RequestId next_id_{1};
    std::map<RequestId, Pending> pending_;
    WordEngine engine_;

    common::Logger logger_;
  };
}  // namespace rf::vrf
