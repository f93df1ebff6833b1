/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vrf/impl/asio_coordinator.hpp"

#include <boost/random/random_device.hpp>

namespace rf::vrf {
  AsioRandomnessCoordinator::AsioRandomnessCoordinator(
      std::shared_ptr<io_context> io, Config config)
      : io_{std::move(io)},
        config_{std::move(config)},
        logger_{common::createLogger("vrf")} {
    if (config_.seed) {
      engine_.seed(*config_.seed);
    } else {
      boost::random::random_device device;
      engine_.seed(
          (static_cast<uint64_t>(device()) << 32) | static_cast<uint64_t>(device()));
    }
  }

  const Address &AsioRandomnessCoordinator::address() const {
    return config_.address;
  }

  outcome::result<RequestId> AsioRandomnessCoordinator::requestRandomWords(
      const RandomWordsRequest &request, std::weak_ptr<VrfConsumer> consumer) {
    OUTCOME_TRY(validateRequest(request));

    std::lock_guard lock{mutex_};
    const auto request_id{next_id_++};
    auto timer{std::make_shared<boost::asio::steady_timer>(
        *io_, config_.block_time * request.request_confirmations)};
    pending_.emplace(request_id, Pending{request, std::move(consumer), timer});
    timer->async_wait([weak{weak_from_this()},
                       request_id](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      if (auto self{weak.lock()}) {
        self->fulfill(request_id);
      }
    });
    logger_->info("accepted request {} for {} word(s), {} confirmation(s)",
                  request_id,
                  request.num_words,
                  request.request_confirmations);
    return request_id;
  }

  size_t AsioRandomnessCoordinator::pendingRequests() const {
    std::lock_guard lock{mutex_};
    return pending_.size();
  }

  void AsioRandomnessCoordinator::fulfill(RequestId request_id) {
    std::weak_ptr<VrfConsumer> weak_consumer;
    std::vector<RandomWord> words;
    {
      std::lock_guard lock{mutex_};
      auto it{pending_.find(request_id)};
      if (it == pending_.end()) {
        logger_->warn("request {}: {}",
                      request_id,
                      make_error_code(VrfError::kInvalidRequest));
        return;
      }
      weak_consumer = std::move(it->second.consumer);
      words = generateWords(it->second.request.num_words);
      pending_.erase(it);
    }

    auto consumer{weak_consumer.lock()};
    if (!consumer) {
      logger_->warn("request {}: {}",
                    request_id,
                    make_error_code(VrfError::kConsumerExpired));
      return;
    }
    // request is consumed even if callback fails
    auto result{
        consumer->rawFulfillRandomWords(config_.address, request_id, words)};
    if (!result) {
      logger_->warn(
          "request {}: consumer callback failed: {}", request_id, result.error());
      return;
    }
    logger_->info("fulfilled request {}", request_id);
  }

  std::vector<RandomWord> AsioRandomnessCoordinator::generateWords(
      uint32_t num_words) {
    std::vector<RandomWord> words;
    words.reserve(num_words);
    for (uint32_t i = 0; i < num_words; ++i) {
      words.push_back(engine_());
    }
    return words;
  }
}  // namespace rf::vrf
