/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "vrf/randomness_coordinator.hpp"

namespace rf::vrf {
  /**
   * Coordinator fulfilling requests only when the test asks to
   */
  class ManualCoordinator : public RandomnessCoordinator {
   public:
    struct Request {
      RandomWordsRequest request;
      std::weak_ptr<VrfConsumer> consumer;
    };

    explicit ManualCoordinator(Address address) : address_{address} {}

    const Address &address() const override {
      return address_;
    }

    outcome::result<RequestId> requestRandomWords(
        const RandomWordsRequest &request,
        std::weak_ptr<VrfConsumer> consumer) override {
      OUTCOME_TRY(validateRequest(request));
      const auto request_id{next_id_++};
      requests_.emplace(request_id, Request{request, std::move(consumer)});
      return request_id;
    }

    /// Delivers words for accepted request, request is consumed
    outcome::result<void> fulfill(RequestId request_id,
                                  const std::vector<RandomWord> &words) {
      auto it{requests_.find(request_id)};
      if (it == requests_.end()) {
        return VrfError::kInvalidRequest;
      }
      auto consumer{it->second.consumer.lock()};
      requests_.erase(it);
      if (!consumer) {
        return VrfError::kConsumerExpired;
      }
      return consumer->rawFulfillRandomWords(address_, request_id, words);
    }

    const std::map<RequestId, Request> &requests() const {
      return requests_;
    }

   private:
    Address address_;
    RequestId next_id_{1};
    std::map<RequestId, Request> requests_;
  };
}  // namespace rf::vrf
