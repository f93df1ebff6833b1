/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "vrf/randomness_coordinator.hpp"

namespace rf::vrf {
  class RandomnessCoordinatorMock : public RandomnessCoordinator {
   public:
    MOCK_CONST_METHOD0(address, const Address &());

    MOCK_METHOD2(requestRandomWords,
                 outcome::result<RequestId>(
                     const RandomWordsRequest &request,
                     std::weak_ptr<VrfConsumer> consumer));
  };
}  // namespace rf::vrf
