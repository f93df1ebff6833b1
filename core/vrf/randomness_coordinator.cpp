/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vrf/randomness_coordinator.hpp"

namespace rf::vrf {
  outcome::result<void> validateRequest(const RandomWordsRequest &request) {
    if (request.request_confirmations < kMinRequestConfirmations
        || request.request_confirmations > kMaxRequestConfirmations) {
      return VrfError::kInvalidRequestConfirmations;
    }
    if (request.callback_gas_limit > kMaxCallbackGasLimit) {
      return VrfError::kGasLimitTooBig;
    }
    if (request.num_words == 0) {
      return VrfError::kNumWordsZero;
    }
    if (request.num_words > kMaxNumWords) {
      return VrfError::kNumWordsTooBig;
    }
    return outcome::success();
  }
}  // namespace rf::vrf
