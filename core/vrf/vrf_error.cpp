/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vrf/vrf_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rf::vrf, VrfError, e) {
  using E = rf::vrf::VrfError;
  switch (e) {
    case E::kInvalidRequestConfirmations:
      return "Request confirmations must be within [3, 200]";
    case E::kGasLimitTooBig:
      return "Callback gas limit exceeds the coordinator maximum";
    case E::kNumWordsTooBig:
      return "Too many random words requested";
    case E::kNumWordsZero:
      return "At least one random word must be requested";
    case E::kInvalidRequest:
      return "No pending request with such id";
    case E::kConsumerExpired:
      return "Consumer of the request no longer exists";
  }
  return "Unknown VRF coordinator error";
}
