/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rf::vrf {

  enum class VrfError {
    kInvalidRequestConfirmations = 1,
    kGasLimitTooBig,
    kNumWordsTooBig,
    kNumWordsZero,
    kInvalidRequest,
    kConsumerExpired,
  };

}  // namespace rf::vrf

OUTCOME_HPP_DECLARE_ERROR(rf::vrf, VrfError);
