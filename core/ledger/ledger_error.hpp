/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rf::ledger {

  /**
   * @brief Type of errors returned by Ledger
   */
  enum class LedgerError {
    kInsufficientBalance = 1,
    kRecipientRejected,
    kNegativeAmount,
  };

}  // namespace rf::ledger

OUTCOME_HPP_DECLARE_ERROR(rf::ledger, LedgerError);
