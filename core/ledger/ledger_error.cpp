/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rf::ledger, LedgerError, e) {
  using rf::ledger::LedgerError;
  switch (e) {
    case LedgerError::kInsufficientBalance:
      return "Ledger: sender balance is lower than transfer amount";
    case LedgerError::kRecipientRejected:
      return "Ledger: recipient rejected the transfer";
    case LedgerError::kNegativeAmount:
      return "Ledger: transfer amount cannot be negative";
  }
  return "Ledger: unknown error";
}
