/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ledger/ledger_error.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace rf::ledger {
  using primitives::TokenAmount;
  using primitives::address::Address;

  /// Account balances with nested transaction layers
  class Ledger {
   public:
    virtual ~Ledger() = default;

    /// Get account balance, unknown accounts hold zero
    virtual outcome::result<TokenAmount> getBalance(
        const Address &address) const = 0;

    /**
     * Moves funds between accounts in the current transaction layer
     * @param from - account to debit
     * @param to - account to credit
     * @param amount - non-negative amount
     */
    virtual outcome::result<void> transfer(const Address &from,
                                           const Address &to,
                                           const TokenAmount &amount) = 0;

    /// Creates new transaction layer.
    virtual void txBegin() = 0;

    /// Discards changes of the current transaction layer.
    virtual void txRevert() = 0;

    /// Removes transaction layer and merges changes to the previous layer.
    virtual void txEnd() = 0;
  };
}  // namespace rf::ledger
