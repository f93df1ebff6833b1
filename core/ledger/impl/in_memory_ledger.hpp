/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "common/logger.hpp"
#include "ledger/ledger.hpp"

namespace rf::ledger {
  /// Ledger kept in memory, used by simulations and tests
  class InMemoryLedger : public Ledger {
   public:
    /// Transaction layer stores balances changed but not merged yet.
    struct Tx {
      std::map<Address, TokenAmount> balances;
    };

    InMemoryLedger();

    outcome::result<TokenAmount> getBalance(
        const Address &address) const override;

    outcome::result<void> transfer(const Address &from,
                                   const Address &to,
                                   const TokenAmount &amount) override;

    void txBegin() override;

    void txRevert() override;

    void txEnd() override;

    /// Credits account out of thin air, writes to the current layer
    outcome::result<void> deposit(const Address &address,
                                  const TokenAmount &amount);

    /**
     * Makes account refuse incoming transfers, as a contract without
     * payable receive does
     */
    void rejectDeposits(const Address &address, bool reject = true);

    /// Number of open layers, base layer included
    size_t depth() const;

   private:
    TokenAmount balanceOf(const Address &address) const;

    mutable std::mutex mutex_;
    std::vector<Tx> tx_;
    std::set<Address> rejecting_;
    common::Logger logger_;
  };
}  // namespace rf::ledger
