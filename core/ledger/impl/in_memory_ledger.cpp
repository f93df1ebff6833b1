/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/impl/in_memory_ledger.hpp"

namespace rf::ledger {
  InMemoryLedger::InMemoryLedger()
      : tx_(1), logger_{common::createLogger("ledger")} {}

  outcome::result<TokenAmount> InMemoryLedger::getBalance(
      const Address &address) const {
    std::lock_guard lock{mutex_};
    return balanceOf(address);
  }

  outcome::result<void> InMemoryLedger::transfer(const Address &from,
                                                 const Address &to,
                                                 const TokenAmount &amount) {
    std::lock_guard lock{mutex_};
    if (amount < 0) {
      return LedgerError::kNegativeAmount;
    }
    if (rejecting_.count(to) != 0) {
      logger_->debug("{} rejected transfer of {} wei from {}",
                     to.toHex(),
                     amount.str(),
                     from.toHex());
      return LedgerError::kRecipientRejected;
    }
    auto from_balance{balanceOf(from)};
    if (from_balance < amount) {
      return LedgerError::kInsufficientBalance;
    }
    if (from == to) {
      return outcome::success();
    }
    auto to_balance{balanceOf(to)};
    auto &top{tx_.back()};
    top.balances[from] = from_balance - amount;
    top.balances[to] = to_balance + amount;
    logger_->debug(
        "transfer {} wei {} -> {}", amount.str(), from.toHex(), to.toHex());
    return outcome::success();
  }

  void InMemoryLedger::txBegin() {
    std::lock_guard lock{mutex_};
    tx_.emplace_back();
  }

  void InMemoryLedger::txRevert() {
    std::lock_guard lock{mutex_};
    if (tx_.size() == 1) {
      logger_->error("txRevert without matching txBegin, base layer kept");
      return;
    }
    tx_.back() = {};
  }

  void InMemoryLedger::txEnd() {
    std::lock_guard lock{mutex_};
    if (tx_.size() == 1) {
      logger_->error("txEnd without matching txBegin");
      return;
    }
    auto top{std::move(tx_.back())};
    tx_.pop_back();
    for (auto &[address, balance] : top.balances) {
      tx_.back().balances[address] = std::move(balance);
    }
  }

  outcome::result<void> InMemoryLedger::deposit(const Address &address,
                                                const TokenAmount &amount) {
    std::lock_guard lock{mutex_};
    if (amount < 0) {
      return LedgerError::kNegativeAmount;
    }
    auto balance{balanceOf(address)};
    tx_.back().balances[address] = balance + amount;
    return outcome::success();
  }

  void InMemoryLedger::rejectDeposits(const Address &address, bool reject) {
    std::lock_guard lock{mutex_};
    if (reject) {
      rejecting_.insert(address);
    } else {
      rejecting_.erase(address);
    }
  }

  size_t InMemoryLedger::depth() const {
    std::lock_guard lock{mutex_};
    return tx_.size();
  }

  TokenAmount InMemoryLedger::balanceOf(const Address &address) const {
    for (auto it{tx_.rbegin()}; it != tx_.rend(); ++it) {
      auto found{it->balances.find(address)};
      if (found != it->balances.end()) {
        return found->second;
      }
    }
    return 0;
  }
}  // namespace rf::ledger
