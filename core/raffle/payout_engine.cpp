/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/payout_engine.hpp"

#include <gsl/gsl_util>

#include "primitives/types.hpp"

namespace rf::raffle {
  using primitives::formatEther;

  TokenAmount ownerFee(const TokenAmount &total) {
    return total * kOwnerFeePercent / 100;
  }

  PayoutEngine::PayoutEngine(std::shared_ptr<ledger::Ledger> ledger,
                             PayoutPolicy policy)
      : ledger_{std::move(ledger)},
        policy_{policy},
        logger_{common::createLogger("payout")} {}

  RaffleResult<Payout> PayoutEngine::distribute(
      const Address &pool,
      const Address &owner,
      const Address &winner,
      const boost::optional<TokenAmount> &paid_owner_fee) {
    auto balance{ledger_->getBalance(pool)};
    if (!balance) {
      return fail(balance.error());
    }
    Payout payout;
    if (paid_owner_fee) {
      payout.total = balance.value() + *paid_owner_fee;
      payout.owner_fee = *paid_owner_fee;
    } else {
      payout.total = balance.value();
      payout.owner_fee = ownerFee(payout.total);
    }

    ledger_->txBegin();
    auto tx_end{gsl::finally([&] { ledger_->txEnd(); })};

    if (paid_owner_fee) {
      logger_->info("owner fee {} to {} already paid",
                    formatEther(payout.owner_fee),
                    owner.toHex());
    } else if (auto sent{ledger_->transfer(pool, owner, payout.owner_fee)};
               !sent) {
      ledger_->txRevert();
      logger_->warn("owner fee {} to {} failed: {}",
                    formatEther(payout.owner_fee),
                    owner.toHex(),
                    sent.error());
      return outcome::failure(
          RaffleFailure::transferFailed(owner, payout.owner_fee));
    }

    const bool fee_committed{policy_ == PayoutPolicy::kPartialCommit
                             || paid_owner_fee};
    if (policy_ == PayoutPolicy::kPartialCommit) {
      ledger_->txEnd();
      ledger_->txBegin();
    }

    auto remaining{ledger_->getBalance(pool)};
    if (!remaining) {
      ledger_->txRevert();
      RaffleFailure failure{remaining.error()};
      if (fee_committed) {
        failure.committed_owner_fee = payout.owner_fee;
      }
      return outcome::failure(std::move(failure));
    }
    payout.winner_amount = remaining.value();
    if (auto sent{ledger_->transfer(pool, winner, payout.winner_amount)};
        !sent) {
      ledger_->txRevert();
      logger_->warn("prize {} to {} failed: {}",
                    formatEther(payout.winner_amount),
                    winner.toHex(),
                    sent.error());
      auto failure{RaffleFailure::transferFailed(winner, payout.winner_amount)};
      if (fee_committed) {
        logger_->warn("owner fee {} to {} stays paid",
                      formatEther(payout.owner_fee),
                      owner.toHex());
        failure.committed_owner_fee = payout.owner_fee;
      }
      return outcome::failure(std::move(failure));
    }

    logger_->info("paid {} to owner {}, {} to winner {}",
                  formatEther(payout.owner_fee),
                  owner.toHex(),
                  formatEther(payout.winner_amount),
                  winner.toHex());
    return payout;
  }

  PayoutPolicy PayoutEngine::policy() const {
    return policy_;
  }
}  // namespace rf::raffle
