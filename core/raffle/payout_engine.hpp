/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "ledger/ledger.hpp"
#include "raffle/raffle_error.hpp"

namespace rf::raffle {
  /// Share of the final pool paid to the session owner
  constexpr unsigned kOwnerFeePercent = 10;

  /**
   * What happens to the owner fee when the winner transfer fails
   */
  enum class PayoutPolicy {
    /** Both transfers or neither */
    kAtomic,
    /** Owner fee stays paid, winner transfer is reverted */
    kPartialCommit,
  };

  struct Payout {
    TokenAmount total;
    TokenAmount owner_fee;
    TokenAmount winner_amount;
  };

  /// Owner fee for the pool, truncated to whole wei
  TokenAmount ownerFee(const TokenAmount &total);

  /**
   * Splits the raffle pool between the session owner and the winner
   */
  class PayoutEngine {
   public:
    PayoutEngine(std::shared_ptr<ledger::Ledger> ledger, PayoutPolicy policy);

    /**
     * Pays the owner fee, then the whole remaining pool balance to the
     * winner
     * @param pool - account holding entrance payments
     * @param owner - receiver of the fee
     * @param winner - receiver of the rest
     * @param paid_owner_fee - fee committed by an earlier failed attempt,
     * it is not paid again
     * @return amounts paid or kTransferFailed with recipient and amount,
     * under partial commit the failure carries the fee that stays paid
     */
    RaffleResult<Payout> distribute(
        const Address &pool,
        const Address &owner,
        const Address &winner,
        const boost::optional<TokenAmount> &paid_owner_fee = boost::none);

    PayoutPolicy policy() const;

   private:
    std::shared_ptr<ledger::Ledger> ledger_;
    PayoutPolicy policy_;
    common::Logger logger_;
  };
}  // namespace rf::raffle
