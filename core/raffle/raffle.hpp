/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>

#include "common/logger.hpp"
#include "ledger/ledger.hpp"
#include "raffle/event_log.hpp"
#include "raffle/payout_engine.hpp"
#include "raffle/raffle_config.hpp"
#include "raffle/raffle_error.hpp"
#include "raffle/raffle_state.hpp"
#include "vrf/randomness_coordinator.hpp"

namespace rf::raffle {
  using primitives::RandomWord;

  /**
   * Single raffle actor. Owns raffle state and serializes every operation,
   * a rejected operation leaves state, ledger and event log untouched.
   * Event observers are called without the state lock held and may call
   * back into the raffle.
   * Must be owned by std::shared_ptr, coordinator delivers randomness
   * through a weak reference.
   */
  class Raffle : public vrf::VrfConsumer,
                 public std::enable_shared_from_this<Raffle> {
   public:
    /**
     * @param address - raffle account holding entrance payments
     * @param config - oracle request and payout parameters
     * @param ledger - account balances
     * @param coordinator - randomness oracle
     * @param event_log - sink of emitted events
     */
    Raffle(const Address &address,
           RaffleConfig config,
           std::shared_ptr<ledger::Ledger> ledger,
           std::shared_ptr<vrf::RandomnessCoordinator> coordinator,
           std::shared_ptr<EventLog> event_log);

    /**
     * Opens a session owned by caller
     * @param fee - minimal entrance payment, zero allowed, negative rejected
     */
    RaffleResult<void> open(const Address &caller, const TokenAmount &fee);

    /**
     * Enters caller into the open session. Payment is moved to the raffle
     * account, overpayment is not refunded.
     */
    RaffleResult<void> enter(const Address &caller, const TokenAmount &payment);

    /**
     * Closes the session. Without players the session is reset at once,
     * otherwise winner randomness is requested.
     */
    RaffleResult<void> end(const Address &caller);

    /**
     * Picks the winner and distributes the pool
     * @param caller - must be the coordinator
     * @param request_id - must match the pending request
     * @param random_words - first word selects the winner
     */
    RaffleResult<Payout> fulfillRandomWords(
        const Address &caller,
        RequestId request_id,
        const std::vector<RandomWord> &random_words);

    outcome::result<void> rawFulfillRandomWords(
        const Address &caller,
        RequestId request_id,
        const std::vector<RandomWord> &random_words) override;

    boost::optional<Address> getRaffleOwner() const;

    boost::optional<Address> getRafflePreviousOwner() const;

    TokenAmount getEntranceFee() const;

    RaffleStatus getRaffleState() const;

    outcome::result<Address> getPlayer(size_t index) const;

    outcome::result<Address> getPlayerFromPreviousSession(size_t index) const;

    size_t getPlayersCount() const;

    size_t getPreviousSessionPlayersCount() const;

    boost::optional<Address> getRecentWinner() const;

    boost::optional<RequestId> getPendingRequestId() const;

    /// Balance of the raffle account
    outcome::result<TokenAmount> getBalance() const;

    const Address &address() const;

   private:
    /**
     * Queues event of a completed operation and appends queued events with
     * the state lock released. One caller at a time drains the queue, so
     * the log keeps operation order.
     */
    void emit(std::unique_lock<std::mutex> &lock, RaffleEvent event);

    mutable std::mutex mutex_;

    Address address_;
    RaffleConfig config_;
    RaffleState state_;
    std::vector<RaffleEvent> pending_events_;
    bool emitting_{false};

    std::shared_ptr<ledger::Ledger> ledger_;
    std::shared_ptr<vrf::RandomnessCoordinator> coordinator_;
    std::shared_ptr<EventLog> event_log_;
    PayoutEngine payout_engine_;

    common::Logger logger_;
  };
}  // namespace rf::raffle
