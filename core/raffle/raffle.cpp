/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/raffle.hpp"

#include <gsl/gsl_util>

namespace rf::raffle {
  using primitives::formatEther;

  Raffle::Raffle(const Address &address,
                 RaffleConfig config,
                 std::shared_ptr<ledger::Ledger> ledger,
                 std::shared_ptr<vrf::RandomnessCoordinator> coordinator,
                 std::shared_ptr<EventLog> event_log)
      : address_{address},
        config_{std::move(config)},
        ledger_{std::move(ledger)},
        coordinator_{std::move(coordinator)},
        event_log_{std::move(event_log)},
        payout_engine_{ledger_, config_.payout_policy},
        logger_{common::createLogger("raffle")} {}

  RaffleResult<void> Raffle::open(const Address &caller,
                                  const TokenAmount &fee) {
    std::unique_lock lock{mutex_};
    if (state_.owner) {
      logger_->warn("{} cannot open: session of {} in progress",
                    caller.toHex(),
                    state_.owner->toHex());
      return fail(RaffleError::kAlreadyInSession);
    }
    if (fee < 0) {
      logger_->warn("{} cannot open with entrance fee {} wei",
                    caller.toHex(),
                    fee.str());
      return fail(RaffleError::kNegativeEntranceFee);
    }

    state_.owner = caller;
    state_.status = RaffleStatus::kOpen;
    state_.entrance_fee = fee;
    logger_->info(
        "raffle opened by {}, entrance fee {}", caller.toHex(), formatEther(fee));
    emit(lock, events::RaffleOpened{caller, fee});
    return outcome::success();
  }

  RaffleResult<void> Raffle::enter(const Address &caller,
                                   const TokenAmount &payment) {
    std::unique_lock lock{mutex_};
    if (state_.owner == caller) {
      return fail(RaffleError::kOwnerCannotEnter);
    }
    if (state_.status != RaffleStatus::kOpen) {
      return fail(RaffleError::kNotOpen);
    }
    if (payment < state_.entrance_fee) {
      logger_->warn("{} paid {}, entrance fee is {}",
                    caller.toHex(),
                    formatEther(payment),
                    formatEther(state_.entrance_fee));
      return outcome::failure(
          RaffleFailure::insufficientFee(state_.entrance_fee, payment));
    }
    if (auto paid{ledger_->transfer(caller, address_, payment)}; !paid) {
      logger_->warn("{} payment failed: {}", caller.toHex(), paid.error());
      return fail(paid.error());
    }

    state_.players.push_back(caller);
    logger_->info("{} entered with {}, {} player(s)",
                  caller.toHex(),
                  formatEther(payment),
                  state_.players.size());
    emit(lock, events::RaffleEntered{caller});
    return outcome::success();
  }

  RaffleResult<void> Raffle::end(const Address &caller) {
    std::unique_lock lock{mutex_};
    if (state_.owner != caller) {
      return fail(RaffleError::kNotOwner);
    }
    if (state_.pending_request_id) {
      return fail(RaffleError::kAwaitingRandomness);
    }

    if (state_.players.empty()) {
      state_.status = RaffleStatus::kClosed;
      state_.resetSession();
      logger_->info("raffle of {} ended without players", caller.toHex());
      return outcome::success();
    }

    auto request_id{coordinator_->requestRandomWords(config_.winnerRequest(),
                                                     weak_from_this())};
    if (!request_id) {
      logger_->warn("winner randomness request failed: {}",
                    request_id.error());
      return fail(request_id.error());
    }

    state_.status = RaffleStatus::kClosed;
    state_.pending_request_id = request_id.value();
    logger_->info("raffle of {} closed with {} player(s), request {}",
                  caller.toHex(),
                  state_.players.size(),
                  request_id.value());
    emit(lock, events::RequestedRaffleWinner{request_id.value()});
    return outcome::success();
  }

  RaffleResult<Payout> Raffle::fulfillRandomWords(
      const Address &caller,
      RequestId request_id,
      const std::vector<RandomWord> &random_words) {
    std::unique_lock lock{mutex_};
    if (caller != coordinator_->address()) {
      return fail(RaffleError::kOnlyCoordinatorCanFulfill);
    }
    if (state_.pending_request_id != request_id) {
      return fail(RaffleError::kUnknownRequest);
    }
    if (random_words.empty()) {
      return fail(RaffleError::kEmptyRandomWords);
    }

    // players are never empty while a request is pending
    auto snapshot{state_};
    const RandomWord index{random_words.front() % state_.players.size()};
    const auto winner{state_.players[index.convert_to<size_t>()]};
    state_.recent_winner = winner;
    state_.previous_session_players = std::move(state_.players);
    state_.players.clear();

    auto payout{payout_engine_.distribute(
        address_, *state_.owner, winner, state_.paid_owner_fee)};
    if (!payout) {
      state_ = std::move(snapshot);
      state_.paid_owner_fee = payout.error().committed_owner_fee;
      logger_->warn("request {}: payout to {} failed: {}",
                    request_id,
                    winner.toHex(),
                    payout.error().code);
      return payout;
    }

    state_.previous_owner = state_.owner;
    state_.resetSession();
    logger_->info("request {}: winner {} of {} player(s)",
                  request_id,
                  winner.toHex(),
                  state_.previous_session_players.size());
    emit(lock, events::RaffleWinnerPicked{winner});
    return payout;
  }

  outcome::result<void> Raffle::rawFulfillRandomWords(
      const Address &caller,
      RequestId request_id,
      const std::vector<RandomWord> &random_words) {
    auto result{fulfillRandomWords(caller, request_id, random_words)};
    if (!result) {
      return result.error().code;
    }
    return outcome::success();
  }

  boost::optional<Address> Raffle::getRaffleOwner() const {
    std::lock_guard lock{mutex_};
    return state_.owner;
  }

  boost::optional<Address> Raffle::getRafflePreviousOwner() const {
    std::lock_guard lock{mutex_};
    return state_.previous_owner;
  }

  TokenAmount Raffle::getEntranceFee() const {
    std::lock_guard lock{mutex_};
    return state_.entrance_fee;
  }

  RaffleStatus Raffle::getRaffleState() const {
    std::lock_guard lock{mutex_};
    return state_.status;
  }

  outcome::result<Address> Raffle::getPlayer(size_t index) const {
    std::lock_guard lock{mutex_};
    if (index >= state_.players.size()) {
      return RaffleError::kIndexOutOfBounds;
    }
    return state_.players[index];
  }

  outcome::result<Address> Raffle::getPlayerFromPreviousSession(
      size_t index) const {
    std::lock_guard lock{mutex_};
    if (index >= state_.previous_session_players.size()) {
      return RaffleError::kIndexOutOfBounds;
    }
    return state_.previous_session_players[index];
  }

  size_t Raffle::getPlayersCount() const {
    std::lock_guard lock{mutex_};
    return state_.players.size();
  }

  size_t Raffle::getPreviousSessionPlayersCount() const {
    std::lock_guard lock{mutex_};
    return state_.previous_session_players.size();
  }

  boost::optional<Address> Raffle::getRecentWinner() const {
    std::lock_guard lock{mutex_};
    return state_.recent_winner;
  }

  boost::optional<RequestId> Raffle::getPendingRequestId() const {
    std::lock_guard lock{mutex_};
    return state_.pending_request_id;
  }

  outcome::result<TokenAmount> Raffle::getBalance() const {
    return ledger_->getBalance(address_);
  }

  const Address &Raffle::address() const {
    return address_;
  }

  void Raffle::emit(std::unique_lock<std::mutex> &lock, RaffleEvent event) {
    pending_events_.push_back(std::move(event));
    if (emitting_) {
      return;
    }
    emitting_ = true;
    auto drained{gsl::finally([&] {
      if (!lock.owns_lock()) {
        lock.lock();
      }
      emitting_ = false;
    })};
    while (!pending_events_.empty()) {
      auto batch{std::move(pending_events_)};
      pending_events_.clear();
      lock.unlock();
      for (auto &queued : batch) {
        event_log_->append(std::move(queued));
      }
      lock.lock();
    }
  }
}  // namespace rf::raffle
