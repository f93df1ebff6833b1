/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace rf::raffle {
  using primitives::TokenAmount;
  using primitives::address::Address;

  enum class RaffleError {
    kAlreadyInSession = 1,
    kNegativeEntranceFee,
    kNotOpen,
    kOwnerCannotEnter,
    kInsufficientFee,
    kNotOwner,
    kTransferFailed,
    kAwaitingRandomness,
    kOnlyCoordinatorCanFulfill,
    kUnknownRequest,
    kEmptyRandomWords,
    kIndexOutOfBounds,
  };

}  // namespace rf::raffle

OUTCOME_HPP_DECLARE_ERROR(rf::raffle, RaffleError);

namespace rf::raffle {
  /**
   * Failure of a raffle operation: error code with the values the
   * operation was rejected for
   */
  struct RaffleFailure {
    RaffleFailure() = default;

    explicit RaffleFailure(RaffleError error) : code{make_error_code(error)} {}

    explicit RaffleFailure(std::error_code error) : code{error} {}

    static RaffleFailure insufficientFee(TokenAmount required,
                                         TokenAmount paid);

    static RaffleFailure transferFailed(Address recipient, TokenAmount amount);

    std::error_code code;

    /** kInsufficientFee: entrance fee and attached payment */
    TokenAmount required;
    TokenAmount paid;

    /** kTransferFailed: recipient and amount of the failed transfer */
    boost::optional<Address> recipient;
    TokenAmount amount;

    /** kTransferFailed: owner fee that stays paid despite the failure */
    boost::optional<TokenAmount> committed_owner_fee;
  };

  inline std::error_code make_error_code(const RaffleFailure &failure) {
    return failure.code;
  }

  [[noreturn]] inline void outcome_throw_as_system_error_with_payload(
      const RaffleFailure &failure) {
    outcome::raise(failure.code);
  }

  template <typename T>
  using RaffleResult = outcome::result<T, RaffleFailure>;

  inline auto fail(RaffleError error) {
    return outcome::failure(RaffleFailure{error});
  }

  inline auto fail(const std::error_code &error) {
    return outcome::failure(RaffleFailure{error});
  }
}  // namespace rf::raffle
