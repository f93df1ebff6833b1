/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/raffle_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rf::raffle, RaffleError, e) {
  using E = rf::raffle::RaffleError;
  switch (e) {
    case E::kAlreadyInSession:
      return "Raffle: a session is already in progress";
    case E::kNegativeEntranceFee:
      return "Raffle: entrance fee cannot be negative";
    case E::kNotOpen:
      return "Raffle: raffle is not open";
    case E::kOwnerCannotEnter:
      return "Raffle: owner cannot enter own raffle";
    case E::kInsufficientFee:
      return "Raffle: payment is lower than the entrance fee";
    case E::kNotOwner:
      return "Raffle: caller is not the raffle owner";
    case E::kTransferFailed:
      return "Raffle: transfer failed";
    case E::kAwaitingRandomness:
      return "Raffle: winner randomness has already been requested";
    case E::kOnlyCoordinatorCanFulfill:
      return "Raffle: only the coordinator can fulfill randomness";
    case E::kUnknownRequest:
      return "Raffle: request id does not match the pending request";
    case E::kEmptyRandomWords:
      return "Raffle: fulfillment carries no random words";
    case E::kIndexOutOfBounds:
      return "Raffle: player index out of bounds";
  }
  return "Raffle: unknown error";
}

namespace rf::raffle {
  RaffleFailure RaffleFailure::insufficientFee(TokenAmount required,
                                               TokenAmount paid) {
    RaffleFailure failure{RaffleError::kInsufficientFee};
    failure.required = std::move(required);
    failure.paid = std::move(paid);
    return failure;
  }

  RaffleFailure RaffleFailure::transferFailed(Address recipient,
                                              TokenAmount amount) {
    RaffleFailure failure{RaffleError::kTransferFailed};
    failure.recipient = recipient;
    failure.amount = std::move(amount);
    return failure;
  }
}  // namespace rf::raffle
