/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_RAFFLE_CORE_PRIMITIVES_ADDRESS_HPP
#define CPP_RAFFLE_CORE_PRIMITIVES_ADDRESS_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include "common/outcome.hpp"

namespace rf::primitives::address {

  /**
   * @brief Potential errors creating addresses
   */
  enum class AddressError {
    kInvalidLength = 1, /**< Payload is not 20 bytes long */
    kInvalidHex,        /**< Payload is not a hex string */
  };

  constexpr size_t kAddressSize = 20;

  /**
   * @brief Address refers to an account on the ledger: a player, a raffle
   * owner, the raffle itself or the randomness coordinator
   */
  struct Address {
    using Bytes = std::array<uint8_t, kAddressSize>;

    /**
     * @brief Parses "0x"-prefixed (or bare) 40-character hex string
     */
    static outcome::result<Address> fromHex(std::string_view hex);

    /// Address with id written big-endian into the lowest bytes
    static Address makeFromId(uint64_t id);

    /// "0x"-prefixed lowercase hex
    std::string toHex() const;

    Bytes bytes{};
  };

  /**
   * @brief Addresses equality operator
   */
  bool operator==(const Address &lhs, const Address &rhs);

  /**
   * @brief Addresses not equality operator
   */
  bool operator!=(const Address &lhs, const Address &rhs);

  /**
   * @brief Addresses "less than" operator
   */
  bool operator<(const Address &lhs, const Address &rhs);

  std::ostream &operator<<(std::ostream &os, const Address &address);

}  // namespace rf::primitives::address

namespace std {
  template <>
  struct hash<rf::primitives::address::Address> {
    size_t operator()(const rf::primitives::address::Address &address) const;
  };
}  // namespace std

/**
 * @brief Outcome errors declaration
 */
OUTCOME_HPP_DECLARE_ERROR(rf::primitives::address, AddressError);

#endif  // CPP_RAFFLE_CORE_PRIMITIVES_ADDRESS_HPP
