/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <boost/container_hash/hash.hpp>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rf::primitives::address, AddressError, e) {
  using rf::primitives::address::AddressError;
  switch (e) {
    case (AddressError::kInvalidLength):
      return "Failed to create address: payload must be 20 bytes long";
    case (AddressError::kInvalidHex):
      return "Failed to create address: payload is not a hex string";
  }
  return "Failed to create address: unknown error";
}

namespace rf::primitives::address {

  outcome::result<Address> Address::fromHex(std::string_view hex) {
    auto bytes{common::unhexFixed<kAddressSize>(hex)};
    if (!bytes) {
      if (bytes.error() == common::UnhexError::kIncorrectLength) {
        return AddressError::kInvalidLength;
      }
      return AddressError::kInvalidHex;
    }
    return Address{bytes.value()};
  }

  Address Address::makeFromId(uint64_t id) {
    Address address;
    for (size_t i = 0; i < sizeof(id); ++i) {
      address.bytes[kAddressSize - 1 - i] = static_cast<uint8_t>(id >> (8 * i));
    }
    return address;
  }

  std::string Address::toHex() const {
    return "0x" + common::hex_lower(bytes.data(), bytes.size());
  }

  bool operator==(const Address &lhs, const Address &rhs) {
    return lhs.bytes == rhs.bytes;
  }

  bool operator!=(const Address &lhs, const Address &rhs) {
    return !(lhs == rhs);
  }

  bool operator<(const Address &lhs, const Address &rhs) {
    return lhs.bytes < rhs.bytes;
  }

  std::ostream &operator<<(std::ostream &os, const Address &address) {
    return os << address.toHex();
  }

}  // namespace rf::primitives::address

size_t std::hash<rf::primitives::address::Address>::operator()(
    const rf::primitives::address::Address &address) const {
  return boost::hash_range(address.bytes.begin(), address.bytes.end());
}
