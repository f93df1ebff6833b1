/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/validate/with.hpp"
#include "primitives/address/address.hpp"

namespace rf::primitives::address {
  /// Hex address option, "0x" prefix optional
  CLI_VALIDATE(Address) {
    cli::validateWith(out, values, [](const std::string &value) {
      return Address::fromHex(value);
    });
  }
}  // namespace rf::primitives::address
