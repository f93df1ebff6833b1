/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

/// Declares program options parser of TYPE, found by ADL
#define CLI_VALIDATE(TYPE) \
  inline void validate(    \
      boost::any &out, const std::vector<std::string> &values, TYPE *, int)

namespace rf::cli {
  /**
   * Stores single option value parsed by parse
   * @param parse - returns outcome::result or boost::optional, failure or
   * none makes the option value invalid
   */
  template <typename F>
  void validateWith(boost::any &out,
                    const std::vector<std::string> &values,
                    const F &parse) {
    namespace po = boost::program_options;
    po::check_first_occurrence(out);
    const auto &value{po::get_single_string(values)};
    auto parsed{parse(value)};
    if (!parsed) {
      boost::throw_exception(po::invalid_option_value{value});
    }
    out = std::move(parsed.value());
  }
}  // namespace rf::cli
