/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/raffle_config.hpp"

#include <boost/program_options.hpp>

#include "cli/validate/with.hpp"
#include "common/hexutil.hpp"

namespace rf::raffle {
  CLI_VALIDATE(PayoutPolicy) {
    cli::validateWith(out, values, parsePayoutPolicy);
  }

  RaffleConfig::RaffleConfig() : key_hash{parseKeyHash(kDefaultKeyHash).value()} {}

  vrf::RandomWordsRequest RaffleConfig::winnerRequest() const {
    vrf::RandomWordsRequest request;
    request.key_hash = key_hash;
    request.subscription_id = subscription_id;
    request.request_confirmations = kRequestConfirmations;
    request.callback_gas_limit = callback_gas_limit;
    request.num_words = kNumWords;
    request.native_payment = native_payment;
    return request;
  }

  boost::optional<PayoutPolicy> parsePayoutPolicy(const std::string &name) {
    if (name == "atomic") {
      return PayoutPolicy::kAtomic;
    }
    if (name == "partial") {
      return PayoutPolicy::kPartialCommit;
    }
    return boost::none;
  }

  outcome::result<vrf::KeyHash> parseKeyHash(const std::string &hex) {
    return common::unhexFixed<std::tuple_size_v<vrf::KeyHash>>(hex);
  }

  options_description configRaffle(RaffleConfig &config) {
    namespace po = boost::program_options;
    options_description desc("Raffle options");
    auto option{desc.add_options()};
    option("key-hash",
           po::value<std::string>()
               ->default_value(kDefaultKeyHash)
               ->notifier([&config](const std::string &hex) {
                 auto key_hash{parseKeyHash(hex)};
                 if (!key_hash) {
                   boost::throw_exception(po::invalid_option_value{hex});
                 }
                 config.key_hash = key_hash.value();
               }),
           "oracle gas lane key hash (32 bytes hex)");
    option("subscription-id",
           po::value(&config.subscription_id)
               ->default_value(vrf::SubscriptionId{0}, "0"),
           "oracle subscription paying for randomness");
    option("callback-gas-limit",
           po::value(&config.callback_gas_limit)
               ->default_value(kDefaultCallbackGasLimit),
           "gas limit of the fulfillment callback");
    option("native-payment",
           po::bool_switch(&config.native_payment),
           "pay oracle in native token");
    option("payout-policy",
           po::value(&config.payout_policy)
               ->default_value(PayoutPolicy::kAtomic, "atomic"),
           "owner fee on failed winner transfer: \n"
           " * 'atomic' - reverted together with the prize\n"
           " * 'partial' - stays paid\n");
    return desc;
  }
}  // namespace rf::raffle
