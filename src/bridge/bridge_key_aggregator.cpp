/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/bridge_key_aggregator.hpp"

#include <charconv>

#include <qtils/byte_vec.hpp>
#include <qtils/unhex.hpp>

namespace anchorwatch {
  BridgeKeyAggregator::BridgeKeyAggregator(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<rpc::SequencerApi> sequencer,
      qtils::SharedRef<Waiter> waiter)
      : logger_{logging_system->getLogger("BridgeKey", "bridge")},
        sequencer_{std::move(sequencer)},
        waiter_{std::move(waiter)} {}

  outcome::result<crypto::XOnlyPubkey>
  BridgeKeyAggregator::aggregateBridgeKey() const {
    auto started = waiter_->untilWithValue(
        [&] { return sequencer_->protocolVersion(); },
        [](uint64_t) { return true; },
        {
            .error_with = "Sequencer did not start on time",
            .timeout = kSequencerStartTimeout,
        });
    if (started.has_error()) {
      return BridgeKeyError::SEQUENCER_UNAVAILABLE;
    }

    BOOST_OUTCOME_TRY(auto operators, sequencer_->activeOperatorPubkeys());
    SL_DEBUG(logger_, "Sequencer reports {} operators", operators.size());
    BOOST_OUTCOME_TRY(auto ordered, orderedOperatorKeys(operators));

    std::vector<crypto::XOnlyPubkey> xonly_keys;
    xonly_keys.reserve(ordered.size());
    for (size_t i = 0; i < ordered.size(); ++i) {
      qtils::ByteVec raw;
      if (not qtils::unhex0x(raw, ordered[i], true).has_value()) {
        SL_ERROR(logger_, "Operator {} key is not hex: {}", i, ordered[i]);
        return BridgeKeyError::INVALID_PUBKEY;
      }
      auto xonly = crypto::convertToXOnly(raw);
      if (xonly.has_error()) {
        SL_ERROR(logger_,
                 "Operator {} key {} rejected: {}",
                 i,
                 ordered[i],
                 xonly.error());
        return BridgeKeyError::INVALID_PUBKEY;
      }
      xonly_keys.emplace_back(xonly.value());
    }

    BOOST_OUTCOME_TRY(auto bridge_key,
                      crypto::musigAggregatePubkeys(xonly_keys));
    SL_INFO(logger_, "Bridge key: {}", bridge_key.toHex());
    return bridge_key;
  }

  outcome::result<std::vector<std::string>>
  BridgeKeyAggregator::orderedOperatorKeys(
      const rpc::OperatorPubkeyMap &operators) {
    if (operators.empty()) {
      return BridgeKeyError::EMPTY_OPERATOR_SET;
    }
    std::vector<std::optional<std::string>> slots(operators.size());
    for (auto &[key, pubkey] : operators) {
      size_t index = 0;
      auto [end, ec] =
          std::from_chars(key.data(), key.data() + key.size(), index);
      // only the canonical spelling: no sign, no leading zeros, no suffix
      if (ec != std::errc{} or end != key.data() + key.size()
          or (key.size() > 1 and key.front() == '0')) {
        return BridgeKeyError::INVALID_OPERATOR_INDEX;
      }
      if (index >= slots.size()) {
        return BridgeKeyError::OPERATOR_INDEX_GAP;
      }
      slots[index] = pubkey;
    }
    std::vector<std::string> ordered;
    ordered.reserve(slots.size());
    for (auto &slot : slots) {
      ordered.emplace_back(std::move(slot.value()));
    }
    return ordered;
  }
}  // namespace anchorwatch
