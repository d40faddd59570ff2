/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/musig_key_agg.hpp"
#include "log/logger.hpp"
#include "rpc/sequencer_api.hpp"
#include "utils/wait_until.hpp"

namespace anchorwatch {
  enum class BridgeKeyError : uint8_t {
    SEQUENCER_UNAVAILABLE = 1,
    EMPTY_OPERATOR_SET,
    INVALID_OPERATOR_INDEX,
    OPERATOR_INDEX_GAP,
    INVALID_PUBKEY,
  };
  Q_ENUM_ERROR_CODE(BridgeKeyError) {
    using E = decltype(e);
    switch (e) {
      case E::SEQUENCER_UNAVAILABLE:
        return "Sequencer did not start on time";
      case E::EMPTY_OPERATOR_SET:
        return "Sequencer has no active operators";
      case E::INVALID_OPERATOR_INDEX:
        return "Operator index is not a decimal number";
      case E::OPERATOR_INDEX_GAP:
        return "Operator indices are not contiguous";
      case E::INVALID_PUBKEY:
        return "Operator public key is not valid";
    }
    abort();
  }

  /**
   * Derives the bridge key as MuSig2 aggregate of the active operators'
   * x-only keys, taken in operator index order.
   */
  class BridgeKeyAggregator {
   public:
    static constexpr std::chrono::seconds kSequencerStartTimeout{5};

    BridgeKeyAggregator(qtils::SharedRef<log::LoggingSystem> logging_system,
                        qtils::SharedRef<rpc::SequencerApi> sequencer,
                        qtils::SharedRef<Waiter> waiter);

    outcome::result<crypto::XOnlyPubkey> aggregateBridgeKey() const;

    /**
     * Orders operator keys by index. Indices must form exactly 0..N-1.
     */
    static outcome::result<std::vector<std::string>> orderedOperatorKeys(
        const rpc::OperatorPubkeyMap &operators);

   private:
    log::Logger logger_;
    qtils::SharedRef<rpc::SequencerApi> sequencer_;
    qtils::SharedRef<Waiter> waiter_;
  };
}  // namespace anchorwatch
