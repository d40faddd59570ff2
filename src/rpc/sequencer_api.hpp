/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "types/checkpoint_info.hpp"
#include "types/l1_status.hpp"
#include "types/sync_status.hpp"

namespace anchorwatch::rpc {
  /// Operator index rendered as decimal string to hex encoded public key
  using OperatorPubkeyMap = std::unordered_map<std::string, std::string>;

  /**
   * Query and command surface of the rollup sequencer.
   */
  class SequencerApi {
   public:
    virtual ~SequencerApi() = default;

    virtual outcome::result<SyncStatus> syncStatus() = 0;

    /// Empty optional when the sequencer has no batch with that index
    virtual outcome::result<std::optional<CheckpointInfo>> getCheckpointInfo(
        CheckpointIdx idx) = 0;

    /// Fails with RpcError::CHECKPOINT_DOES_NOT_EXIST for an unknown index
    virtual outcome::result<void> submitCheckpointProof(
        CheckpointIdx idx, qtils::BytesIn proof) = 0;

    virtual outcome::result<L1Status> l1Status() = 0;

    virtual outcome::result<uint64_t> protocolVersion() = 0;

    virtual outcome::result<OperatorPubkeyMap> activeOperatorPubkeys() = 0;
  };
}  // namespace anchorwatch::rpc
