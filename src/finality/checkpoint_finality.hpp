/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/di.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/checkpoint_info.hpp"
#include "types/checkpoint_state.hpp"
#include "types/l1_status.hpp"
#include "types/manual_gen_config.hpp"
#include "types/sync_status.hpp"
#include "utils/wait_until.hpp"

namespace anchorwatch::app {
  class Configuration;
}  // namespace anchorwatch::app

namespace anchorwatch::rpc {
  class SequencerApi;
  class L1Client;
}  // namespace anchorwatch::rpc

namespace anchorwatch {
  class AnchorWatcher;
  class ProofArbiter;

  /**
   * Tracks every checked checkpoint through
   * Pending -> ProofSubmitted -> Anchored -> Finalized
   * and drives a single checkpoint to finality.
   *
   * Each sync status observation is checked against the previous one: the
   * finalized block may only move to a later checkpoint.
   */
  class CheckpointFinality {
   public:
    static constexpr std::chrono::seconds kCheckpointInfoTimeout{3};
    static constexpr std::chrono::seconds kFinalizationTimeout{10};
    static constexpr std::chrono::seconds kDefaultConfirmationTimeout{3600};
    static constexpr std::chrono::seconds kConfirmationPollStep{1};

    struct Params {
      /// L1 confirmations after which the sequencer finalizes a checkpoint
      uint64_t finality_depth = 6;
      /// Bound for waiting on organic confirmations
      std::chrono::milliseconds confirmation_timeout =
          kDefaultConfirmationTimeout;
    };

    struct Record {
      CheckpointState state = CheckpointState::Pending;
      L2BlockId l2_blockid;
      std::optional<L1Txid> anchor_txid;
    };

    CheckpointFinality(qtils::SharedRef<log::LoggingSystem> logging_system,
                       qtils::SharedRef<rpc::SequencerApi> sequencer,
                       qtils::SharedRef<rpc::L1Client> l1,
                       qtils::SharedRef<ProofArbiter> proof_arbiter,
                       qtils::SharedRef<AnchorWatcher> anchor_watcher,
                       qtils::SharedRef<Waiter> waiter,
                       const app::Configuration &config);
    BOOST_DI_INJECT_TRAITS(qtils::SharedRef<anchorwatch::log::LoggingSystem>,
                           qtils::SharedRef<anchorwatch::rpc::SequencerApi>,
                           qtils::SharedRef<anchorwatch::rpc::L1Client>,
                           qtils::SharedRef<anchorwatch::ProofArbiter>,
                           qtils::SharedRef<anchorwatch::AnchorWatcher>,
                           qtils::SharedRef<anchorwatch::Waiter>,
                           const anchorwatch::app::Configuration &);
    CheckpointFinality(qtils::SharedRef<log::LoggingSystem> logging_system,
                       qtils::SharedRef<rpc::SequencerApi> sequencer,
                       qtils::SharedRef<rpc::L1Client> l1,
                       qtils::SharedRef<ProofArbiter> proof_arbiter,
                       qtils::SharedRef<AnchorWatcher> anchor_watcher,
                       qtils::SharedRef<Waiter> waiter,
                       Params params);

    /**
     * Drives checkpoint `idx` from creation to finalization.
     *
     * Fails if the checkpoint is already finalized or its successor already
     * exists, so the check is single-shot per index. In manual mode
     * `finality_depth + 1` blocks are mined after anchoring, otherwise the
     * anchor is awaited to reach the configured depth on its own.
     */
    outcome::result<void> checkNthCheckpointFinalized(
        CheckpointIdx idx,
        const std::optional<ManualGenConfig> &manual_gen,
        std::optional<std::chrono::seconds> proof_timeout);

    /**
     * Waits for the anchor of an already anchored checkpoint to reach
     * finality depth without mining, then for the sequencer to finalize it.
     */
    outcome::result<void> waitForOrganicFinality(CheckpointIdx idx,
                                                 const WaitOptions &options);

    std::optional<CheckpointState> checkpointState(CheckpointIdx idx) const;

    const std::optional<L2BlockId> &latestFinalized() const {
      return last_finalized_;
    }

   private:
    /// Reads sync status and rejects a regressed finalized block
    outcome::result<SyncStatus> observeSyncStatus();

    /// Index of the checkpoint ending at `block`, including ones not checked
    /// by this instance
    outcome::result<std::optional<CheckpointIdx>> checkpointIdxOf(
        const L2BlockId &block);

    outcome::result<void> awaitFinalization(CheckpointIdx idx);

    void advance(CheckpointIdx idx, CheckpointState state);

    log::Logger logger_;
    qtils::SharedRef<rpc::SequencerApi> sequencer_;
    qtils::SharedRef<rpc::L1Client> l1_;
    qtils::SharedRef<ProofArbiter> proof_arbiter_;
    qtils::SharedRef<AnchorWatcher> anchor_watcher_;
    qtils::SharedRef<Waiter> waiter_;
    Params params_;

    std::map<CheckpointIdx, Record> records_;
    std::optional<L2BlockId> last_finalized_;
    std::optional<CheckpointIdx> last_finalized_idx_;
    // checkpoint blocks learned from the sequencer, keyed by hex
    std::unordered_map<std::string, CheckpointIdx> known_blocks_;
    CheckpointIdx next_unscanned_ = 0;
  };
}  // namespace anchorwatch
