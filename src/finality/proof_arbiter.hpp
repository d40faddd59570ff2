/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/checkpoint_info.hpp"
#include "types/l1_status.hpp"
#include "types/manual_gen_config.hpp"
#include "utils/wait_until.hpp"

namespace anchorwatch::rpc {
  class SequencerApi;
  class L1Client;
}  // namespace anchorwatch::rpc

namespace anchorwatch {
  class AnchorWatcher;

  enum class ArbiterState : uint8_t {
    AwaitingDecision,
    Submitted,
    AnchorObserved,
  };

  /**
   * Decides per checkpoint whether a proof is submitted explicitly or the
   * sequencer's own timeout fallback is waited out, and observes the L1
   * transaction that either path produces.
   */
  class ProofArbiter {
   public:
    /// Added to the proof timeout before the fallback is expected on L1
    static constexpr std::chrono::seconds kGraceDelta{1};
    static constexpr std::chrono::seconds kAnchorTimeout{5};
    static constexpr std::chrono::seconds kConfirmationTimeout{5};

    ProofArbiter(qtils::SharedRef<log::LoggingSystem> logging_system,
                 qtils::SharedRef<rpc::SequencerApi> sequencer,
                 qtils::SharedRef<rpc::L1Client> l1,
                 qtils::SharedRef<AnchorWatcher> anchor_watcher,
                 qtils::SharedRef<Waiter> waiter);

    /**
     * Without `proof_timeout` submits the proof of `idx` (empty unless one
     * was provided). With it, sleeps `proof_timeout + kGraceDelta` and
     * submits nothing. The published txid is remembered before either.
     */
    outcome::result<void> submitOrWait(
        CheckpointIdx idx, std::optional<std::chrono::seconds> proof_timeout);

    /// Polls until the anchoring txid differs from the remembered one
    outcome::result<L1Txid> awaitAnchoring(CheckpointIdx idx,
                                           const WaitOptions &options);
    outcome::result<L1Txid> awaitAnchoring(CheckpointIdx idx);

    /**
     * Explicit submission path: submit, await the anchoring transaction and,
     * in manual mode, mine one block and wait for its first confirmation.
     */
    outcome::result<L1Txid> submitCheckpoint(
        CheckpointIdx idx, const std::optional<ManualGenConfig> &manual_gen);

    /**
     * Succeeds only if the sequencer rejects a proof for `idx` with
     * CHECKPOINT_DOES_NOT_EXIST. Other errors are passed through.
     */
    outcome::result<void> checkSubmitProofFailsForNonexistentBatch(
        CheckpointIdx idx);

    /// Proof bytes to submit for `idx` instead of the empty placeholder
    void provideProof(CheckpointIdx idx, qtils::ByteVec proof);

    ArbiterState state(CheckpointIdx idx) const;

   private:
    void advance(CheckpointIdx idx, ArbiterState state);

    log::Logger logger_;
    qtils::SharedRef<rpc::SequencerApi> sequencer_;
    qtils::SharedRef<rpc::L1Client> l1_;
    qtils::SharedRef<AnchorWatcher> anchor_watcher_;
    qtils::SharedRef<Waiter> waiter_;
    std::map<CheckpointIdx, ArbiterState> states_;
    std::map<CheckpointIdx, qtils::ByteVec> proofs_;
  };
}  // namespace anchorwatch
