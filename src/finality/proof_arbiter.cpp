/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/proof_arbiter.hpp"

#include "finality/anchor_watcher.hpp"
#include "finality/finality_error.hpp"
#include "rpc/l1_client.hpp"
#include "rpc/rpc_error.hpp"
#include "rpc/sequencer_api.hpp"

namespace anchorwatch {
  ProofArbiter::ProofArbiter(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<rpc::SequencerApi> sequencer,
      qtils::SharedRef<rpc::L1Client> l1,
      qtils::SharedRef<AnchorWatcher> anchor_watcher,
      qtils::SharedRef<Waiter> waiter)
      : logger_{logging_system->getLogger("ProofArbiter", "finality")},
        sequencer_{std::move(sequencer)},
        l1_{std::move(l1)},
        anchor_watcher_{std::move(anchor_watcher)},
        waiter_{std::move(waiter)} {}

  outcome::result<void> ProofArbiter::submitOrWait(
      CheckpointIdx idx, std::optional<std::chrono::seconds> proof_timeout) {
    BOOST_OUTCOME_TRY(anchor_watcher_->remember());

    if (not proof_timeout.has_value()) {
      static const qtils::ByteVec empty_proof;
      auto it = proofs_.find(idx);
      const auto &proof = it != proofs_.end() ? it->second : empty_proof;
      SL_INFO(logger_,
              "Submitting proof of checkpoint {} ({} bytes)",
              idx,
              proof.size());
      BOOST_OUTCOME_TRY(sequencer_->submitCheckpointProof(idx, proof));
    } else {
      // the sequencer publishes an empty proof on its own once the timeout
      // fires
      const auto wait = proof_timeout.value() + kGraceDelta;
      SL_INFO(logger_,
              "Waiting {}s for proof timeout of checkpoint {}",
              wait.count(),
              idx);
      waiter_->sleepFor(wait);
    }

    advance(idx, ArbiterState::Submitted);
    return outcome::success();
  }

  outcome::result<L1Txid> ProofArbiter::awaitAnchoring(
      CheckpointIdx idx, const WaitOptions &options) {
    auto txid_res = waiter_->untilWithValue(
        [&] { return anchor_watcher_->newTxid(); },
        [](const std::optional<L1Txid> &txid) { return txid.has_value(); },
        options);
    if (txid_res.has_error()) {
      return FinalityError::ANCHOR_NOT_OBSERVED;
    }
    auto txid = std::move(txid_res.value().value());
    SL_INFO(logger_, "Checkpoint {} published in L1 tx {}", idx, txid);
    advance(idx, ArbiterState::AnchorObserved);
    return txid;
  }

  outcome::result<L1Txid> ProofArbiter::awaitAnchoring(CheckpointIdx idx) {
    return awaitAnchoring(idx,
                          {
                              .error_with = "Proof was not published to bitcoin",
                              .timeout = kAnchorTimeout,
                          });
  }

  outcome::result<L1Txid> ProofArbiter::submitCheckpoint(
      CheckpointIdx idx, const std::optional<ManualGenConfig> &manual_gen) {
    BOOST_OUTCOME_TRY(submitOrWait(idx, std::nullopt));
    BOOST_OUTCOME_TRY(auto txid, awaitAnchoring(idx));

    if (manual_gen.has_value()) {
      BOOST_OUTCOME_TRY(l1_->generateToAddress(1, manual_gen->gen_addr));
      auto confirmed = waiter_->until(
          [&]() -> outcome::result<bool> {
            BOOST_OUTCOME_TRY(auto confirmations,
                              anchor_watcher_->confirmationsOf(txid));
            return confirmations > 0;
          },
          {
              .error_with = "Published inscription not confirmed",
              .timeout = kConfirmationTimeout,
          });
      if (confirmed.has_error()) {
        return FinalityError::ANCHOR_NOT_CONFIRMED;
      }
    }
    return txid;
  }

  outcome::result<void> ProofArbiter::checkSubmitProofFailsForNonexistentBatch(
      CheckpointIdx idx) {
    auto res = sequencer_->submitCheckpointProof(idx, qtils::ByteVec{});
    if (res.has_value()) {
      SL_ERROR(logger_,
               "Proof of nonexistent checkpoint {} was accepted",
               idx);
      return FinalityError::UNEXPECTED_SUCCESS;
    }
    if (res.error() != rpc::RpcError::CHECKPOINT_DOES_NOT_EXIST) {
      SL_ERROR(logger_, "Unexpected error occurred: {}", res.error());
      return res.error();
    }
    return outcome::success();
  }

  void ProofArbiter::provideProof(CheckpointIdx idx, qtils::ByteVec proof) {
    proofs_[idx] = std::move(proof);
  }

  ArbiterState ProofArbiter::state(CheckpointIdx idx) const {
    auto it = states_.find(idx);
    return it != states_.end() ? it->second : ArbiterState::AwaitingDecision;
  }

  void ProofArbiter::advance(CheckpointIdx idx, ArbiterState state) {
    auto &current = states_[idx];
    if (state > current) {
      current = state;
    }
  }
}  // namespace anchorwatch
