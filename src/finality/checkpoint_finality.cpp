/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/checkpoint_finality.hpp"

#include <fmt/format.h>

#include "app/configuration.hpp"
#include "finality/anchor_watcher.hpp"
#include "finality/finality_error.hpp"
#include "finality/proof_arbiter.hpp"
#include "rpc/l1_client.hpp"
#include "rpc/sequencer_api.hpp"

namespace anchorwatch {
  CheckpointFinality::CheckpointFinality(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<rpc::SequencerApi> sequencer,
      qtils::SharedRef<rpc::L1Client> l1,
      qtils::SharedRef<ProofArbiter> proof_arbiter,
      qtils::SharedRef<AnchorWatcher> anchor_watcher,
      qtils::SharedRef<Waiter> waiter,
      const app::Configuration &config)
      : CheckpointFinality{
            std::move(logging_system),
            std::move(sequencer),
            std::move(l1),
            std::move(proof_arbiter),
            std::move(anchor_watcher),
            std::move(waiter),
            Params{
                .finality_depth = config.finality().depth,
                .confirmation_timeout = config.finality().confirmation_timeout,
            },
        } {}

  CheckpointFinality::CheckpointFinality(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<rpc::SequencerApi> sequencer,
      qtils::SharedRef<rpc::L1Client> l1,
      qtils::SharedRef<ProofArbiter> proof_arbiter,
      qtils::SharedRef<AnchorWatcher> anchor_watcher,
      qtils::SharedRef<Waiter> waiter,
      Params params)
      : logger_{logging_system->getLogger("CheckpointFinality", "finality")},
        sequencer_{std::move(sequencer)},
        l1_{std::move(l1)},
        proof_arbiter_{std::move(proof_arbiter)},
        anchor_watcher_{std::move(anchor_watcher)},
        waiter_{std::move(waiter)},
        params_{params} {}

  outcome::result<void> CheckpointFinality::checkNthCheckpointFinalized(
      CheckpointIdx idx,
      const std::optional<ManualGenConfig> &manual_gen,
      std::optional<std::chrono::seconds> proof_timeout) {
    BOOST_OUTCOME_TRY(auto sync_status, observeSyncStatus());

    auto info_res = waiter_->untilWithValue(
        [&] { return sequencer_->getCheckpointInfo(idx); },
        [](const std::optional<CheckpointInfo> &info) {
          return info.has_value();
        },
        {
            .error_with =
                fmt::format("Could not find checkpoint info for index {}", idx),
            .timeout = kCheckpointInfoTimeout,
        });
    if (info_res.has_error()) {
      return FinalityError::CHECKPOINT_INFO_UNAVAILABLE;
    }
    const auto info = std::move(info_res.value().value());

    if (sync_status.finalized_block_id == info.l2_blockid) {
      SL_ERROR(logger_,
               "Checkpoint {} block {} is already finalized",
               idx,
               info.l2_blockid.toHex());
      return FinalityError::PREMATURELY_FINALIZED;
    }
    if (info.idx != idx) {
      SL_ERROR(logger_, "Requested checkpoint {}, got {}", idx, info.idx);
      return FinalityError::INDEX_MISMATCH;
    }
    BOOST_OUTCOME_TRY(auto next_info, sequencer_->getCheckpointInfo(idx + 1));
    if (next_info.has_value()) {
      SL_ERROR(logger_,
               "There should be no checkpoint info for {} index",
               idx + 1);
      return FinalityError::NEXT_CHECKPOINT_EXISTS;
    }

    records_[idx].l2_blockid = info.l2_blockid;
    SL_INFO(logger_,
            "Checkpoint {} covers L1 {}..{}, L2 {}..{}",
            idx,
            info.l1_range.first,
            info.l1_range.second,
            info.l2_range.first,
            info.l2_range.second);

    L1Txid anchor_txid;
    if (not proof_timeout.has_value()) {
      BOOST_OUTCOME_TRY(anchor_txid,
                        proof_arbiter_->submitCheckpoint(idx, manual_gen));
      advance(idx, CheckpointState::ProofSubmitted);
    } else {
      BOOST_OUTCOME_TRY(proof_arbiter_->submitOrWait(idx, proof_timeout));
      advance(idx, CheckpointState::ProofSubmitted);
      BOOST_OUTCOME_TRY(anchor_txid, proof_arbiter_->awaitAnchoring(idx));
    }
    records_[idx].anchor_txid = anchor_txid;
    advance(idx, CheckpointState::Anchored);

    if (not manual_gen.has_value()) {
      return waitForOrganicFinality(
          idx,
          {
              .error_with = "Published inscription not confirmed",
              .timeout = params_.confirmation_timeout,
              .step = kConfirmationPollStep,
          });
    }

    // confirms the anchor and drives it past finality depth at once
    BOOST_OUTCOME_TRY(l1_->generateToAddress(manual_gen->finality_depth + 1,
                                             manual_gen->gen_addr));
    return awaitFinalization(idx);
  }

  outcome::result<void> CheckpointFinality::waitForOrganicFinality(
      CheckpointIdx idx, const WaitOptions &options) {
    auto it = records_.find(idx);
    if (it == records_.end() or not it->second.anchor_txid.has_value()) {
      return FinalityError::ANCHOR_NOT_OBSERVED;
    }
    const auto txid = it->second.anchor_txid.value();
    const auto depth = static_cast<int64_t>(params_.finality_depth);

    auto confirmed = waiter_->until(
        [&]() -> outcome::result<bool> {
          BOOST_OUTCOME_TRY(auto confirmations,
                            anchor_watcher_->confirmationsOf(txid));
          SL_TRACE(logger_,
                   "Anchor {} has {}/{} confirmations",
                   txid,
                   confirmations,
                   depth);
          return confirmations >= depth;
        },
        options);
    if (confirmed.has_error()) {
      return FinalityError::ANCHOR_NOT_CONFIRMED;
    }
    return awaitFinalization(idx);
  }

  outcome::result<void> CheckpointFinality::awaitFinalization(
      CheckpointIdx idx) {
    const auto to_finalize = records_.at(idx).l2_blockid;
    bool regressed = false;
    auto finalized = waiter_->until(
        [&]() -> outcome::result<bool> {
          auto status_res = observeSyncStatus();
          if (status_res.has_error()) {
            if (status_res.error() == FinalityError::FINALITY_REGRESSED) {
              // stop polling, regression is not transient
              regressed = true;
              return true;
            }
            return status_res.error();
          }
          return status_res.value().finalized_block_id == to_finalize;
        },
        {
            .error_with = "Block not finalized",
            .timeout = kFinalizationTimeout,
        });
    if (regressed) {
      return FinalityError::FINALITY_REGRESSED;
    }
    if (finalized.has_error()) {
      return FinalityError::FINALIZATION_TIMED_OUT;
    }
    advance(idx, CheckpointState::Finalized);
    SL_INFO(logger_, "Checkpoint {} is finalized", idx);
    return outcome::success();
  }

  outcome::result<SyncStatus> CheckpointFinality::observeSyncStatus() {
    BOOST_OUTCOME_TRY(auto status, sequencer_->syncStatus());
    const auto &finalized = status.finalized_block_id;
    if (finalized == last_finalized_) {
      return status;
    }
    if (not finalized.has_value()) {
      SL_ERROR(logger_,
               "Finalized block {} disappeared from sync status",
               last_finalized_->toHex());
      return FinalityError::FINALITY_REGRESSED;
    }

    BOOST_OUTCOME_TRY(auto finalized_idx, checkpointIdxOf(finalized.value()));
    if (finalized_idx.has_value() and last_finalized_idx_.has_value()
        and finalized_idx.value() < last_finalized_idx_.value()) {
      SL_ERROR(logger_,
               "Finalized block went back from checkpoint {} to {}",
               last_finalized_idx_.value(),
               finalized_idx.value());
      return FinalityError::FINALITY_REGRESSED;
    }

    last_finalized_ = finalized;
    if (finalized_idx.has_value()) {
      last_finalized_idx_ = finalized_idx;
    }
    return status;
  }

  outcome::result<std::optional<CheckpointIdx>>
  CheckpointFinality::checkpointIdxOf(const L2BlockId &block) {
    for (auto &[idx, record] : records_) {
      if (record.l2_blockid == block) {
        return idx;
      }
    }
    auto key = block.toHex();
    if (auto it = known_blocks_.find(key); it != known_blocks_.end()) {
      return it->second;
    }
    while (true) {
      BOOST_OUTCOME_TRY(auto info,
                        sequencer_->getCheckpointInfo(next_unscanned_));
      if (not info.has_value()) {
        // not a checkpoint block, or its checkpoint is not created yet
        return std::nullopt;
      }
      auto idx = next_unscanned_++;
      auto info_key = info->l2_blockid.toHex();
      known_blocks_.emplace(info_key, idx);
      if (info_key == key) {
        return idx;
      }
    }
  }

  std::optional<CheckpointState> CheckpointFinality::checkpointState(
      CheckpointIdx idx) const {
    auto it = records_.find(idx);
    if (it == records_.end()) {
      return std::nullopt;
    }
    return it->second.state;
  }

  void CheckpointFinality::advance(CheckpointIdx idx, CheckpointState state) {
    auto &record = records_[idx];
    if (state <= record.state) {
      return;
    }
    SL_DEBUG(logger_,
             "Checkpoint {}: {} -> {}",
             idx,
             record.state,
             state);
    record.state = state;
  }
}  // namespace anchorwatch
