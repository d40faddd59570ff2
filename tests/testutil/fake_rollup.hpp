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
#include <vector>

#include <fmt/format.h>
#include <qtils/shared_ref.hpp>

#include "mock/clock/manual_clock.hpp"
#include "rpc/l1_client.hpp"
#include "rpc/rpc_error.hpp"
#include "rpc/sequencer_api.hpp"

namespace testutil {
  using anchorwatch::CheckpointIdx;
  using anchorwatch::CheckpointInfo;
  using anchorwatch::L1Txid;
  using anchorwatch::L2BlockId;

  /**
   * In-memory sequencer and bitcoin node.
   *
   * Checkpoint `idx + 1` is created once the proof of `idx` is published.
   * A proof is published either on explicit submission or, when a proof
   * timeout is set, by the sequencer itself once the timeout has elapsed
   * since the checkpoint was created. The anchor transaction is mined in the
   * next generated block; a checkpoint is finalized when its anchor has
   * `finality_depth` confirmations.
   */
  class FakeRollup : public anchorwatch::rpc::SequencerApi,
                     public anchorwatch::rpc::L1Client {
   public:
    struct Batch {
      CheckpointInfo info;
      std::chrono::milliseconds created_at;
      std::optional<L1Txid> anchor_txid;
      size_t proof_size = 0;
    };

    struct Tx {
      std::optional<uint64_t> mined_height;
    };

    FakeRollup(qtils::SharedRef<anchorwatch::clock::ManualClock> clock,
               uint64_t finality_depth)
        : clock_{std::move(clock)}, finality_depth_{finality_depth} {}

    // Test controls

    CheckpointIdx addCheckpoint() {
      CheckpointIdx idx = batches_.size();
      CheckpointInfo info{
          .idx = idx,
          .l1_range = {idx * 10, idx * 10 + 9},
          .l2_range = {idx * 64, idx * 64 + 63},
          .l2_blockid = blockIdOf(idx),
      };
      batches_.push_back(Batch{
          .info = info,
          .created_at = clock_->nowMsec(),
          .anchor_txid = std::nullopt,
      });
      return idx;
    }

    static L2BlockId blockIdOf(CheckpointIdx idx) {
      L2BlockId id;
      id.fill(0);
      id[0] = 0xb1;
      id[31] = static_cast<uint8_t>(idx + 1);
      return id;
    }

    void setProofTimeout(std::optional<std::chrono::seconds> timeout) {
      proof_timeout_ = timeout;
    }

    /// Mines one block whenever an anchor transaction is queried
    void setAmbientMining(bool enabled) {
      ambient_mining_ = enabled;
    }

    /// Finalized block reported regardless of confirmations
    void overrideFinalized(std::optional<std::optional<L2BlockId>> finalized) {
      finalized_override_ = std::move(finalized);
    }

    void setOperators(anchorwatch::rpc::OperatorPubkeyMap operators) {
      operators_ = std::move(operators);
    }

    void setStarted(bool started) {
      started_ = started;
    }

    /// Drops publication of new proofs to L1
    void setPublishing(bool enabled) {
      publishing_ = enabled;
    }

    const std::vector<Batch> &batches() const {
      return batches_;
    }

    uint64_t height() const {
      return height_;
    }

    size_t submissions() const {
      return submissions_;
    }

    // SequencerApi

    outcome::result<anchorwatch::SyncStatus> syncStatus() override {
      publishTimedOut();
      anchorwatch::SyncStatus status{
          .tip_height = height_,
          .tip_block_id = blockIdOf(batches_.size()),
          .finalized_block_id = std::nullopt,
      };
      if (finalized_override_.has_value()) {
        status.finalized_block_id = finalized_override_.value();
        return status;
      }
      for (auto &batch : batches_) {
        if (batch.anchor_txid.has_value()
            and confirmations(batch.anchor_txid.value())
                    >= static_cast<int64_t>(finality_depth_)) {
          status.finalized_block_id = batch.info.l2_blockid;
        }
      }
      return status;
    }

    outcome::result<std::optional<CheckpointInfo>> getCheckpointInfo(
        CheckpointIdx idx) override {
      publishTimedOut();
      if (idx >= batches_.size()) {
        return std::nullopt;
      }
      return batches_.at(idx).info;
    }

    outcome::result<void> submitCheckpointProof(
        CheckpointIdx idx, qtils::BytesIn proof) override {
      ++submissions_;
      if (idx >= batches_.size()) {
        return anchorwatch::rpc::RpcError::CHECKPOINT_DOES_NOT_EXIST;
      }
      batches_.at(idx).proof_size = proof.size();
      publish(idx);
      return outcome::success();
    }

    outcome::result<anchorwatch::L1Status> l1Status() override {
      publishTimedOut();
      return anchorwatch::L1Status{
          .bitcoin_rpc_connected = true,
          .cur_height = height_,
          .last_published_txid = last_published_,
          .published_inscription_count = txs_.size(),
      };
    }

    outcome::result<uint64_t> protocolVersion() override {
      if (not started_) {
        return anchorwatch::rpc::RpcError::TRANSPORT;
      }
      return 1;
    }

    outcome::result<anchorwatch::rpc::OperatorPubkeyMap> activeOperatorPubkeys()
        override {
      return operators_;
    }

    // L1Client

    outcome::result<std::string> getNewAddress() override {
      return fmt::format("bcrt1qfake{}", addresses_++);
    }

    outcome::result<std::vector<anchorwatch::L1BlockHash>> generateToAddress(
        uint64_t count, const std::string &) override {
      std::vector<anchorwatch::L1BlockHash> hashes;
      for (uint64_t i = 0; i < count; ++i) {
        mine();
        hashes.emplace_back(fmt::format("{:064x}", height_));
      }
      return hashes;
    }

    outcome::result<anchorwatch::WalletTransaction> getTransaction(
        const L1Txid &txid) override {
      if (not txs_.contains(txid)) {
        return anchorwatch::rpc::RpcError::SERVER_ERROR;
      }
      if (ambient_mining_) {
        mine();
      }
      return anchorwatch::WalletTransaction{
          .txid = txid,
          .confirmations = confirmations(txid),
          .blockhash = std::nullopt,
      };
    }

    outcome::result<anchorwatch::FundedPsbt> walletCreateFundedPsbt(
        const anchorwatch::PsbtOutputs &,
        const anchorwatch::PsbtOptions &) override {
      return anchorwatch::rpc::RpcError::UNIMPLEMENTED;
    }

    outcome::result<anchorwatch::ProcessedPsbt> walletProcessPsbt(
        const std::string &) override {
      return anchorwatch::rpc::RpcError::UNIMPLEMENTED;
    }

    outcome::result<anchorwatch::FinalizedPsbt> finalizePsbt(
        const std::string &) override {
      return anchorwatch::rpc::RpcError::UNIMPLEMENTED;
    }

    outcome::result<L1Txid> sendRawTransaction(const std::string &) override {
      return anchorwatch::rpc::RpcError::UNIMPLEMENTED;
    }

   private:
    void publish(CheckpointIdx idx) {
      if (not publishing_) {
        return;
      }
      auto &batch = batches_.at(idx);
      auto txid = fmt::format("{:064x}", 0xa0000 + txs_.size());
      txs_.emplace(txid, Tx{});
      batch.anchor_txid = txid;
      last_published_ = txid;
      if (idx + 1 == batches_.size()) {
        addCheckpoint();
      }
    }

    void publishTimedOut() {
      if (not proof_timeout_.has_value()) {
        return;
      }
      for (CheckpointIdx idx = 0; idx < batches_.size(); ++idx) {
        auto &batch = batches_.at(idx);
        if (not batch.anchor_txid.has_value()
            and clock_->nowMsec() >= batch.created_at + *proof_timeout_) {
          publish(idx);
        }
      }
    }

    void mine() {
      ++height_;
      for (auto &[txid, tx] : txs_) {
        if (not tx.mined_height.has_value()) {
          tx.mined_height = height_;
        }
      }
    }

    int64_t confirmations(const L1Txid &txid) const {
      auto &tx = txs_.at(txid);
      if (not tx.mined_height.has_value()) {
        return 0;
      }
      return static_cast<int64_t>(height_ - tx.mined_height.value() + 1);
    }

    qtils::SharedRef<anchorwatch::clock::ManualClock> clock_;
    uint64_t finality_depth_;
    std::optional<std::chrono::seconds> proof_timeout_;
    bool ambient_mining_ = false;
    bool started_ = true;
    bool publishing_ = true;
    std::optional<std::optional<L2BlockId>> finalized_override_;
    anchorwatch::rpc::OperatorPubkeyMap operators_;

    std::vector<Batch> batches_;
    std::map<L1Txid, Tx> txs_;
    std::optional<L1Txid> last_published_;
    uint64_t height_ = 100;
    size_t addresses_ = 0;
    size_t submissions_ = 0;
  };
}  // namespace testutil
