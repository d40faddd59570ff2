/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/l1_status.hpp"

namespace anchorwatch::rpc {
  class SequencerApi;
  class L1Client;
}  // namespace anchorwatch::rpc

namespace anchorwatch {
  /**
   * Read-only view of the anchoring transactions the sequencer publishes on
   * L1. Keeps only the txid seen at the last `remember()` call, which lets
   * the caller notice that a new transaction appeared.
   */
  class AnchorWatcher {
   public:
    AnchorWatcher(qtils::SharedRef<log::LoggingSystem> logging_system,
                  qtils::SharedRef<rpc::SequencerApi> sequencer,
                  qtils::SharedRef<rpc::L1Client> l1);

    /// Last published anchoring txid, none before the first publication
    outcome::result<std::optional<L1Txid>> currentTxid() const;

    /// Confirmation depth of `txid`, zero while in mempool
    outcome::result<int64_t> confirmationsOf(const L1Txid &txid) const;

    /// Stores the current txid as the baseline for `newTxid()`
    outcome::result<void> remember();

    const std::optional<L1Txid> &remembered() const {
      return remembered_;
    }

    /// Current txid if it differs from the remembered one
    outcome::result<std::optional<L1Txid>> newTxid() const;

   private:
    log::Logger logger_;
    qtils::SharedRef<rpc::SequencerApi> sequencer_;
    qtils::SharedRef<rpc::L1Client> l1_;
    std::optional<L1Txid> remembered_;
  };
}  // namespace anchorwatch
