/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/anchor_watcher.hpp"

#include "rpc/l1_client.hpp"
#include "rpc/sequencer_api.hpp"

namespace anchorwatch {
  AnchorWatcher::AnchorWatcher(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<rpc::SequencerApi> sequencer,
      qtils::SharedRef<rpc::L1Client> l1)
      : logger_{logging_system->getLogger("AnchorWatcher", "finality")},
        sequencer_{std::move(sequencer)},
        l1_{std::move(l1)} {}

  outcome::result<std::optional<L1Txid>> AnchorWatcher::currentTxid() const {
    BOOST_OUTCOME_TRY(auto status, sequencer_->l1Status());
    return std::move(status.last_published_txid);
  }

  outcome::result<int64_t> AnchorWatcher::confirmationsOf(
      const L1Txid &txid) const {
    BOOST_OUTCOME_TRY(auto tx, l1_->getTransaction(txid));
    return tx.confirmations;
  }

  outcome::result<void> AnchorWatcher::remember() {
    BOOST_OUTCOME_TRY(remembered_, currentTxid());
    SL_DEBUG(logger_,
             "Last published txid: {}",
             remembered_.value_or("<none>"));
    return outcome::success();
  }

  outcome::result<std::optional<L1Txid>> AnchorWatcher::newTxid() const {
    BOOST_OUTCOME_TRY(auto current, currentTxid());
    if (current.has_value() and current != remembered_) {
      return current;
    }
    return std::optional<L1Txid>{};
  }
}  // namespace anchorwatch
