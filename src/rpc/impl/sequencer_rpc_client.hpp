/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/di.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "rpc/json_rpc_client.hpp"
#include "rpc/sequencer_api.hpp"

namespace anchorwatch::app {
  class Configuration;
}  // namespace anchorwatch::app

namespace anchorwatch::rpc {
  /**
   * SequencerApi over the sequencer's JSON-RPC interface
   * (`strata_*` and `strataadmin_*` methods).
   */
  class SequencerRpcClient final : public SequencerApi {
   public:
    SequencerRpcClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                       const app::Configuration &config);
    BOOST_DI_INJECT_TRAITS(qtils::SharedRef<anchorwatch::log::LoggingSystem>,
                           const anchorwatch::app::Configuration &);
    SequencerRpcClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                       qtils::SharedRef<RpcTransport> transport);

    outcome::result<SyncStatus> syncStatus() override;
    outcome::result<std::optional<CheckpointInfo>> getCheckpointInfo(
        CheckpointIdx idx) override;
    outcome::result<void> submitCheckpointProof(CheckpointIdx idx,
                                                qtils::BytesIn proof) override;
    outcome::result<L1Status> l1Status() override;
    outcome::result<uint64_t> protocolVersion() override;
    outcome::result<OperatorPubkeyMap> activeOperatorPubkeys() override;

   private:
    JsonRpcClient rpc_;
  };
}  // namespace anchorwatch::rpc
