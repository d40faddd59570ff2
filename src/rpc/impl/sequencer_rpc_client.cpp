/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/impl/sequencer_rpc_client.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "app/configuration.hpp"
#include "rpc/impl/http_rpc_transport.hpp"

namespace anchorwatch::rpc {
  SequencerRpcClient::SequencerRpcClient(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const app::Configuration &config)
      : SequencerRpcClient{
            logging_system,
            std::make_shared<HttpRpcTransport>(
                logging_system->getLogger("SequencerHttp", "rpc"),
                config.sequencerUrl())} {}

  SequencerRpcClient::SequencerRpcClient(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<RpcTransport> transport)
      : rpc_{logging_system->getLogger("SequencerRpc", "rpc"),
             std::move(transport)} {}

  outcome::result<SyncStatus> SequencerRpcClient::syncStatus() {
    return rpc_.call<SyncStatus>("strata_syncStatus");
  }

  outcome::result<std::optional<CheckpointInfo>>
  SequencerRpcClient::getCheckpointInfo(CheckpointIdx idx) {
    return rpc_.call<std::optional<CheckpointInfo>>("strata_getCheckpointInfo",
                                                    idx);
  }

  outcome::result<void> SequencerRpcClient::submitCheckpointProof(
      CheckpointIdx idx, qtils::BytesIn proof) {
    auto proof_hex = fmt::format("{:02x}", fmt::join(proof, ""));
    BOOST_OUTCOME_TRY(rpc_.call<json::Ignore>(
        "strataadmin_submitCheckpointProof", idx, proof_hex));
    return outcome::success();
  }

  outcome::result<L1Status> SequencerRpcClient::l1Status() {
    return rpc_.call<L1Status>("strata_l1status");
  }

  outcome::result<uint64_t> SequencerRpcClient::protocolVersion() {
    return rpc_.call<uint64_t>("strata_protocolVersion");
  }

  outcome::result<OperatorPubkeyMap>
  SequencerRpcClient::activeOperatorPubkeys() {
    return rpc_.call<OperatorPubkeyMap>(
        "strata_getActiveOperatorChainPubkeySet");
  }
}  // namespace anchorwatch::rpc
