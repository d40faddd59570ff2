/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/impl/prover_rpc_client.hpp"

#include <stdexcept>

#include "app/configuration.hpp"
#include "rpc/impl/http_rpc_transport.hpp"

namespace anchorwatch::rpc {
  namespace {
    const std::string &proverUrl(const app::Configuration &config) {
      if (not config.proverUrl().has_value()) {
        throw std::invalid_argument{"Prover url is not configured"};
      }
      return config.proverUrl().value();
    }
  }  // namespace

  ProverRpcClient::ProverRpcClient(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const app::Configuration &config)
      : ProverRpcClient{logging_system,
                        std::make_shared<HttpRpcTransport>(
                            logging_system->getLogger("ProverHttp", "rpc"),
                            proverUrl(config))} {}

  ProverRpcClient::ProverRpcClient(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<RpcTransport> transport)
      : rpc_{logging_system->getLogger("ProverRpc", "rpc"),
             std::move(transport)} {}

  outcome::result<std::optional<std::string>> ProverRpcClient::getTaskStatus(
      const ProofTaskId &task_id) {
    return rpc_.call<std::optional<std::string>>("dev_strata_getTaskStatus",
                                                 task_id);
  }
}  // namespace anchorwatch::rpc
