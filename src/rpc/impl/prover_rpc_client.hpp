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
#include "rpc/prover_api.hpp"

namespace anchorwatch::app {
  class Configuration;
}  // namespace anchorwatch::app

namespace anchorwatch::rpc {
  class ProverRpcClient final : public ProverApi {
   public:
    /// @throws std::invalid_argument if no prover url is configured
    ProverRpcClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                    const app::Configuration &config);
    BOOST_DI_INJECT_TRAITS(qtils::SharedRef<anchorwatch::log::LoggingSystem>,
                           const anchorwatch::app::Configuration &);
    ProverRpcClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<RpcTransport> transport);

    outcome::result<std::optional<std::string>> getTaskStatus(
        const ProofTaskId &task_id) override;

   private:
    JsonRpcClient rpc_;
  };
}  // namespace anchorwatch::rpc
