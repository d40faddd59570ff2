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
#include "rpc/l1_client.hpp"

namespace anchorwatch::app {
  class Configuration;
}  // namespace anchorwatch::app

namespace anchorwatch::rpc {
  /**
   * L1Client over bitcoind's wallet JSON-RPC, authenticated with the
   * configured rpc user and password.
   */
  class BitcoindRpcClient final : public L1Client {
   public:
    BitcoindRpcClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                      const app::Configuration &config);
    BOOST_DI_INJECT_TRAITS(qtils::SharedRef<anchorwatch::log::LoggingSystem>,
                           const anchorwatch::app::Configuration &);
    BitcoindRpcClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                      qtils::SharedRef<RpcTransport> transport);

    outcome::result<std::string> getNewAddress() override;
    outcome::result<std::vector<L1BlockHash>> generateToAddress(
        uint64_t count, const std::string &address) override;
    outcome::result<WalletTransaction> getTransaction(
        const L1Txid &txid) override;
    outcome::result<FundedPsbt> walletCreateFundedPsbt(
        const PsbtOutputs &outputs, const PsbtOptions &options) override;
    outcome::result<ProcessedPsbt> walletProcessPsbt(
        const std::string &psbt) override;
    outcome::result<FinalizedPsbt> finalizePsbt(
        const std::string &psbt) override;
    outcome::result<L1Txid> sendRawTransaction(const std::string &hex) override;

   private:
    JsonRpcClient rpc_;
  };
}  // namespace anchorwatch::rpc
