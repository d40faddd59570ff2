/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/impl/bitcoind_rpc_client.hpp"

#include "app/configuration.hpp"
#include "rpc/impl/http_rpc_transport.hpp"

namespace anchorwatch::rpc {
  namespace {
    std::optional<std::string> credentials(const app::Configuration &config) {
      auto &bitcoin = config.bitcoin();
      if (bitcoin.user.empty()) {
        return std::nullopt;
      }
      return bitcoin.user + ":" + bitcoin.password;
    }
  }  // namespace

  BitcoindRpcClient::BitcoindRpcClient(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const app::Configuration &config)
      : BitcoindRpcClient{logging_system,
                          std::make_shared<HttpRpcTransport>(
                              logging_system->getLogger("BitcoindHttp", "rpc"),
                              config.bitcoin().url,
                              credentials(config))} {}

  BitcoindRpcClient::BitcoindRpcClient(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<RpcTransport> transport)
      : rpc_{logging_system->getLogger("BitcoindRpc", "rpc"),
             std::move(transport)} {}

  outcome::result<std::string> BitcoindRpcClient::getNewAddress() {
    return rpc_.call<std::string>("getnewaddress");
  }

  outcome::result<std::vector<L1BlockHash>>
  BitcoindRpcClient::generateToAddress(uint64_t count,
                                       const std::string &address) {
    return rpc_.call<std::vector<L1BlockHash>>(
        "generatetoaddress", count, address);
  }

  outcome::result<WalletTransaction> BitcoindRpcClient::getTransaction(
      const L1Txid &txid) {
    return rpc_.call<WalletTransaction>("gettransaction", txid);
  }

  outcome::result<FundedPsbt> BitcoindRpcClient::walletCreateFundedPsbt(
      const PsbtOutputs &outputs, const PsbtOptions &options) {
    // no explicit inputs, the wallet selects coins; zero locktime
    const std::vector<std::string> inputs;
    return rpc_.call<FundedPsbt>(
        "walletcreatefundedpsbt", inputs, outputs, 0, options);
  }

  outcome::result<ProcessedPsbt> BitcoindRpcClient::walletProcessPsbt(
      const std::string &psbt) {
    return rpc_.call<ProcessedPsbt>("walletprocesspsbt", psbt);
  }

  outcome::result<FinalizedPsbt> BitcoindRpcClient::finalizePsbt(
      const std::string &psbt) {
    return rpc_.call<FinalizedPsbt>("finalizepsbt", psbt);
  }

  outcome::result<L1Txid> BitcoindRpcClient::sendRawTransaction(
      const std::string &hex) {
    return rpc_.call<L1Txid>("sendrawtransaction", hex);
  }
}  // namespace anchorwatch::rpc
