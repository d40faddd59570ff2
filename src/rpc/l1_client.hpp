/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <qtils/outcome.hpp>

#include "types/l1_types.hpp"

namespace anchorwatch::rpc {
  /**
   * Wallet and mining calls of the bitcoin node.
   */
  class L1Client {
   public:
    virtual ~L1Client() = default;

    virtual outcome::result<std::string> getNewAddress() = 0;

    virtual outcome::result<std::vector<L1BlockHash>> generateToAddress(
        uint64_t count, const std::string &address) = 0;

    virtual outcome::result<WalletTransaction> getTransaction(
        const L1Txid &txid) = 0;

    virtual outcome::result<FundedPsbt> walletCreateFundedPsbt(
        const PsbtOutputs &outputs, const PsbtOptions &options) = 0;

    virtual outcome::result<ProcessedPsbt> walletProcessPsbt(
        const std::string &psbt) = 0;

    virtual outcome::result<FinalizedPsbt> finalizePsbt(
        const std::string &psbt) = 0;

    virtual outcome::result<L1Txid> sendRawTransaction(
        const std::string &hex) = 0;
  };
}  // namespace anchorwatch::rpc
