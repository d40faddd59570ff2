/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "serde/json_fwd.hpp"
#include "types/l1_status.hpp"

namespace anchorwatch {
  using L1BlockHash = std::string;

  struct WalletTransaction {
    L1Txid txid;
    /// Zero for mempool transactions, negative for conflicted ones
    int64_t confirmations = 0;
    std::optional<L1BlockHash> blockhash;

    JSON_FIELDS(txid, confirmations, blockhash);
  };

  /// Address to amount in BTC
  using PsbtOutput = std::unordered_map<std::string, double>;
  using PsbtOutputs = std::vector<PsbtOutput>;

  struct PsbtOptions {
    std::optional<std::string> change_address;
    std::optional<double> fee_rate;
    std::optional<bool> lock_unspents;

    JSON_FIELDS(change_address, fee_rate, lock_unspents);
  };

  struct FundedPsbt {
    std::string psbt;
    double fee = 0;
    int64_t changepos = -1;

    JSON_FIELDS(psbt, fee, changepos);
  };

  struct ProcessedPsbt {
    std::string psbt;
    bool complete = false;

    JSON_FIELDS(psbt, complete);
  };

  struct FinalizedPsbt {
    std::optional<std::string> hex;
    bool complete = false;

    JSON_FIELDS(hex, complete);
  };
}  // namespace anchorwatch
