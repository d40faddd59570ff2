/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "serde/json_fwd.hpp"

namespace anchorwatch {
  /// Hex encoded bitcoin transaction id
  using L1Txid = std::string;

  /**
   * Sequencer view of the L1 chain and of its own inscriptions on it.
   */
  struct L1Status {
    bool bitcoin_rpc_connected = false;
    uint64_t cur_height = 0;
    std::optional<L1Txid> last_published_txid;
    uint64_t published_inscription_count = 0;

    JSON_FIELDS(bitcoin_rpc_connected,
                cur_height,
                last_published_txid,
                published_inscription_count);
  };
}  // namespace anchorwatch
