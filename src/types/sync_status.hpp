/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>

#include "serde/json_fwd.hpp"
#include "types/checkpoint_info.hpp"

namespace anchorwatch {
  /**
   * Sequencer view of the L2 chain.
   */
  struct SyncStatus {
    uint64_t tip_height = 0;
    L2BlockId tip_block_id;
    /// Absent until the first checkpoint is finalized
    std::optional<L2BlockId> finalized_block_id;

    JSON_FIELDS(tip_height, tip_block_id, finalized_block_id);
  };
}  // namespace anchorwatch
