/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <utility>

#include <qtils/byte_arr.hpp>

#include "serde/json_fwd.hpp"

namespace anchorwatch {
  using CheckpointIdx = uint64_t;

  using L2BlockId = qtils::ByteArr<32>;

  /// Inclusive [first, last] block heights
  using HeightRange = std::pair<uint64_t, uint64_t>;

  /**
   * Summary of one L2 batch as reported by the sequencer.
   */
  struct CheckpointInfo {
    CheckpointIdx idx = 0;
    HeightRange l1_range;
    HeightRange l2_range;
    L2BlockId l2_blockid;

    JSON_FIELDS(idx, l1_range, l2_range, l2_blockid);

    bool operator==(const CheckpointInfo &) const = default;
  };
}  // namespace anchorwatch
