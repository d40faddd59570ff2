/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace anchorwatch {
  constexpr uint64_t kDefaultBlockTimeSec = 1;
  constexpr uint64_t kDefaultEpochSlots = 64;
  constexpr uint64_t kDefaultGenesisTriggerHeight = 5;

  /**
   * Settings passed to the parameter tool when generating rollup params.
   */
  struct RollupParamsSettings {
    uint64_t block_time_sec = 0;
    uint64_t epoch_slots = 0;
    uint64_t genesis_trigger_height = 0;
    std::optional<std::chrono::seconds> proof_timeout;

    static RollupParamsSettings newDefault() {
      return {
          .block_time_sec = kDefaultBlockTimeSec,
          .epoch_slots = kDefaultEpochSlots,
          .genesis_trigger_height = kDefaultGenesisTriggerHeight,
          .proof_timeout = std::nullopt,
      };
    }
  };
}  // namespace anchorwatch
