/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

namespace anchorwatch {
  /**
   * Finality is driven by mining blocks explicitly instead of waiting for
   * them to arrive.
   */
  struct ManualGenConfig {
    uint64_t finality_depth = 0;
    std::string gen_addr;
  };
}  // namespace anchorwatch
