/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <type_traits>

namespace anchorwatch {
  auto ceilDiv(const std::integral auto &l, const std::integral auto &r) {
    return (l + r - 1) / r;
  }

  /// Number of whole `step`s needed to cover `total`, rounded up
  template <typename Rep1, typename Period1, typename Rep2, typename Period2>
  uint64_t ceilDiv(std::chrono::duration<Rep1, Period1> total,
                   std::chrono::duration<Rep2, Period2> step) {
    using Common = std::common_type_t<decltype(total), decltype(step)>;
    const auto t = std::chrono::duration_cast<Common>(total).count();
    const auto s = std::chrono::duration_cast<Common>(step).count();
    if (t <= 0 or s <= 0) {
      return 0;
    }
    return static_cast<uint64_t>(ceilDiv(t, s));
  }
}  // namespace anchorwatch
