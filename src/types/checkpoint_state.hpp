/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace anchorwatch {
  /**
   * Lifecycle of a checkpoint batch. Values are ordered, a batch only ever
   * moves to a greater state.
   */
  enum class CheckpointState : uint8_t {
    Pending,
    ProofSubmitted,
    Anchored,
    Finalized,
  };

  inline std::string_view toString(CheckpointState state) {
    switch (state) {
      case CheckpointState::Pending:
        return "Pending";
      case CheckpointState::ProofSubmitted:
        return "ProofSubmitted";
      case CheckpointState::Anchored:
        return "Anchored";
      case CheckpointState::Finalized:
        return "Finalized";
    }
    return "Unknown";
  }
}  // namespace anchorwatch

template <>
struct fmt::formatter<anchorwatch::CheckpointState>
    : fmt::formatter<std::string_view> {
  auto format(anchorwatch::CheckpointState state, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(anchorwatch::toString(state),
                                                    ctx);
  }
};
