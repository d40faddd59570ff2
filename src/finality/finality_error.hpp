/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace anchorwatch {
  /**
   * Fatal outcomes of a checkpoint finality check. Descriptions are the
   * diagnostics reported to the operator.
   */
  enum class FinalityError : uint8_t {
    CHECKPOINT_INFO_UNAVAILABLE = 1,
    PREMATURELY_FINALIZED,
    INDEX_MISMATCH,
    NEXT_CHECKPOINT_EXISTS,
    ANCHOR_NOT_OBSERVED,
    ANCHOR_NOT_CONFIRMED,
    FINALIZATION_TIMED_OUT,
    FINALITY_REGRESSED,
    UNEXPECTED_SUCCESS,
  };
  Q_ENUM_ERROR_CODE(FinalityError) {
    using E = decltype(e);
    switch (e) {
      case E::CHECKPOINT_INFO_UNAVAILABLE:
        return "Could not find checkpoint info";
      case E::PREMATURELY_FINALIZED:
        return "Checkpoint block should not yet finalize";
      case E::INDEX_MISMATCH:
        return "Checkpoint info has unexpected index";
      case E::NEXT_CHECKPOINT_EXISTS:
        return "There should be no checkpoint info for the next index";
      case E::ANCHOR_NOT_OBSERVED:
        return "Proof was not published to bitcoin";
      case E::ANCHOR_NOT_CONFIRMED:
        return "Published inscription not confirmed";
      case E::FINALIZATION_TIMED_OUT:
        return "Block not finalized";
      case E::FINALITY_REGRESSED:
        return "Finalized block moved back to an earlier checkpoint";
      case E::UNEXPECTED_SUCCESS:
        return "Expected rpc error";
    }
    abort();
  }
}  // namespace anchorwatch
