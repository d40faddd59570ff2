/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <qtils/outcome.hpp>

namespace anchorwatch::rpc {
  using ProofTaskId = std::string;

  class ProverApi {
   public:
    virtual ~ProverApi() = default;

    /// Status string such as "Pending" or "Completed", empty if unknown
    virtual outcome::result<std::optional<std::string>> getTaskStatus(
        const ProofTaskId &task_id) = 0;
  };
}  // namespace anchorwatch::rpc
