/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "rpc/prover_api.hpp"

namespace anchorwatch::rpc {

  class ProverApiMock : public ProverApi {
   public:
    MOCK_METHOD(outcome::result<std::optional<std::string>>,
                getTaskStatus,
                (const ProofTaskId &),
                (override));
  };

}  // namespace anchorwatch::rpc
