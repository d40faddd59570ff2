/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "clock/sleeper.hpp"
#include "log/logger.hpp"
#include "rpc/prover_api.hpp"

namespace anchorwatch {
  enum class ProverError : uint8_t {
    PROOF_STATUS_MISSING = 1,
  };
  Q_ENUM_ERROR_CODE(ProverError) {
    using E = decltype(e);
    switch (e) {
      case E::PROOF_STATUS_MISSING:
        return "Prover has no status for the task";
    }
    abort();
  }

  class ProofTaskWaiter {
   public:
    static constexpr std::chrono::seconds kPollInterval{2};
    static constexpr std::chrono::seconds kDefaultTimeout{3600};
    static constexpr std::string_view kCompleted = "Completed";

    ProofTaskWaiter(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<rpc::ProverApi> prover,
                    qtils::SharedRef<clock::SteadyClock> clock,
                    qtils::SharedRef<clock::Sleeper> sleeper);

    /**
     * Polls the task status every kPollInterval until it is "Completed".
     * Fails with WaitError::TIMED_OUT once `timeout` has elapsed.
     */
    outcome::result<void> waitForProof(
        const rpc::ProofTaskId &task_id,
        std::chrono::seconds timeout = kDefaultTimeout) const;

   private:
    log::Logger logger_;
    qtils::SharedRef<rpc::ProverApi> prover_;
    qtils::SharedRef<clock::SteadyClock> clock_;
    qtils::SharedRef<clock::Sleeper> sleeper_;
  };
}  // namespace anchorwatch
