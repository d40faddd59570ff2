/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "prover/proof_task_waiter.hpp"

#include "utils/wait_until.hpp"

namespace anchorwatch {
  ProofTaskWaiter::ProofTaskWaiter(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<rpc::ProverApi> prover,
      qtils::SharedRef<clock::SteadyClock> clock,
      qtils::SharedRef<clock::Sleeper> sleeper)
      : logger_{logging_system->getLogger("ProofTaskWaiter", "rpc")},
        prover_{std::move(prover)},
        clock_{std::move(clock)},
        sleeper_{std::move(sleeper)} {}

  outcome::result<void> ProofTaskWaiter::waitForProof(
      const rpc::ProofTaskId &task_id, std::chrono::seconds timeout) const {
    const auto start = clock_->now();
    while (true) {
      BOOST_OUTCOME_TRY(auto status, prover_->getTaskStatus(task_id));
      if (not status.has_value()) {
        SL_ERROR(logger_, "No status for proof task {}", task_id);
        return ProverError::PROOF_STATUS_MISSING;
      }
      SL_DEBUG(logger_, "Got the proof status {}", status.value());
      if (status.value() == kCompleted) {
        SL_INFO(logger_, "Completed the proof generation for {}", task_id);
        return outcome::success();
      }

      sleeper_->sleepFor(kPollInterval);
      if (clock_->now() - start >= timeout) {
        SL_WARN(logger_,
                "Operation timed out after {} seconds.",
                timeout.count());
        return WaitError::TIMED_OUT;
      }
    }
  }
}  // namespace anchorwatch
