/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/l1_types.hpp"
#include "utils/ctor_limiters.hpp"

namespace anchorwatch::rpc {
  class L1Client;
}  // namespace anchorwatch::rpc

namespace anchorwatch {
  /**
   * Mines L1 blocks on demand or periodically in the background.
   *
   * Generation failures never propagate: the background loop logs and ends,
   * `generateNBlocks` logs and returns nothing.
   */
  class BlockGenerator : NonCopyable, NonMovable {
   public:
    BlockGenerator(qtils::SharedRef<log::LoggingSystem> logging_system,
                   qtils::SharedRef<rpc::L1Client> l1);
    ~BlockGenerator();

    /**
     * Starts the loop: sleep `wait`, mine one block to `address`, repeat.
     * @throws std::logic_error if the loop is already running
     */
    void start(std::chrono::milliseconds wait, std::string address);

    /// Signals the loop and joins it, no-op if not started
    void stop();

    bool isRunning() const {
      return running_.load();
    }

    /// Blocks mined by the background loop so far
    uint64_t generatedCount() const {
      return generated_.load();
    }

    /// Mines `n` blocks to a fresh wallet address
    std::vector<L1BlockHash> generateNBlocks(uint64_t n);

   private:
    void run(std::chrono::milliseconds wait, const std::string &address);

    log::Logger logger_;
    qtils::SharedRef<rpc::L1Client> l1_;

    std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
    std::atomic_bool running_ = false;
    std::atomic_uint64_t generated_ = 0;
    std::thread thread_;
  };
}  // namespace anchorwatch
