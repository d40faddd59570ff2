/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "l1/block_generator.hpp"

#include <stdexcept>

#include <fmt/ranges.h>
#include <soralog/util.hpp>

#include "rpc/l1_client.hpp"

namespace anchorwatch {
  BlockGenerator::BlockGenerator(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<rpc::L1Client> l1)
      : logger_{logging_system->getLogger("BlockGenerator", "l1")},
        l1_{std::move(l1)} {}

  BlockGenerator::~BlockGenerator() {
    stop();
  }

  void BlockGenerator::start(std::chrono::milliseconds wait,
                             std::string address) {
    std::unique_lock lock{mutex_};
    if (thread_.joinable()) {
      if (running_) {
        throw std::logic_error{"Block generator is already started"};
      }
      // previous loop ended on a generation failure
      thread_.join();
    }
    stop_requested_ = false;
    running_ = true;
    SL_INFO(logger_,
            "Generating a block every {}ms to {}",
            wait.count(),
            address);
    thread_ = std::thread{[this, wait, address{std::move(address)}] {
      soralog::util::setThreadName("block-gen");
      run(wait, address);
    }};
  }

  void BlockGenerator::stop() {
    {
      std::unique_lock lock{mutex_};
      stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (thread_.joinable() and thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  void BlockGenerator::run(std::chrono::milliseconds wait,
                           const std::string &address) {
    std::unique_lock lock{mutex_};
    while (true) {
      if (stop_cv_.wait_for(lock, wait, [this] { return stop_requested_; })) {
        SL_DEBUG(logger_, "Block generation stopped");
        running_ = false;
        return;
      }
      // start() and stop() wait for an in-flight generation
      auto res = l1_->generateToAddress(1, address);
      if (res.has_error()) {
        SL_WARN(logger_,
                "{} while generating to address {}",
                res.error(),
                address);
        running_ = false;
        return;
      }
      generated_.fetch_add(1);
    }
  }

  std::vector<L1BlockHash> BlockGenerator::generateNBlocks(uint64_t n) {
    auto address_res = l1_->getNewAddress();
    if (address_res.has_error()) {
      SL_WARN(logger_, "{} while getting new address", address_res.error());
      return {};
    }
    auto &address = address_res.value();
    SL_INFO(logger_, "Generating {} blocks to address {}", n, address);
    auto blocks_res = l1_->generateToAddress(n, address);
    if (blocks_res.has_error()) {
      SL_WARN(logger_, "{} while generating address", blocks_res.error());
      return {};
    }
    SL_DEBUG(logger_, "Made blocks {}", fmt::join(blocks_res.value(), ", "));
    return std::move(blocks_res.value());
  }
}  // namespace anchorwatch
