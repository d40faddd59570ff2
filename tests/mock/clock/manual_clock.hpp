/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "clock/clock.hpp"
#include "clock/sleeper.hpp"

namespace anchorwatch::clock {

  /**
   * Steady clock whose time moves only when someone sleeps on it.
   * Every requested sleep is recorded, so tests can inspect the waits.
   */
  class ManualClock : public SteadyClock, public Sleeper {
   public:
    ManualClock() = default;

    explicit ManualClock(std::chrono::milliseconds initial_time)
        : current_time_(initial_time) {}

    TimePoint now() const override {
      return TimePoint(current_time_);
    }

    uint64_t nowSec() const override {
      return std::chrono::duration_cast<std::chrono::seconds>(current_time_)
          .count();
    }

    std::chrono::milliseconds nowMsec() const override {
      return current_time_;
    }

    void sleepFor(std::chrono::milliseconds duration) override {
      sleeps_.push_back(duration);
      advance(duration);
    }

    /**
     * Advance the mock time by the specified duration
     */
    void advance(std::chrono::milliseconds duration) {
      current_time_ += duration;
    }

    const std::vector<std::chrono::milliseconds> &sleeps() const {
      return sleeps_;
    }

    /// Sum of all recorded sleeps
    std::chrono::milliseconds slept() const {
      std::chrono::milliseconds total{0};
      for (auto &sleep : sleeps_) {
        total += sleep;
      }
      return total;
    }

   private:
    std::chrono::milliseconds current_time_{0};
    std::vector<std::chrono::milliseconds> sleeps_;
  };

}  // namespace anchorwatch::clock
