/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace anchorwatch::clock {

  /**
   * An interface for a clock
   * @tparam clock type is an underlying clock type, such as std::steady_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    /**
     * Difference between two time points
     */
    using Duration = typename ClockType::duration;

    /**
     * A moment in time
     */
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    [[nodiscard]] virtual TimePoint now() const = 0;

    /**
     * @return number of seconds since the clock's epoch
     */
    [[nodiscard]] virtual uint64_t nowSec() const = 0;

    /**
     * @return number of milliseconds since the clock's epoch
     */
    [[nodiscard]] virtual std::chrono::milliseconds nowMsec() const = 0;
  };

  /**
   * SteadyClock alias over Clock. Should be used when we need to measure
   * interval between two moments in time
   */
  class SteadyClock : public virtual Clock<std::chrono::steady_clock> {};

}  // namespace anchorwatch::clock
