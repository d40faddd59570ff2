/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace anchorwatch::clock {

  /**
   * Suspends the calling thread. Every blocking wait goes through this
   * interface, so that tests are able to replace real sleeping with a manual
   * clock.
   */
  class Sleeper {
   public:
    virtual ~Sleeper() = default;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
  };

}  // namespace anchorwatch::clock
