/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <thread>

#include "clock/sleeper.hpp"

namespace anchorwatch::clock {

  class SleeperImpl final : public Sleeper {
   public:
    void sleepFor(std::chrono::milliseconds duration) override {
      std::this_thread::sleep_for(duration);
    }
  };

}  // namespace anchorwatch::clock
