/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>
#include <utils/ctor_limiters.hpp>

namespace anchorwatch::app {

  /// @class Application - checks finality of configured checkpoints
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Runs checks, stops at the first failed one
    virtual outcome::result<void> run() = 0;
  };

}  // namespace anchorwatch::app
