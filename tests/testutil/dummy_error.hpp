/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace testutil {
  /**
   * Error with no meaning of its own, returned by probes and fake transports
   * to simulate a failure unrelated to the code under test.
   */
  enum class DummyError { ERROR = 1, ERROR_2 };
  Q_ENUM_ERROR_CODE(DummyError) {
    using E = decltype(e);
    switch (e) {
      case E::ERROR:
        return "dummy error";
      case E::ERROR_2:
        return "dummy error #2";
    }
    abort();
  }
}  // namespace testutil
