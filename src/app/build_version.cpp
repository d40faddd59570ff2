/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef ANCHORWATCH_BUILD_VERSION
#define ANCHORWATCH_BUILD_VERSION "undefined"
#endif

namespace anchorwatch {
  const std::string &buildVersion() {
    static const std::string version{ANCHORWATCH_BUILD_VERSION};
    return version;
  }
}  // namespace anchorwatch
