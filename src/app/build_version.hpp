/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace anchorwatch {
  /// Version string assigned at configure time
  const std::string &buildVersion();
}  // namespace anchorwatch
