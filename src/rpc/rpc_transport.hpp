/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <qtils/outcome.hpp>

#include "utils/http.hpp"

namespace anchorwatch::rpc {
  /**
   * Delivers a serialized JSON-RPC request to one endpoint and returns the raw
   * reply.
   */
  class RpcTransport {
   public:
    virtual ~RpcTransport() = default;

    virtual outcome::result<http::Reply> send(std::string request) = 0;
  };
}  // namespace anchorwatch::rpc
