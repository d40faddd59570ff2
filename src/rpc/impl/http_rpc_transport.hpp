/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "log/logger.hpp"
#include "rpc/rpc_transport.hpp"

namespace anchorwatch::rpc {
  class HttpRpcTransport final : public RpcTransport {
   public:
    /// @throws std::system_error if `url` can not be parsed
    HttpRpcTransport(log::Logger logger,
                     const std::string &url,
                     std::optional<std::string> credentials = std::nullopt);

    outcome::result<http::Reply> send(std::string request) override;

   private:
    log::Logger logger_;
    http::ClientConfig config_;
  };
}  // namespace anchorwatch::rpc
