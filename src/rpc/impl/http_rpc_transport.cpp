/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/impl/http_rpc_transport.hpp"

namespace anchorwatch::rpc {
  HttpRpcTransport::HttpRpcTransport(log::Logger logger,
                                     const std::string &url,
                                     std::optional<std::string> credentials)
      : logger_{std::move(logger)},
        config_{
            .url = http::parseUrl(url).value(),
            .credentials = std::move(credentials),
        } {}

  outcome::result<http::Reply> HttpRpcTransport::send(std::string request) {
    return http::post(
        logger_, config_, "application/json", std::move(request));
  }
}  // namespace anchorwatch::rpc
