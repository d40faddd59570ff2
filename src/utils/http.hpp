/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "log/logger.hpp"

namespace anchorwatch::http {
  enum class HttpError : uint8_t {
    INVALID_URL = 1,
    UNSUPPORTED_SCHEME,
    NETWORK,
  };
  Q_ENUM_ERROR_CODE(HttpError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_URL:
        return "invalid URL";
      case E::UNSUPPORTED_SCHEME:
        return "unsupported URL scheme";
      case E::NETWORK:
        return "network error";
    }
    abort();
  }

  struct UrlParts {
    std::string host;
    std::string port;    // explicit or 80
    std::string target;  // path + ("?" + query) if present
    /// "user:password" taken from the URL user-info, if any
    std::optional<std::string> userinfo;
  };

  /**
   * Accepts absolute URIs like http://[user:password@]host[:port]/path?query
   */
  outcome::result<UrlParts> parseUrl(const std::string &url);

  struct Reply {
    unsigned status = 0;
    std::string body;
  };

  struct ClientConfig {
    UrlParts url;
    /// "user:password" sent as basic authorization, overrides url userinfo
    std::optional<std::string> credentials;

    using Duration = std::chrono::nanoseconds;
    static constexpr Duration kDefaultTimeout = std::chrono::seconds{30};
    Duration operation_timeout{kDefaultTimeout};
  };

  /**
   * Performs one blocking HTTP/1.1 POST. Any received response is returned
   * regardless of its status, the caller decides how to treat it.
   */
  outcome::result<Reply> post(const log::Logger &log,
                              const ClientConfig &config,
                              const std::string &content_type,
                              std::string body);
}  // namespace anchorwatch::http
