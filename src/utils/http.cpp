/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/http.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <cppcodec/base64_rfc4648.hpp>

namespace anchorwatch::http {
  namespace beast = boost::beast;
  using tcp = boost::asio::ip::tcp;

  outcome::result<UrlParts> parseUrl(const std::string &url) {
    namespace urls = boost::urls;

    const auto r = urls::parse_uri(url);
    if (not r) {
      return HttpError::INVALID_URL;
    }
    const urls::url_view uv = r.value();

    if (uv.scheme() != "http") {
      return HttpError::UNSUPPORTED_SCHEME;
    }
    if (not uv.has_authority() or uv.host().empty()) {
      return HttpError::INVALID_URL;
    }

    UrlParts parts;
    parts.host = uv.host();
    parts.port = uv.has_port() ? std::string{uv.port()} : std::string{"80"};
    if (uv.encoded_path().empty()) {
      parts.target = "/";
    } else {
      parts.target = uv.encoded_path();
    }
    if (uv.has_query()) {
      parts.target.push_back('?');
      parts.target += uv.encoded_query();
    }
    if (uv.has_userinfo() and not uv.userinfo().empty()) {
      parts.userinfo = uv.userinfo();
    }
    return parts;
  }

  outcome::result<Reply> post(const log::Logger &log,
                              const ClientConfig &config,
                              const std::string &content_type,
                              std::string body) {
    boost::asio::io_context io_context;
    tcp::resolver resolver{io_context};
    beast::tcp_stream stream{io_context};
    boost::system::error_code ec;

    auto endpoints = resolver.resolve(config.url.host, config.url.port, ec);
    if (ec) {
      SL_DEBUG(log, "resolve {} error: {}", config.url.host, ec.message());
      return HttpError::NETWORK;
    }

    stream.expires_after(config.operation_timeout);
    stream.connect(endpoints, ec);
    if (ec) {
      SL_DEBUG(log,
               "connect {}:{} error: {}",
               config.url.host,
               config.url.port,
               ec.message());
      return HttpError::NETWORK;
    }

    beast::http::request<beast::http::string_body> request{
        beast::http::verb::post, config.url.target, 11};
    request.set(beast::http::field::host, config.url.host);
    request.set(beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(beast::http::field::content_type, content_type);
    const auto &auth =
        config.credentials ? config.credentials : config.url.userinfo;
    if (auth.has_value()) {
      request.set(beast::http::field::authorization,
                  "Basic " + cppcodec::base64_rfc4648::encode(auth.value()));
    }
    request.body() = std::move(body);
    request.prepare_payload();

    beast::http::write(stream, request, ec);
    if (ec) {
      SL_DEBUG(log, "http write request error: {}", ec.message());
      return HttpError::NETWORK;
    }

    beast::flat_buffer buffer;
    beast::http::response<beast::http::string_body> response;
    beast::http::read(stream, buffer, response, ec);
    if (ec) {
      SL_DEBUG(log, "http read response error: {}", ec.message());
      return HttpError::NETWORK;
    }

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return Reply{
        .status = response.result_int(),
        .body = std::move(response.body()),
    };
  }
}  // namespace anchorwatch::http
