/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <qtils/shared_ref.hpp>
#include <rapidjson/document.h>

#include "log/logger.hpp"
#include "rpc/rpc_error.hpp"
#include "rpc/rpc_transport.hpp"
#include "serde/json.hpp"

namespace anchorwatch::rpc {
  /**
   * JSON-RPC 2.0 client with positional parameters.
   *
   * Results are decoded with the json serde into the requested type. An error
   * object in the reply is mapped to RpcError by its code, the raw code and
   * message are logged.
   */
  class JsonRpcClient {
   public:
    JsonRpcClient(log::Logger logger, qtils::SharedRef<RpcTransport> transport);

    template <typename T, typename... Params>
    outcome::result<T> call(std::string_view method, const Params &...params) {
      auto id = next_id_.fetch_add(1);
      auto request = makeRequest(id, method, json::encodeArray(params...));
      SL_TRACE(logger_, "-> #{} {}", id, request);
      auto reply_res = transport_->send(std::move(request));
      if (reply_res.has_error()) {
        SL_DEBUG(logger_, "{} #{} failed: {}", method, id, reply_res.error());
        return RpcError::TRANSPORT;
      }
      auto &reply = reply_res.value();
      SL_TRACE(logger_, "<- #{} {} {}", id, reply.status, reply.body);
      return decodeResponse<T>(logger_, method, reply);
    }

    /**
     * Extracts the result of a reply.
     * Null result decodes into an empty optional, not into an error.
     */
    template <typename T>
    static outcome::result<T> decodeResponse(const log::Logger &logger,
                                             std::string_view method,
                                             const http::Reply &reply) {
      rapidjson::Document document;
      BOOST_OUTCOME_TRY(parseResponse(logger, method, reply, document));
      auto result = document.FindMember("result");
      static const rapidjson::Value json_null;
      T value{};
      try {
        json::decode(value,
                     json::Json{result != document.MemberEnd() ? result->value
                                                               : json_null});
      } catch (const std::runtime_error &) {
        SL_WARN(logger, "{}: unexpected result shape: {}", method, reply.body);
        return RpcError::MALFORMED_RESPONSE;
      }
      return value;
    }

   private:
    static std::string makeRequest(uint64_t id,
                                   std::string_view method,
                                   const std::string &params);

    /// Parses the reply envelope and fails on an error object
    static outcome::result<void> parseResponse(const log::Logger &logger,
                                               std::string_view method,
                                               const http::Reply &reply,
                                               rapidjson::Document &document);

    log::Logger logger_;
    qtils::SharedRef<RpcTransport> transport_;
    std::atomic_uint64_t next_id_{1};
  };
}  // namespace anchorwatch::rpc
