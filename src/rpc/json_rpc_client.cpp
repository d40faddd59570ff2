/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/json_rpc_client.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace anchorwatch::rpc {
  JsonRpcClient::JsonRpcClient(log::Logger logger,
                               qtils::SharedRef<RpcTransport> transport)
      : logger_{std::move(logger)}, transport_{std::move(transport)} {}

  std::string JsonRpcClient::makeRequest(uint64_t id,
                                         std::string_view method,
                                         const std::string &params) {
    rapidjson::StringBuffer buffer;
    json::Writer w{buffer};
    w.StartObject();
    w.Key("jsonrpc");
    w.String("2.0");
    w.Key("id");
    w.Uint64(id);
    w.Key("method");
    json::encode(w, method);
    w.Key("params");
    w.RawValue(params.data(), params.size(), rapidjson::kArrayType);
    w.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
  }

  outcome::result<void> JsonRpcClient::parseResponse(
      const log::Logger &logger,
      std::string_view method,
      const http::Reply &reply,
      rapidjson::Document &document) {
    document.Parse(reply.body.data(), reply.body.size());
    if (document.HasParseError() or not document.IsObject()) {
      // bitcoind reports RPC errors with HTTP 500 and a JSON body, so the
      // status only matters when there is no envelope to read
      if (reply.status != 200) {
        SL_WARN(logger, "{}: HTTP status {}", method, reply.status);
        return RpcError::HTTP_STATUS;
      }
      SL_WARN(logger, "{}: response is not a JSON object", method);
      return RpcError::MALFORMED_RESPONSE;
    }

    auto error = document.FindMember("error");
    if (error == document.MemberEnd() or error->value.IsNull()) {
      return outcome::success();
    }
    if (not error->value.IsObject()) {
      return RpcError::MALFORMED_RESPONSE;
    }
    int64_t code = 0;
    std::string message;
    auto code_it = error->value.FindMember("code");
    if (code_it != error->value.MemberEnd() and code_it->value.IsInt64()) {
      code = code_it->value.GetInt64();
    }
    auto message_it = error->value.FindMember("message");
    if (message_it != error->value.MemberEnd()
        and message_it->value.IsString()) {
      message = message_it->value.GetString();
    }
    SL_WARN(logger, "{}: server error {}: {}", method, code, message);
    return rpcErrorFromCode(code);
  }
}  // namespace anchorwatch::rpc
