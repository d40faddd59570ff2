/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace anchorwatch::rpc {
  /// Error codes the sequencer attaches to JSON-RPC error objects
  constexpr int64_t kCheckpointDoesNotExistCode = -32610;
  constexpr int64_t kUnsupportedCode = 1001;
  constexpr int64_t kUnimplementedCode = 1002;

  enum class RpcError : uint8_t {
    TRANSPORT = 1,
    HTTP_STATUS,
    MALFORMED_RESPONSE,
    CHECKPOINT_DOES_NOT_EXIST,
    UNSUPPORTED,
    UNIMPLEMENTED,
    SERVER_ERROR,
  };
  Q_ENUM_ERROR_CODE(RpcError) {
    using E = decltype(e);
    switch (e) {
      case E::TRANSPORT:
        return "RPC endpoint is unreachable";
      case E::HTTP_STATUS:
        return "RPC endpoint answered with unexpected HTTP status";
      case E::MALFORMED_RESPONSE:
        return "Malformed JSON-RPC response";
      case E::CHECKPOINT_DOES_NOT_EXIST:
        return "Checkpoint does not exist";
      case E::UNSUPPORTED:
        return "Unsupported RPC method";
      case E::UNIMPLEMENTED:
        return "Unimplemented RPC method";
      case E::SERVER_ERROR:
        return "RPC server error";
    }
    abort();
  }

  /// Closed mapping of server error codes, unknown codes are SERVER_ERROR
  inline RpcError rpcErrorFromCode(int64_t code) {
    switch (code) {
      case kCheckpointDoesNotExistCode:
        return RpcError::CHECKPOINT_DOES_NOT_EXIST;
      case kUnsupportedCode:
        return RpcError::UNSUPPORTED;
      case kUnimplementedCode:
        return RpcError::UNIMPLEMENTED;
      default:
        return RpcError::SERVER_ERROR;
    }
  }
}  // namespace anchorwatch::rpc
