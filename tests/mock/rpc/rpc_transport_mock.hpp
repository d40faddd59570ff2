/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "rpc/rpc_transport.hpp"

namespace anchorwatch::rpc {

  class RpcTransportMock : public RpcTransport {
   public:
    MOCK_METHOD(outcome::result<http::Reply>, send, (std::string), (override));
  };

}  // namespace anchorwatch::rpc
