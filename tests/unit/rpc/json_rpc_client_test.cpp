/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/format.h>
#include <qtils/test/outcome.hpp>
#include <rapidjson/document.h>

#include "mock/rpc/rpc_transport_mock.hpp"
#include "rpc/impl/bitcoind_rpc_client.hpp"
#include "rpc/impl/sequencer_rpc_client.hpp"
#include "rpc/json_rpc_client.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using anchorwatch::CheckpointInfo;
using anchorwatch::PsbtOptions;
using anchorwatch::PsbtOutputs;
using anchorwatch::http::Reply;
using anchorwatch::rpc::BitcoindRpcClient;
using anchorwatch::rpc::JsonRpcClient;
using anchorwatch::rpc::RpcError;
using anchorwatch::rpc::RpcTransportMock;
using anchorwatch::rpc::SequencerRpcClient;

using testing::_;
using testing::Return;
using testing::SaveArg;

class JsonRpcClientTest : public testing::Test {
 public:
  void SetUp() override {
    transport = std::make_shared<RpcTransportMock>();
  }

  static Reply ok(std::string body) {
    return Reply{.status = 200, .body = std::move(body)};
  }

  qtils::SharedRef<anchorwatch::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  anchorwatch::log::Logger logger =
      logsys->getLogger("JsonRpcClientTest", "testing");
  std::shared_ptr<RpcTransportMock> transport;
};

/**
 * @given reply with null result
 * @when decoding into optional
 * @then empty optional is returned rather than an error
 */
TEST_F(JsonRpcClientTest, NullResultIsEmptyOptional) {
  ASSERT_OUTCOME_SUCCESS(
      info,
      JsonRpcClient::decodeResponse<std::optional<CheckpointInfo>>(
          logger,
          "strata_getCheckpointInfo",
          ok(R"({"jsonrpc":"2.0","id":1,"result":null})")));
  EXPECT_FALSE(info.has_value());
}

/**
 * @given reply with checkpoint info object
 * @when decoding
 * @then ranges and hex block id are decoded
 */
TEST_F(JsonRpcClientTest, DecodesCheckpointInfo) {
  auto body = R"({"jsonrpc":"2.0","id":1,"result":{
      "idx":2,
      "l1_range":[20,29],
      "l2_range":[128,191],
      "l2_blockid":"0x00000000000000000000000000000000000000000000000000000000000000ff"}})";
  ASSERT_OUTCOME_SUCCESS(
      info,
      JsonRpcClient::decodeResponse<std::optional<CheckpointInfo>>(
          logger, "strata_getCheckpointInfo", ok(body)));
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->idx, 2);
  EXPECT_EQ(info->l1_range, std::make_pair<uint64_t, uint64_t>(20, 29));
  EXPECT_EQ(info->l2_range, std::make_pair<uint64_t, uint64_t>(128, 191));
  EXPECT_EQ(info->l2_blockid[31], 0xff);
  EXPECT_EQ(info->l2_blockid[0], 0x00);
}

/**
 * @given error object with code -32610
 * @when decoding
 * @then CHECKPOINT_DOES_NOT_EXIST is distinguishable from other errors
 */
TEST_F(JsonRpcClientTest, MapsCheckpointDoesNotExist) {
  EXPECT_OUTCOME_ERROR(
      res,
      JsonRpcClient::decodeResponse<anchorwatch::json::Ignore>(
          logger,
          "strataadmin_submitCheckpointProof",
          ok(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32610,"message":"checkpoint missing"}})")),
      RpcError::CHECKPOINT_DOES_NOT_EXIST);
}

/**
 * @given error objects with known and unknown codes
 * @when decoding
 * @then codes map to closed set, unknown ones to SERVER_ERROR
 */
TEST_F(JsonRpcClientTest, MapsOtherServerCodes) {
  auto decode = [&](int64_t code) {
    return JsonRpcClient::decodeResponse<anchorwatch::json::Ignore>(
        logger,
        "method",
        ok(fmt::format(
            R"({{"jsonrpc":"2.0","id":1,"error":{{"code":{},"message":"m"}}}})",
            code)));
  };
  EXPECT_OUTCOME_ERROR(unsupported, decode(1001), RpcError::UNSUPPORTED);
  EXPECT_OUTCOME_ERROR(unimplemented, decode(1002), RpcError::UNIMPLEMENTED);
  EXPECT_OUTCOME_ERROR(other, decode(-5), RpcError::SERVER_ERROR);
}

/**
 * @given HTTP 500 reply carrying a JSON-RPC error envelope
 * @when decoding
 * @then error is taken from envelope, not from status
 */
TEST_F(JsonRpcClientTest, ErrorEnvelopeWinsOverHttpStatus) {
  Reply reply{
      .status = 500,
      .body = R"({"result":null,"error":{"code":-32610,"message":"x"},"id":1})",
  };
  EXPECT_OUTCOME_ERROR(
      res,
      JsonRpcClient::decodeResponse<anchorwatch::json::Ignore>(
          logger, "method", reply),
      RpcError::CHECKPOINT_DOES_NOT_EXIST);
}

/**
 * @given non JSON replies
 * @when decoding
 * @then status other than 200 is HTTP_STATUS, otherwise MALFORMED_RESPONSE
 */
TEST_F(JsonRpcClientTest, NonJsonBody) {
  Reply bad_gateway{.status = 502, .body = "Bad Gateway"};
  EXPECT_OUTCOME_ERROR(
      status,
      JsonRpcClient::decodeResponse<uint64_t>(logger, "m", bad_gateway),
      RpcError::HTTP_STATUS);
  EXPECT_OUTCOME_ERROR(
      malformed,
      JsonRpcClient::decodeResponse<uint64_t>(logger, "m", ok("not json")),
      RpcError::MALFORMED_RESPONSE);
}

/**
 * @given result of unexpected shape
 * @when decoding
 * @then MALFORMED_RESPONSE is returned
 */
TEST_F(JsonRpcClientTest, WrongResultShape) {
  EXPECT_OUTCOME_ERROR(
      res,
      JsonRpcClient::decodeResponse<uint64_t>(
          logger, "strata_protocolVersion", ok(R"({"result":"one"})")),
      RpcError::MALFORMED_RESPONSE);
}

/**
 * @given failing transport
 * @when calling a method
 * @then TRANSPORT error is returned
 */
TEST_F(JsonRpcClientTest, TransportFailure) {
  EXPECT_CALL(*transport, send(_))
      .WillOnce([](std::string) -> outcome::result<Reply> {
        return testutil::DummyError::ERROR;
      });
  SequencerRpcClient client{logsys, transport};
  EXPECT_OUTCOME_ERROR(
      res, client.protocolVersion(), RpcError::TRANSPORT);
}

/**
 * @given sequencer client
 * @when submitting proof bytes
 * @then request carries index and hex encoded proof as positional params
 */
TEST_F(JsonRpcClientTest, SubmitProofRequest) {
  std::string request;
  EXPECT_CALL(*transport, send(_))
      .WillOnce(testing::DoAll(
          SaveArg<0>(&request),
          Return(ok(R"({"jsonrpc":"2.0","id":1,"result":null})"))));
  SequencerRpcClient client{logsys, transport};
  auto proof = qtils::ByteVec::fromHex("01ab").value();
  ASSERT_OUTCOME_SUCCESS(client.submitCheckpointProof(3, proof));

  rapidjson::Document document;
  document.Parse(request.data(), request.size());
  ASSERT_FALSE(document.HasParseError());
  EXPECT_STREQ(document["jsonrpc"].GetString(), "2.0");
  EXPECT_STREQ(document["method"].GetString(),
               "strataadmin_submitCheckpointProof");
  auto &params = document["params"];
  ASSERT_TRUE(params.IsArray());
  ASSERT_EQ(params.Size(), 2);
  EXPECT_EQ(params[0].GetUint64(), 3);
  EXPECT_STREQ(params[1].GetString(), "01ab");
}

/**
 * @given bitcoind client
 * @when creating funded psbt
 * @then wallet selects inputs and absent options are not sent
 */
TEST_F(JsonRpcClientTest, FundedPsbtRequest) {
  std::string request;
  EXPECT_CALL(*transport, send(_))
      .WillOnce(testing::DoAll(
          SaveArg<0>(&request),
          Return(ok(
              R"({"result":{"psbt":"cHNidP8","fee":0.0001,"changepos":1},"id":1})"))));
  BitcoindRpcClient client{logsys, transport};
  PsbtOutputs outputs{anchorwatch::PsbtOutput{{"bcrt1qaddr", 1.5}}};
  PsbtOptions options{.change_address = std::nullopt,
                      .fee_rate = 2.0,
                      .lock_unspents = std::nullopt};
  ASSERT_OUTCOME_SUCCESS(psbt, client.walletCreateFundedPsbt(outputs, options));
  EXPECT_EQ(psbt.psbt, "cHNidP8");
  EXPECT_EQ(psbt.changepos, 1);

  rapidjson::Document document;
  document.Parse(request.data(), request.size());
  ASSERT_FALSE(document.HasParseError());
  auto &params = document["params"];
  ASSERT_EQ(params.Size(), 4);
  EXPECT_TRUE(params[0].IsArray());
  EXPECT_EQ(params[0].Size(), 0);
  EXPECT_DOUBLE_EQ(params[1][0]["bcrt1qaddr"].GetDouble(), 1.5);
  EXPECT_EQ(params[2].GetInt64(), 0);
  EXPECT_TRUE(params[3].HasMember("fee_rate"));
  EXPECT_FALSE(params[3].HasMember("change_address"));
}
