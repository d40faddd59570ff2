/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "l1/broadcast_tx.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "mock/rpc/l1_client_mock.hpp"
#include "rpc/rpc_error.hpp"

using anchorwatch::BroadcastError;
using anchorwatch::FinalizedPsbt;
using anchorwatch::FundedPsbt;
using anchorwatch::ProcessedPsbt;
using anchorwatch::PsbtOptions;
using anchorwatch::PsbtOutput;
using anchorwatch::PsbtOutputs;
using anchorwatch::rpc::L1ClientMock;
using anchorwatch::rpc::RpcError;
using testing::_;
using testing::Return;

class BroadcastTxTest : public testing::Test {
 public:
  L1ClientMock l1;
  PsbtOutputs outputs{PsbtOutput{{"bcrt1qdest", 1.5}}};
  PsbtOptions options{.change_address = std::nullopt,
                      .fee_rate = 2.0,
                      .lock_unspents = true};
};

/**
 * @given wallet able to fund, sign and finalize
 * @when broadcasting
 * @then finalized hex is sent and its txid returned
 */
TEST_F(BroadcastTxTest, Success) {
  testing::InSequence seq;
  EXPECT_CALL(l1, walletCreateFundedPsbt(outputs, _))
      .WillOnce(Return(FundedPsbt{.psbt = "funded", .fee = 0.0001}));
  EXPECT_CALL(l1, walletProcessPsbt("funded"))
      .WillOnce(Return(ProcessedPsbt{.psbt = "signed", .complete = true}));
  EXPECT_CALL(l1, finalizePsbt("signed"))
      .WillOnce(Return(FinalizedPsbt{.hex = "0200", .complete = true}));
  EXPECT_CALL(l1, sendRawTransaction("0200"))
      .WillOnce(Return(std::string{"ab12"}));

  ASSERT_OUTCOME_SUCCESS(txid, anchorwatch::broadcastTx(l1, outputs, options));
  EXPECT_EQ(txid, "ab12");
}

/**
 * @given wallet unable to complete the transaction
 * @when broadcasting
 * @then NOT_FINALIZED is returned and nothing is sent
 */
TEST_F(BroadcastTxTest, IncompleteIsNotSent) {
  EXPECT_CALL(l1, walletCreateFundedPsbt(_, _))
      .WillOnce(Return(FundedPsbt{.psbt = "funded"}));
  EXPECT_CALL(l1, walletProcessPsbt(_))
      .WillOnce(Return(ProcessedPsbt{.psbt = "partial"}));
  EXPECT_CALL(l1, finalizePsbt(_))
      .WillOnce(Return(FinalizedPsbt{.hex = std::nullopt, .complete = false}));
  EXPECT_CALL(l1, sendRawTransaction(_)).Times(0);

  EXPECT_OUTCOME_ERROR(res,
                       anchorwatch::broadcastTx(l1, outputs, options),
                       BroadcastError::NOT_FINALIZED);
}

/**
 * @given wallet without funds
 * @when broadcasting
 * @then funding error is passed through
 */
TEST_F(BroadcastTxTest, FundingFailure) {
  EXPECT_CALL(l1, walletCreateFundedPsbt(_, _))
      .WillOnce(Return(RpcError::SERVER_ERROR));
  EXPECT_CALL(l1, walletProcessPsbt(_)).Times(0);

  EXPECT_OUTCOME_ERROR(res,
                       anchorwatch::broadcastTx(l1, outputs, options),
                       RpcError::SERVER_ERROR);
}
