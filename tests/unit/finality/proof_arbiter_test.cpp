/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/proof_arbiter.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "finality/anchor_watcher.hpp"
#include "finality/finality_error.hpp"
#include "mock/rpc/l1_client_mock.hpp"
#include "mock/rpc/sequencer_api_mock.hpp"
#include "testutil/fake_rollup.hpp"
#include "testutil/prepare_loggers.hpp"

using anchorwatch::AnchorWatcher;
using anchorwatch::ArbiterState;
using anchorwatch::FinalityError;
using anchorwatch::ManualGenConfig;
using anchorwatch::ProofArbiter;
using anchorwatch::Waiter;
using anchorwatch::clock::ManualClock;
using anchorwatch::rpc::L1ClientMock;
using anchorwatch::rpc::RpcError;
using anchorwatch::rpc::SequencerApiMock;
using testing::_;
using testing::Return;
using testutil::FakeRollup;
using std::chrono_literals::operator""s;

class ProofArbiterTest : public testing::Test {
 public:
  void SetUp() override {
    clock = std::make_shared<ManualClock>();
    rollup = std::make_shared<FakeRollup>(clock, 2);
    arbiter = makeArbiter(rollup, rollup);
  }

  std::shared_ptr<ProofArbiter> makeArbiter(
      std::shared_ptr<anchorwatch::rpc::SequencerApi> sequencer,
      std::shared_ptr<anchorwatch::rpc::L1Client> l1) {
    auto logsys = testutil::prepareLoggers();
    auto watcher = std::make_shared<AnchorWatcher>(logsys, sequencer, l1);
    return std::make_shared<ProofArbiter>(
        logsys, sequencer, l1, watcher, std::make_shared<Waiter>(logsys, clock));
  }

  std::shared_ptr<ManualClock> clock;
  std::shared_ptr<FakeRollup> rollup;
  std::shared_ptr<ProofArbiter> arbiter;
  ManualGenConfig manual_gen{.finality_depth = 2, .gen_addr = "bcrt1qgen"};
};

/**
 * @given batches 0..2
 * @when submitting proof for batch 5
 * @then sequencer rejects it with CHECKPOINT_DOES_NOT_EXIST and check passes
 */
TEST_F(ProofArbiterTest, NonexistentBatchIsRejected) {
  rollup->addCheckpoint();
  rollup->addCheckpoint();
  rollup->addCheckpoint();
  ASSERT_OUTCOME_SUCCESS(arbiter->checkSubmitProofFailsForNonexistentBatch(5));
  EXPECT_EQ(rollup->submissions(), 1);
  EXPECT_EQ(rollup->batches().size(), 3);
}

/**
 * @given sequencer accepting any proof
 * @when checking nonexistent batch submission
 * @then UNEXPECTED_SUCCESS is reported
 */
TEST_F(ProofArbiterTest, AcceptedNonexistentBatchFails) {
  auto sequencer = std::make_shared<SequencerApiMock>();
  auto arbiter = makeArbiter(sequencer, std::make_shared<L1ClientMock>());
  EXPECT_CALL(*sequencer, submitCheckpointProof(5, _))
      .WillOnce(Return(outcome::success()));
  EXPECT_OUTCOME_ERROR(res,
                       arbiter->checkSubmitProofFailsForNonexistentBatch(5),
                       FinalityError::UNEXPECTED_SUCCESS);
}

/**
 * @given sequencer failing with a generic server error
 * @when checking nonexistent batch submission
 * @then that error is passed through
 */
TEST_F(ProofArbiterTest, OtherRejectionIsPropagated) {
  auto sequencer = std::make_shared<SequencerApiMock>();
  auto arbiter = makeArbiter(sequencer, std::make_shared<L1ClientMock>());
  EXPECT_CALL(*sequencer, submitCheckpointProof(5, _))
      .WillOnce(Return(RpcError::SERVER_ERROR));
  EXPECT_OUTCOME_ERROR(res,
                       arbiter->checkSubmitProofFailsForNonexistentBatch(5),
                       RpcError::SERVER_ERROR);
}

/**
 * @given pending batch 0 and manual block generation
 * @when submitting checkpoint
 * @then empty proof is submitted, anchor is observed and gets confirmed
 */
TEST_F(ProofArbiterTest, SubmitCheckpointInManualMode) {
  rollup->addCheckpoint();
  auto height = rollup->height();
  EXPECT_EQ(arbiter->state(0), ArbiterState::AwaitingDecision);

  ASSERT_OUTCOME_SUCCESS(txid, arbiter->submitCheckpoint(0, manual_gen));
  EXPECT_EQ(rollup->batches().at(0).anchor_txid, txid);
  EXPECT_EQ(rollup->batches().at(0).proof_size, 0);
  EXPECT_EQ(rollup->height(), height + 1);
  ASSERT_OUTCOME_SUCCESS(tx, rollup->getTransaction(txid));
  EXPECT_GT(tx.confirmations, 0);
  EXPECT_EQ(arbiter->state(0), ArbiterState::AnchorObserved);
}

/**
 * @given proof provided for batch 0
 * @when submitting without timeout
 * @then provided bytes are sent
 */
TEST_F(ProofArbiterTest, SubmitsProvidedProof) {
  rollup->addCheckpoint();
  arbiter->provideProof(0, qtils::ByteVec::fromHex("010203").value());
  ASSERT_OUTCOME_SUCCESS(arbiter->submitOrWait(0, std::nullopt));
  EXPECT_EQ(rollup->batches().at(0).proof_size, 3);
  EXPECT_EQ(arbiter->state(0), ArbiterState::Submitted);
  EXPECT_TRUE(clock->sleeps().empty());
}

/**
 * @given sequencer publishing empty proof 5s after batch creation
 * @when arbitrating with 5s proof timeout
 * @then nothing is submitted, arbiter sleeps 6s and then sees the anchor
 */
TEST_F(ProofArbiterTest, TimeoutFallbackPublishesAnchor) {
  rollup->setProofTimeout(5s);
  rollup->addCheckpoint();

  ASSERT_OUTCOME_SUCCESS(arbiter->submitOrWait(0, 5s));
  EXPECT_EQ(rollup->submissions(), 0);
  EXPECT_EQ(clock->slept(), 6s);

  ASSERT_OUTCOME_SUCCESS(txid, arbiter->awaitAnchoring(0));
  EXPECT_EQ(rollup->batches().at(0).anchor_txid, txid);
  EXPECT_EQ(arbiter->state(0), ArbiterState::AnchorObserved);
}

/**
 * @given sequencer which does not publish to L1
 * @when awaiting anchoring
 * @then ANCHOR_NOT_OBSERVED is returned after 5s
 */
TEST_F(ProofArbiterTest, AnchorNeverPublished) {
  rollup->setPublishing(false);
  rollup->addCheckpoint();
  ASSERT_OUTCOME_SUCCESS(arbiter->submitOrWait(0, std::nullopt));
  EXPECT_OUTCOME_ERROR(
      res, arbiter->awaitAnchoring(0), FinalityError::ANCHOR_NOT_OBSERVED);
  EXPECT_EQ(clock->slept(), ProofArbiter::kAnchorTimeout);
  EXPECT_EQ(arbiter->state(0), ArbiterState::Submitted);
}

/**
 * @given anchor of batch 0 already published
 * @when batch 1 is submitted
 * @then only the new anchor is accepted
 */
TEST_F(ProofArbiterTest, PreviousAnchorIsNotReused) {
  rollup->addCheckpoint();
  ASSERT_OUTCOME_SUCCESS(first, arbiter->submitCheckpoint(0, std::nullopt));
  ASSERT_OUTCOME_SUCCESS(second, arbiter->submitCheckpoint(1, std::nullopt));
  EXPECT_NE(first, second);
  EXPECT_EQ(rollup->batches().at(1).anchor_txid, second);
}

/**
 * @given anchor published but never mined by the generated block
 * @when submitting checkpoint with manual block generation
 * @then confirmation wait gives up after 5s in 500ms steps
 */
TEST_F(ProofArbiterTest, ManualConfirmationTimesOut) {
  auto sequencer = std::make_shared<SequencerApiMock>();
  auto l1 = std::make_shared<L1ClientMock>();
  auto arbiter = makeArbiter(sequencer, l1);

  anchorwatch::L1Status before{.bitcoin_rpc_connected = true};
  anchorwatch::L1Status after{
      .bitcoin_rpc_connected = true,
      .last_published_txid = "a1",
      .published_inscription_count = 1,
  };
  EXPECT_CALL(*sequencer, l1Status())
      .WillOnce(Return(before))
      .WillRepeatedly(Return(after));
  EXPECT_CALL(*sequencer, submitCheckpointProof(0, _))
      .WillOnce(Return(outcome::success()));
  std::vector<anchorwatch::L1BlockHash> mined{"b1"};
  EXPECT_CALL(*l1, generateToAddress(1, manual_gen.gen_addr))
      .WillOnce(Return(mined));
  anchorwatch::WalletTransaction unconfirmed{.txid = "a1"};
  EXPECT_CALL(*l1, getTransaction("a1"))
      .Times(10)
      .WillRepeatedly(Return(unconfirmed));

  EXPECT_OUTCOME_ERROR(res,
                       arbiter->submitCheckpoint(0, manual_gen),
                       FinalityError::ANCHOR_NOT_CONFIRMED);
  EXPECT_EQ(clock->sleeps().size(), 10);
  for (auto &sleep : clock->sleeps()) {
    EXPECT_EQ(sleep, std::chrono::milliseconds{500});
  }
  EXPECT_EQ(clock->slept(), ProofArbiter::kConfirmationTimeout);
  EXPECT_EQ(arbiter->state(0), ArbiterState::AnchorObserved);
}

/**
 * @given anchor published and bitcoin node failing to mine
 * @when submitting checkpoint with manual block generation
 * @then mining error is passed through without waiting for confirmations
 */
TEST_F(ProofArbiterTest, ManualGenerationFailureIsPropagated) {
  auto sequencer = std::make_shared<SequencerApiMock>();
  auto l1 = std::make_shared<L1ClientMock>();
  auto arbiter = makeArbiter(sequencer, l1);

  anchorwatch::L1Status before{.bitcoin_rpc_connected = true};
  anchorwatch::L1Status after{
      .bitcoin_rpc_connected = true,
      .last_published_txid = "a1",
      .published_inscription_count = 1,
  };
  EXPECT_CALL(*sequencer, l1Status())
      .WillOnce(Return(before))
      .WillRepeatedly(Return(after));
  EXPECT_CALL(*sequencer, submitCheckpointProof(0, _))
      .WillOnce(Return(outcome::success()));
  EXPECT_CALL(*l1, generateToAddress(1, manual_gen.gen_addr))
      .WillOnce(Return(RpcError::TRANSPORT));
  EXPECT_CALL(*l1, getTransaction(_)).Times(0);

  EXPECT_OUTCOME_ERROR(res,
                       arbiter->submitCheckpoint(0, manual_gen),
                       RpcError::TRANSPORT);
  EXPECT_TRUE(clock->sleeps().empty());
}
