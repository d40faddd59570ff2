/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "l1/block_generator.hpp"

#include <future>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/rpc/l1_client_mock.hpp"
#include "rpc/rpc_error.hpp"
#include "testutil/prepare_loggers.hpp"

using anchorwatch::BlockGenerator;
using anchorwatch::L1BlockHash;
using anchorwatch::rpc::L1ClientMock;
using anchorwatch::rpc::RpcError;
using testing::_;
using testing::Invoke;
using testing::Return;
using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;
using std::chrono_literals::operator""h;

class BlockGeneratorTest : public testing::Test {
 public:
  void SetUp() override {
    l1 = std::make_shared<testing::NiceMock<L1ClientMock>>();
    generator =
        std::make_shared<BlockGenerator>(testutil::prepareLoggers(), l1);
  }

  void TearDown() override {
    generator.reset();
  }

  /// Polls `condition` in real time for up to 5s
  template <typename F>
  static bool eventually(F &&condition) {
    for (int i = 0; i < 500; ++i) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(10ms);
    }
    return condition();
  }

  std::shared_ptr<testing::NiceMock<L1ClientMock>> l1;
  std::shared_ptr<BlockGenerator> generator;
};

/**
 * @given started generator
 * @when stopped after several blocks
 * @then loop ends and no more blocks are mined
 */
TEST_F(BlockGeneratorTest, StopEndsLoop) {
  EXPECT_CALL(*l1, generateToAddress(1, "bcrt1qgen"))
      .WillRepeatedly(Return(std::vector<L1BlockHash>{"00ff"}));

  generator->start(1ms, "bcrt1qgen");
  EXPECT_TRUE(generator->isRunning());
  ASSERT_TRUE(eventually([&] { return generator->generatedCount() >= 3; }));

  generator->stop();
  EXPECT_FALSE(generator->isRunning());
  auto generated = generator->generatedCount();
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(generator->generatedCount(), generated);
}

/**
 * @given generator with long interval
 * @when stopped before the first block is due
 * @then stop returns at once and nothing is mined
 */
TEST_F(BlockGeneratorTest, StopInterruptsWait) {
  EXPECT_CALL(*l1, generateToAddress(_, _)).Times(0);
  generator->start(1h, "bcrt1qgen");
  generator->stop();
  EXPECT_FALSE(generator->isRunning());
  EXPECT_EQ(generator->generatedCount(), 0);
}

/**
 * @given L1 failing the second generation
 * @when generator is running
 * @then loop ends by itself after one block
 */
TEST_F(BlockGeneratorTest, FailureEndsLoop) {
  EXPECT_CALL(*l1, generateToAddress(1, _))
      .WillOnce(Return(std::vector<L1BlockHash>{"00ff"}))
      .WillOnce(Return(RpcError::TRANSPORT));

  generator->start(1ms, "bcrt1qgen");
  ASSERT_TRUE(eventually([&] { return not generator->isRunning(); }));
  EXPECT_EQ(generator->generatedCount(), 1);

  // may be started again once the previous loop ended
  EXPECT_CALL(*l1, generateToAddress(1, _))
      .WillRepeatedly(Return(std::vector<L1BlockHash>{"00ff"}));
  generator->start(1s, "bcrt1qgen");
  EXPECT_TRUE(generator->isRunning());
}

/**
 * @given generator whose L1 call has just failed
 * @when started again right after the failing call returned
 * @then new loop starts instead of being reported as a double start
 */
TEST_F(BlockGeneratorTest, RestartRightAfterFailure) {
  for (int round = 0; round < 20; ++round) {
    std::promise<void> failed;
    EXPECT_CALL(*l1, generateToAddress(1, _))
        .WillOnce(Invoke([&](uint64_t, const std::string &)
                             -> outcome::result<std::vector<L1BlockHash>> {
          failed.set_value();
          return RpcError::TRANSPORT;
        }));
    generator->start(1ms, "bcrt1qgen");
    failed.get_future().wait();

    EXPECT_NO_THROW(generator->start(1h, "bcrt1qgen"));
    EXPECT_TRUE(generator->isRunning());
    generator->stop();
    testing::Mock::VerifyAndClearExpectations(l1.get());
  }
}

/**
 * @given running generator
 * @when started once more
 * @then logic_error is thrown
 */
TEST_F(BlockGeneratorTest, DoubleStartThrows) {
  generator->start(1h, "bcrt1qgen");
  EXPECT_THROW(generator->start(1h, "bcrt1qgen"), std::logic_error);
}

/**
 * @given wallet giving a fresh address
 * @when generating 3 blocks
 * @then their hashes are returned
 */
TEST_F(BlockGeneratorTest, GenerateNBlocks) {
  std::vector<L1BlockHash> hashes{"01", "02", "03"};
  EXPECT_CALL(*l1, getNewAddress())
      .WillOnce(Return(std::string{"bcrt1qnew"}));
  EXPECT_CALL(*l1, generateToAddress(3, "bcrt1qnew"))
      .WillOnce(Return(hashes));
  EXPECT_EQ(generator->generateNBlocks(3), hashes);
}

/**
 * @given wallet failing to give an address
 * @when generating blocks
 * @then nothing is returned and nothing is mined
 */
TEST_F(BlockGeneratorTest, GenerateNBlocksAddressFailure) {
  EXPECT_CALL(*l1, getNewAddress()).WillOnce(Return(RpcError::SERVER_ERROR));
  EXPECT_CALL(*l1, generateToAddress(_, _)).Times(0);
  EXPECT_TRUE(generator->generateNBlocks(3).empty());
}

/**
 * @given node failing to mine
 * @when generating blocks
 * @then nothing is returned
 */
TEST_F(BlockGeneratorTest, GenerateNBlocksMiningFailure) {
  EXPECT_CALL(*l1, getNewAddress())
      .WillOnce(Return(std::string{"bcrt1qnew"}));
  EXPECT_CALL(*l1, generateToAddress(3, "bcrt1qnew"))
      .WillOnce(Return(RpcError::SERVER_ERROR));
  EXPECT_TRUE(generator->generateNBlocks(3).empty());
}
