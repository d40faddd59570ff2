/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <unistd.h>

#include <qtils/final_action.hpp>

#include "app/configuration.hpp"
#include "finality/checkpoint_finality.hpp"
#include "l1/block_generator.hpp"
#include "log/logger.hpp"
#include "rpc/l1_client.hpp"

namespace anchorwatch::app {

  ApplicationImpl::ApplicationImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<CheckpointFinality> checkpoint_finality,
      qtils::SharedRef<BlockGenerator> block_generator,
      qtils::SharedRef<rpc::L1Client> l1)
      : logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        checkpoint_finality_(std::move(checkpoint_finality)),
        block_generator_(std::move(block_generator)),
        l1_(std::move(l1)) {}

  outcome::result<std::string> ApplicationImpl::generationAddress() {
    const auto &configured = app_config_->finality().gen_address;
    if (not configured.empty()) {
      return configured;
    }
    return l1_->getNewAddress();
  }

  outcome::result<void> ApplicationImpl::run() {
    logger_->info("Start as version '{}' named as '{}' with PID {}",
                  app_config_->version(),
                  app_config_->name(),
                  getpid());

    auto manual_gen = app_config_->manualGen();
    if (manual_gen.has_value() and manual_gen->gen_addr.empty()) {
      BOOST_OUTCOME_TRY(manual_gen->gen_addr, generationAddress());
    }

    const auto interval = app_config_->generator().interval;
    if (interval.count() > 0) {
      BOOST_OUTCOME_TRY(auto address, generationAddress());
      SL_INFO(logger_,
              "Mining a block every {}ms to {}",
              interval.count(),
              address);
      block_generator_->start(interval, std::move(address));
    }
    qtils::FinalAction stop_generator([&] { block_generator_->stop(); });

    const auto &finality = app_config_->finality();
    for (uint64_t i = 0; i < finality.checkpoints; ++i) {
      auto idx = finality.start_index + i;
      SL_INFO(logger_, "Checking checkpoint {}", idx);
      auto res = checkpoint_finality_->checkNthCheckpointFinalized(
          idx, manual_gen, finality.proof_timeout);
      if (res.has_error()) {
        SL_ERROR(logger_, "Checkpoint {} check failed: {}", idx, res.error());
        return res.error();
      }
      SL_INFO(logger_, "Checkpoint {} is finalized", idx);
    }

    if (block_generator_->isRunning()) {
      SL_INFO(logger_,
              "Background generator mined {} blocks",
              block_generator_->generatedCount());
    }
    return outcome::success();
  }

}  // namespace anchorwatch::app
