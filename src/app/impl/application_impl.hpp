/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"

namespace anchorwatch {
  class BlockGenerator;
  class CheckpointFinality;
}  // namespace anchorwatch

namespace anchorwatch::app {
  class Configuration;
}  // namespace anchorwatch::app

namespace anchorwatch::rpc {
  class L1Client;
}  // namespace anchorwatch::rpc

namespace soralog {
  class Logger;
}  // namespace soralog

namespace anchorwatch::log {
  class LoggingSystem;
}  // namespace anchorwatch::log

namespace anchorwatch::app {

  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<Configuration> config,
                    qtils::SharedRef<CheckpointFinality> checkpoint_finality,
                    qtils::SharedRef<BlockGenerator> block_generator,
                    qtils::SharedRef<rpc::L1Client> l1);

    outcome::result<void> run() override;

   private:
    /// Address for mined blocks, a fresh wallet one unless configured
    outcome::result<std::string> generationAddress();

    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<CheckpointFinality> checkpoint_finality_;
    qtils::SharedRef<BlockGenerator> block_generator_;
    qtils::SharedRef<rpc::L1Client> l1_;
  };

}  // namespace anchorwatch::app
