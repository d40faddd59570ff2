/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace anchorwatch {
  class BlockGenerator;
  class BridgeKeyAggregator;
  class ProofTaskWaiter;
}  // namespace anchorwatch

namespace anchorwatch::log {
  class LoggingSystem;
}  // namespace anchorwatch::log

namespace anchorwatch::app {
  class Configuration;
  class Application;
}  // namespace anchorwatch::app

namespace anchorwatch::tools {
  class Datatool;
}  // namespace anchorwatch::tools

namespace anchorwatch::injector {

  /**
   * Dependency injector of the application. Collaborator clients are bound
   * to their JSON-RPC implementations and shared between components.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::Application> injectApplication();
    std::shared_ptr<BridgeKeyAggregator> injectBridgeKeyAggregator();
    std::shared_ptr<BlockGenerator> injectBlockGenerator();
    std::shared_ptr<ProofTaskWaiter> injectProofTaskWaiter();
    std::shared_ptr<tools::Datatool> injectDatatool();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace anchorwatch::injector
