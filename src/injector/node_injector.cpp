/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 16

#include "injector/node_injector.hpp"

#include <memory>

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "app/configuration.hpp"
#include "app/impl/application_impl.hpp"
#include "bridge/bridge_key_aggregator.hpp"
#include "clock/impl/clock_impl.hpp"
#include "clock/impl/sleeper_impl.hpp"
#include "finality/anchor_watcher.hpp"
#include "finality/checkpoint_finality.hpp"
#include "finality/proof_arbiter.hpp"
#include "l1/block_generator.hpp"
#include "log/logger.hpp"
#include "prover/proof_task_waiter.hpp"
#include "rpc/impl/bitcoind_rpc_client.hpp"
#include "rpc/impl/prover_rpc_client.hpp"
#include "rpc/impl/sequencer_rpc_client.hpp"
#include "tools/datatool.hpp"
#include "utils/wait_until.hpp"

namespace {
  namespace di = boost::di;
  using namespace anchorwatch;  // NOLINT

  template <typename... Ts>
  auto makeApplicationInjector(std::shared_ptr<log::LoggingSystem> logsys,
                               std::shared_ptr<app::Configuration> config,
                               Ts &&...args) {
    // clang-format off
    return di::make_injector(
        di::bind<app::Configuration>.to(config),
        di::bind<log::LoggingSystem>.to(logsys),
        di::bind<app::Application>.to<app::ApplicationImpl>(),
        di::bind<clock::SteadyClock>.to<clock::SteadyClockImpl>(),
        di::bind<clock::Sleeper>.to<clock::SleeperImpl>(),
        di::bind<rpc::SequencerApi>.to<rpc::SequencerRpcClient>(),
        di::bind<rpc::L1Client>.to<rpc::BitcoindRpcClient>(),
        di::bind<rpc::ProverApi>.to<rpc::ProverRpcClient>(),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  template <typename... Ts>
  auto makeNodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                        std::shared_ptr<app::Configuration> config,
                        Ts &&...args) {
    return di::make_injector<boost::di::extension::shared_config>(
        makeApplicationInjector(std::move(logsys), std::move(config)),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace anchorwatch::injector {
  class NodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(std::shared_ptr<log::LoggingSystem>(),
                                  std::shared_ptr<app::Configuration>()));

    explicit NodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}

    Injector injector_;
  };

  NodeInjector::NodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                             std::shared_ptr<app::Configuration> config)
      : pimpl_{std::make_unique<NodeInjectorImpl>(
            makeNodeInjector(std::move(logsys), std::move(config)))} {}

  std::shared_ptr<app::Application> NodeInjector::injectApplication() {
    return pimpl_->injector_
        .template create<std::shared_ptr<app::Application>>();
  }

  std::shared_ptr<BridgeKeyAggregator>
  NodeInjector::injectBridgeKeyAggregator() {
    return pimpl_->injector_
        .template create<std::shared_ptr<BridgeKeyAggregator>>();
  }

  std::shared_ptr<BlockGenerator> NodeInjector::injectBlockGenerator() {
    return pimpl_->injector_
        .template create<std::shared_ptr<BlockGenerator>>();
  }

  std::shared_ptr<ProofTaskWaiter> NodeInjector::injectProofTaskWaiter() {
    return pimpl_->injector_
        .template create<std::shared_ptr<ProofTaskWaiter>>();
  }

  std::shared_ptr<tools::Datatool> NodeInjector::injectDatatool() {
    return pimpl_->injector_
        .template create<std::shared_ptr<tools::Datatool>>();
  }
}  // namespace anchorwatch::injector
