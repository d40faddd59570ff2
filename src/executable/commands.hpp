/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string_view>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "app/configuration.hpp"
#include "bridge/bridge_key_aggregator.hpp"
#include "injector/node_injector.hpp"
#include "l1/block_generator.hpp"
#include "prover/proof_task_waiter.hpp"
#include "tools/datatool.hpp"

inline std::optional<uint64_t> parseCount(std::string_view str) {
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc{} or ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return value;
}

inline int cmdBridgeKey(anchorwatch::injector::NodeInjector &injector) {
  auto aggregator = injector.injectBridgeKeyAggregator();
  auto key_res = aggregator->aggregateBridgeKey();
  if (key_res.has_error()) {
    fmt::println(std::cerr, "Bridge key aggregation failed: {}", key_res.error());
    return EXIT_FAILURE;
  }
  std::println(std::cout, "{}", key_res.value().toHex());
  return EXIT_SUCCESS;
}

inline int cmdGenParams(anchorwatch::injector::NodeInjector &injector,
                        const anchorwatch::app::Configuration &config,
                        const std::filesystem::path &directory,
                        size_t operator_cnt) {
  auto base_path =
      directory.is_absolute() ? directory : config.basePath() / directory;
  std::error_code ec;
  std::filesystem::create_directories(base_path, ec);
  if (ec) {
    fmt::println(
        std::cerr, "Can't create {}: {}", base_path.native(), ec.message());
    return EXIT_FAILURE;
  }

  auto settings = anchorwatch::RollupParamsSettings::newDefault();
  settings.proof_timeout = config.finality().proof_timeout;

  auto datatool = injector.injectDatatool();
  auto params_res =
      datatool->generateSimpleParams(base_path, settings, operator_cnt);
  if (params_res.has_error()) {
    fmt::println(std::cerr, "Params generation failed: {}", params_res.error());
    return EXIT_FAILURE;
  }
  auto &params = params_res.value();
  std::println(std::cout, "{}", params.params);
  for (auto &path : params.opseedpaths) {
    std::println(std::cerr, "operator seed: {}", path.native());
  }
  return EXIT_SUCCESS;
}

inline int cmdWaitProof(anchorwatch::injector::NodeInjector &injector,
                        const std::string &task_id) {
  auto waiter = injector.injectProofTaskWaiter();
  auto res = waiter->waitForProof(task_id);
  if (res.has_error()) {
    fmt::println(std::cerr, "Proof {} is not ready: {}", task_id, res.error());
    return EXIT_FAILURE;
  }
  std::println(std::cout, "{}", task_id);
  return EXIT_SUCCESS;
}

inline int cmdGenerateBlocks(anchorwatch::injector::NodeInjector &injector,
                             uint64_t count) {
  auto generator = injector.injectBlockGenerator();
  auto hashes = generator->generateNBlocks(count);
  if (hashes.size() != count) {
    fmt::println(std::cerr, "Generated {} of {} blocks", hashes.size(), count);
    return EXIT_FAILURE;
  }
  for (auto &hash : hashes) {
    std::println(std::cout, "{}", hash);
  }
  return EXIT_SUCCESS;
}
