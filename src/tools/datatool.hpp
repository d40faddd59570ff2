/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <boost/di.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/rollup_params.hpp"

namespace anchorwatch::app {
  class Configuration;
}  // namespace anchorwatch::app

namespace anchorwatch::tools {
  enum class DatatoolError : uint8_t {
    SPAWN_FAILED = 1,
    NON_ZERO_EXIT,
    EMPTY_OUTPUT,
  };
  Q_ENUM_ERROR_CODE(DatatoolError) {
    using E = decltype(e);
    switch (e) {
      case E::SPAWN_FAILED:
        return "Could not run the parameter tool";
      case E::NON_ZERO_EXIT:
        return "Parameter tool exited with error";
      case E::EMPTY_OUTPUT:
        return "no output generated";
    }
    abort();
  }

  /// Params document and the operator seed files it was generated from
  struct SimpleParams {
    std::string params;
    std::vector<std::filesystem::path> opseedpaths;
  };

  /**
   * Runs the external key-derivation and rollup parameter tool.
   */
  class Datatool {
   public:
    static constexpr std::string_view kBitcoinNetwork = "regtest";
    static constexpr std::string_view kRollupName = "alpenstrata";

    Datatool(qtils::SharedRef<log::LoggingSystem> logging_system,
             const app::Configuration &config);
    BOOST_DI_INJECT_TRAITS(qtils::SharedRef<anchorwatch::log::LoggingSystem>,
                           const anchorwatch::app::Configuration &);
    Datatool(qtils::SharedRef<log::LoggingSystem> logging_system,
             std::filesystem::path executable);

    /// Writes a new seed file at `path`
    outcome::result<void> genSeed(const std::filesystem::path &path) const;

    outcome::result<std::string> genSeqPubkey(
        const std::filesystem::path &seed) const;

    outcome::result<std::string> genOpXpub(
        const std::filesystem::path &seed) const;

    outcome::result<std::string> genParams(
        const RollupParamsSettings &settings,
        const std::string &seqkey,
        const std::vector<std::string> &opkeys) const;

    /**
     * Creates `seqkey.bin` and `opkey<i>.bin` seeds in `base_path` and
     * generates params for them.
     */
    outcome::result<SimpleParams> generateSimpleParams(
        const std::filesystem::path &base_path,
        const RollupParamsSettings &settings,
        size_t operator_cnt) const;

    /// Command line of `genparams`, without the executable and network flag
    static std::vector<std::string> genParamsArgs(
        const RollupParamsSettings &settings,
        const std::string &seqkey,
        const std::vector<std::string> &opkeys);

   private:
    /// @return trimmed standard output
    outcome::result<std::string> run(std::vector<std::string> args,
                                     bool expect_output) const;

    log::Logger logger_;
    std::filesystem::path executable_;
  };
}  // namespace anchorwatch::tools
