/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tools/datatool.hpp"

#include <iterator>

#include <boost/algorithm/string/trim.hpp>
#include <boost/process.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "app/configuration.hpp"

namespace anchorwatch::tools {
  namespace bp = boost::process;

  Datatool::Datatool(qtils::SharedRef<log::LoggingSystem> logging_system,
                     const app::Configuration &config)
      : Datatool{std::move(logging_system), config.datatoolPath()} {}

  Datatool::Datatool(qtils::SharedRef<log::LoggingSystem> logging_system,
                     std::filesystem::path executable)
      : logger_{logging_system->getLogger("Datatool", "tools")},
        executable_{std::move(executable)} {}

  outcome::result<void> Datatool::genSeed(
      const std::filesystem::path &path) const {
    BOOST_OUTCOME_TRY(run({"genseed", "-f", path.string()}, false));
    return outcome::success();
  }

  outcome::result<std::string> Datatool::genSeqPubkey(
      const std::filesystem::path &seed) const {
    BOOST_OUTCOME_TRY(auto pubkey,
                      run({"genseqpubkey", "-f", seed.string()}, true));
    SL_INFO(logger_, "Sequencer pubkey: {}", pubkey);
    return pubkey;
  }

  outcome::result<std::string> Datatool::genOpXpub(
      const std::filesystem::path &seed) const {
    return run({"genopxpub", "-f", seed.string()}, true);
  }

  std::vector<std::string> Datatool::genParamsArgs(
      const RollupParamsSettings &settings,
      const std::string &seqkey,
      const std::vector<std::string> &opkeys) {
    std::vector<std::string> args{
        "genparams",
        "--name",
        std::string{kRollupName},
        "--block-time",
        std::to_string(settings.block_time_sec),
        "--epoch-slots",
        std::to_string(settings.epoch_slots),
        "--genesis-trigger-height",
        std::to_string(settings.genesis_trigger_height),
        "--seqkey",
        seqkey,
    };
    if (settings.proof_timeout.has_value()) {
      args.emplace_back("--proof-timeout");
      args.emplace_back(std::to_string(settings.proof_timeout->count()));
    }
    for (auto &opkey : opkeys) {
      args.emplace_back("--opkey");
      args.emplace_back(opkey);
    }
    return args;
  }

  outcome::result<std::string> Datatool::genParams(
      const RollupParamsSettings &settings,
      const std::string &seqkey,
      const std::vector<std::string> &opkeys) const {
    return run(genParamsArgs(settings, seqkey, opkeys), true);
  }

  outcome::result<SimpleParams> Datatool::generateSimpleParams(
      const std::filesystem::path &base_path,
      const RollupParamsSettings &settings,
      size_t operator_cnt) const {
    auto seqseedpath = base_path / "seqkey.bin";
    SimpleParams result;
    for (size_t i = 0; i < operator_cnt; ++i) {
      result.opseedpaths.emplace_back(base_path / fmt::format("opkey{}.bin", i));
    }

    BOOST_OUTCOME_TRY(genSeed(seqseedpath));
    for (auto &path : result.opseedpaths) {
      BOOST_OUTCOME_TRY(genSeed(path));
    }

    BOOST_OUTCOME_TRY(auto seqkey, genSeqPubkey(seqseedpath));
    std::vector<std::string> opxpubs;
    for (auto &path : result.opseedpaths) {
      BOOST_OUTCOME_TRY(auto opxpub, genOpXpub(path));
      opxpubs.emplace_back(std::move(opxpub));
    }

    BOOST_OUTCOME_TRY(result.params, genParams(settings, seqkey, opxpubs));
    SL_DEBUG(logger_, "Params: {}", result.params);
    return result;
  }

  outcome::result<std::string> Datatool::run(std::vector<std::string> args,
                                             bool expect_output) const {
    args.insert(args.begin(), {"-b", std::string{kBitcoinNetwork}});

    boost::filesystem::path executable = executable_.native();
    if (not executable_.has_parent_path()) {
      executable = bp::search_path(executable_.native());
      if (executable.empty()) {
        SL_ERROR(logger_, "{} is not found in PATH", executable_.native());
        return DatatoolError::SPAWN_FAILED;
      }
    }
    SL_DEBUG(logger_, "Running {} {}", executable.string(), fmt::join(args, " "));

    std::error_code ec;
    bp::ipstream out;
    bp::child child{bp::exe = executable.string(),
                    bp::args = args,
                    bp::std_out > out,
                    ec};
    if (ec) {
      SL_ERROR(logger_, "Can't run {}: {}", executable.string(), ec.message());
      return DatatoolError::SPAWN_FAILED;
    }
    std::string output{std::istreambuf_iterator<char>{out},
                       std::istreambuf_iterator<char>{}};
    child.wait(ec);
    if (ec) {
      SL_ERROR(logger_, "Waiting for {} failed: {}", args.at(2), ec.message());
      return DatatoolError::SPAWN_FAILED;
    }
    if (child.exit_code() != 0) {
      SL_ERROR(logger_, "{} exited with code {}", args.at(2), child.exit_code());
      return DatatoolError::NON_ZERO_EXIT;
    }

    boost::algorithm::trim(output);
    if (expect_output and output.empty()) {
      SL_ERROR(logger_, "{}: no output generated", args.at(2));
      return DatatoolError::EMPTY_OUTPUT;
    }
    return output;
  }
}  // namespace anchorwatch::tools
