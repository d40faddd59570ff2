/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <utility>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/http.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(anchorwatch::app, Configurator::Error, e) {
  using E = anchorwatch::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown log::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

}  // namespace

namespace anchorwatch::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. Relative paths of seed files are resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of the instance.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lrpc=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description endpoint_options("Endpoint options");
    endpoint_options.add_options()
        ("sequencer-url", po::value<std::string>(), "Sequencer JSON-RPC url.")
        ("bitcoin-url", po::value<std::string>(), "Bitcoin node JSON-RPC url.")
        ("bitcoin-user", po::value<std::string>(), "Bitcoin node RPC user.")
        ("bitcoin-password", po::value<std::string>(), "Bitcoin node RPC password.")
        ("prover-url", po::value<std::string>(), "Prover JSON-RPC url. Required by `wait-proof`.")
        ;

    po::options_description finality_options("Finality options");
    finality_options.add_options()
        ("finality-depth", po::value<uint64_t>(), "L1 confirmations after which a checkpoint is finalized.")
        ("manual-gen", "Mine L1 blocks explicitly to reach finality depth.")
        ("gen-address", po::value<std::string>(), "Address to mine blocks to. A fresh wallet address is used if empty.")
        ("proof-timeout", po::value<uint64_t>(), "Seconds after which the sequencer publishes an empty proof itself.")
        ("checkpoints", po::value<uint64_t>(), "Number of consecutive checkpoints to check.")
        ("start-index", po::value<uint64_t>(), "Index of the first checkpoint to check.")
        ("confirmation-timeout", po::value<uint64_t>(), "Seconds to wait for organic confirmations of an anchor.")
        ;

    po::options_description tool_options("Tool options");
    tool_options.add_options()
        ("generator-interval", po::value<uint64_t>(), "Milliseconds between blocks mined in background. 0 disables.")
        ("datatool-path", po::value<std::string>(), "Path or name of the parameter tool executable.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(endpoint_options)
        .add(finality_options)
        .add(tool_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "anchorwatch version " << buildVersion() << '\n';
      std::cout << "Usage: anchorwatch [command] [options]\n";
      std::cout << cli_options_ << '\n';
      std::println(std::cout, "Commands:");
      std::println(std::cout,
                   "  (none)                      check checkpoints finality");
      std::println(std::cout,
                   "  bridge-key                  print aggregated bridge key");
      std::println(std::cout,
                   "  gen-params <dir> <count>    generate rollup params");
      std::println(std::cout,
                   "  wait-proof <task-id>        wait for prover task");
      std::println(std::cout,
                   "  generate-blocks <count>     mine L1 blocks");
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "anchorwatch version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &value) {
          logger_cli_args_ = value;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: anchorwatch
    sink: console
    level: info
    is_fallback: true
    children:
      - name: application
      - name: rpc
      - name: finality
      - name: bridge
      - name: l1
      - name: tools
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    BOOST_OUTCOME_TRY(initGeneralConfig());
    BOOST_OUTCOME_TRY(initEndpointsConfig());
    BOOST_OUTCOME_TRY(initFinalityConfig());
    BOOST_OUTCOME_TRY(initToolsConfig());

    return config_;
  }

  std::optional<YAML::Node> Configurator::fileSection(const std::string &name) {
    if (not config_file_.has_value()) {
      return std::nullopt;
    }
    auto section = (*config_file_)[name];
    if (not section.IsDefined()) {
      return std::nullopt;
    }
    if (not section.IsMap()) {
      file_errors_ << "E: Section '" << name << "' defined, but is not map\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    return section;
  }

  template <typename T, typename F>
  void Configurator::readValue(const YAML::Node &section,
                               const std::string &section_name,
                               const std::string &key,
                               F &&apply) {
    auto node = section[key];
    if (not node.IsDefined()) {
      return;
    }
    if (not node.IsScalar()) {
      file_errors_ << "E: Value '" << section_name << "." << key
                   << "' must be scalar\n";
      file_has_error_ = true;
      return;
    }
    try {
      std::forward<F>(apply)(node.as<T>());
    } catch (const YAML::BadConversion &) {
      file_errors_ << "E: Value '" << section_name << "." << key
                   << "' has invalid value\n";
      file_has_error_ = true;
    }
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (auto section = fileSection("general")) {
      readValue<std::string>(
          *section, "general", "name", [&](const std::string &value) {
            config_->name_ = value;
          });
      readValue<std::string>(
          *section, "general", "base-path", [&](const std::string &value) {
            config_->base_path_ = value;
          });
    }
    BOOST_OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    config_->base_path_ = std::filesystem::absolute(config_->base_path_);
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initEndpointsConfig() {
    // Init by config-file
    if (auto section = fileSection("sequencer")) {
      readValue<std::string>(
          *section, "sequencer", "url", [&](const std::string &value) {
            config_->sequencer_url_ = value;
          });
    }
    if (auto section = fileSection("bitcoin")) {
      readValue<std::string>(
          *section, "bitcoin", "url", [&](const std::string &value) {
            config_->bitcoin_.url = value;
          });
      readValue<std::string>(
          *section, "bitcoin", "user", [&](const std::string &value) {
            config_->bitcoin_.user = value;
          });
      readValue<std::string>(
          *section, "bitcoin", "password", [&](const std::string &value) {
            config_->bitcoin_.password = value;
          });
    }
    if (auto section = fileSection("prover")) {
      readValue<std::string>(
          *section, "prover", "url", [&](const std::string &value) {
            auto trimmed = boost::trim_copy(value);
            if (trimmed.empty()) {
              config_->prover_url_.reset();
            } else {
              config_->prover_url_ = trimmed;
            }
          });
    }
    BOOST_OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "sequencer-url", [&](const std::string &value) {
          config_->sequencer_url_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "bitcoin-url", [&](const std::string &value) {
          config_->bitcoin_.url = value;
        });
    find_argument<std::string>(
        cli_values_map_, "bitcoin-user", [&](const std::string &value) {
          config_->bitcoin_.user = value;
        });
    find_argument<std::string>(
        cli_values_map_, "bitcoin-password", [&](const std::string &value) {
          config_->bitcoin_.password = value;
        });
    find_argument<std::string>(
        cli_values_map_, "prover-url", [&](const std::string &value) {
          config_->prover_url_ = value;
        });

    // Check values
    auto check_url = [&](std::string_view option, const std::string &url) {
      auto res = http::parseUrl(url);
      if (res.has_error()) {
        SL_ERROR(logger_,
                 "The '{}' is not a valid url ({}): {}",
                 option,
                 res.error(),
                 url);
        return false;
      }
      return true;
    };
    if (not check_url("sequencer.url", config_->sequencer_url_)) {
      return Error::InvalidValue;
    }
    if (not check_url("bitcoin.url", config_->bitcoin_.url)) {
      return Error::InvalidValue;
    }
    if (config_->prover_url_.has_value()
        and not check_url("prover.url", config_->prover_url_.value())) {
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initFinalityConfig() {
    auto &finality = config_->finality_;

    // Init by config-file
    if (auto section = fileSection("finality")) {
      readValue<uint64_t>(
          *section, "finality", "depth", [&](uint64_t value) {
            finality.depth = value;
          });
      readValue<bool>(
          *section, "finality", "manual-gen", [&](bool value) {
            finality.manual_gen = value;
          });
      readValue<std::string>(
          *section, "finality", "gen-address", [&](const std::string &value) {
            finality.gen_address = value;
          });
      readValue<uint64_t>(
          *section, "finality", "proof-timeout", [&](uint64_t value) {
            finality.proof_timeout = std::chrono::seconds(value);
          });
      readValue<uint64_t>(
          *section, "finality", "checkpoints", [&](uint64_t value) {
            finality.checkpoints = value;
          });
      readValue<uint64_t>(
          *section, "finality", "start-index", [&](uint64_t value) {
            finality.start_index = value;
          });
      readValue<uint64_t>(
          *section, "finality", "confirmation-timeout", [&](uint64_t value) {
            finality.confirmation_timeout = std::chrono::seconds(value);
          });
    }
    BOOST_OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<uint64_t>(
        cli_values_map_, "finality-depth", [&](uint64_t value) {
          finality.depth = value;
        });
    if (find_argument(cli_values_map_, "manual-gen")) {
      finality.manual_gen = true;
    }
    find_argument<std::string>(
        cli_values_map_, "gen-address", [&](const std::string &value) {
          finality.gen_address = value;
        });
    find_argument<uint64_t>(
        cli_values_map_, "proof-timeout", [&](uint64_t value) {
          finality.proof_timeout = std::chrono::seconds(value);
        });
    find_argument<uint64_t>(
        cli_values_map_, "checkpoints", [&](uint64_t value) {
          finality.checkpoints = value;
        });
    find_argument<uint64_t>(
        cli_values_map_, "start-index", [&](uint64_t value) {
          finality.start_index = value;
        });
    find_argument<uint64_t>(
        cli_values_map_, "confirmation-timeout", [&](uint64_t value) {
          finality.confirmation_timeout = std::chrono::seconds(value);
        });

    // Check values
    if (finality.depth == 0) {
      SL_ERROR(logger_, "The 'finality.depth' must be positive");
      return Error::InvalidValue;
    }
    if (finality.confirmation_timeout.count() == 0) {
      SL_ERROR(logger_, "The 'finality.confirmation-timeout' must be positive");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initToolsConfig() {
    // Init by config-file
    if (auto section = fileSection("generator")) {
      readValue<uint64_t>(
          *section, "generator", "interval-ms", [&](uint64_t value) {
            config_->generator_.interval = std::chrono::milliseconds(value);
          });
    }
    if (auto section = fileSection("datatool")) {
      readValue<std::string>(
          *section, "datatool", "path", [&](const std::string &value) {
            config_->datatool_path_ = value;
          });
    }
    BOOST_OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<uint64_t>(
        cli_values_map_, "generator-interval", [&](uint64_t value) {
          config_->generator_.interval = std::chrono::milliseconds(value);
        });
    find_argument<std::string>(
        cli_values_map_, "datatool-path", [&](const std::string &value) {
          config_->datatool_path_ = value;
        });

    // Check values
    if (config_->datatool_path_.empty()) {
      SL_ERROR(logger_, "The 'datatool.path' must not be empty");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

}  // namespace anchorwatch::app
