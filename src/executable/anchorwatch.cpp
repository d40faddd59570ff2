/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "app/application.hpp"
#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "executable/commands.hpp"
#include "injector/node_injector.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using anchorwatch::app::Application;
  using anchorwatch::app::Configuration;
  using anchorwatch::injector::NodeInjector;
  using anchorwatch::log::LoggingSystem;

  struct Subcommand {
    std::string_view name;
    size_t arg_count;
  };

  constexpr std::array<Subcommand, 4> kSubcommands{{
      {"bridge-key", 0},
      {"gen-params", 2},
      {"wait-proof", 1},
      {"generate-blocks", 1},
  }};

  int run_checks(std::shared_ptr<LoggingSystem> logsys,
                 std::shared_ptr<Configuration> appcfg) {
    auto injector = std::make_unique<NodeInjector>(logsys, appcfg);

    auto logger =
        logsys->getLogger("Main", anchorwatch::log::defaultGroupName);
    auto app = injector->injectApplication();
    SL_INFO(logger, "Started. Version: {} ", appcfg->version());

    auto res = app->run();
    if (res.has_error()) {
      fmt::println(std::cerr, "Finality check failed: {}", res.error());
      logger->flush();
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "All checkpoints are finalized");
    logger->flush();

    return EXIT_SUCCESS;
  }

  int run_subcommand(std::string_view name,
                     const std::vector<std::string_view> &args,
                     std::shared_ptr<LoggingSystem> logsys,
                     std::shared_ptr<Configuration> appcfg) {
    NodeInjector injector{logsys, appcfg};
    if (name == "bridge-key") {
      return cmdBridgeKey(injector);
    }
    if (name == "gen-params") {
      auto operator_cnt = parseCount(args.at(1));
      if (not operator_cnt.has_value()) {
        wrong_usage();
        return EXIT_FAILURE;
      }
      return cmdGenParams(injector, *appcfg, args.at(0), *operator_cnt);
    }
    if (name == "wait-proof") {
      return cmdWaitProof(injector, std::string{args.at(0)});
    }
    if (name == "generate-blocks") {
      auto count = parseCount(args.at(0));
      if (not count.has_value()) {
        wrong_usage();
        return EXIT_FAILURE;
      }
      return cmdGenerateBlocks(injector, *count);
    }
    wrong_usage();
    return EXIT_FAILURE;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("anchorwatch");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc == 0) {
    // Abnormal run
    wrong_usage();
    return EXIT_FAILURE;
  }

  // Split off subcommand and its positional arguments, flags go to configurator
  std::optional<Subcommand> subcommand;
  std::vector<std::string_view> subcommand_args;
  std::vector<const char *> option_args{argv[0]};
  int next = 1;
  if (argc > 1 and std::string_view{argv[1]}.substr(0, 1) != "-") {
    std::string_view name{argv[1]};
    for (auto &known : kSubcommands) {
      if (known.name == name) {
        subcommand = known;
      }
    }
    if (not subcommand.has_value()
        or argc < 2 + static_cast<int>(subcommand->arg_count)) {
      wrong_usage();
      return EXIT_FAILURE;
    }
    for (size_t i = 0; i < subcommand->arg_count; ++i) {
      subcommand_args.emplace_back(argv[2 + i]);
    }
    next = 2 + static_cast<int>(subcommand->arg_count);
  }
  for (int i = next; i < argc; ++i) {
    option_args.emplace_back(argv[i]);
  }

  auto app_configurator = std::make_unique<anchorwatch::app::Configurator>(
      static_cast<int>(option_args.size()), option_args.data());

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  if (auto res =
          logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Invalid logging filter: {}", res.error());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger(
        "Configurator", anchorwatch::log::defaultGroupName);

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  int exit_code;
  auto logger = logging_system->getLogger("Main",
                                          anchorwatch::log::defaultGroupName);
  if (subcommand.has_value()) {
    exit_code = run_subcommand(subcommand->name,
                               subcommand_args,
                               logging_system,
                               app_configuration);
  } else {
    exit_code = run_checks(logging_system, app_configuration);
  }

  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
