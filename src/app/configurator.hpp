/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <log/logger.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "injector/dont_inject.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace anchorwatch::app {
  class Configuration;
}  // namespace anchorwatch::app

namespace anchorwatch::app {

  /**
   * Builds Configuration from defaults, an optional YAML file and CLI flags,
   * applied in this order.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed,
      ConfigFileParseFailed,
      InvalidValue,
    };

    DONT_INJECT(Configurator);

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv);

    // Parse CLI args for help, version and config
    outcome::result<bool> step1();

    // Parse remaining CLI args
    outcome::result<bool> step2();

    outcome::result<YAML::Node> getLoggingConfig();
    const std::vector<std::string> &getLoggingCliArgs() const {
      return logger_cli_args_;
    }

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initEndpointsConfig();
    outcome::result<void> initFinalityConfig();
    outcome::result<void> initToolsConfig();

    /// @return section of config file if it is defined and is a map
    std::optional<YAML::Node> fileSection(const std::string &name);

    /// Reads `section.key` into `apply` if defined, recording problems
    template <typename T, typename F>
    void readValue(const YAML::Node &section,
                   const std::string &section_name,
                   const std::string &key,
                   F &&apply);

    outcome::result<void> reportFileErrors();

    int argc_;
    const char **argv_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace anchorwatch::app

OUTCOME_HPP_DECLARE_ERROR(anchorwatch::app, Configurator::Error);
