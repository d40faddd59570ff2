/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(anchorwatch::log, Error, e) {
  using E = anchorwatch::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_LOGGER:
      return "Unknown logger";
  }
  return "Unknown log::Error";
}

namespace anchorwatch::log {

  namespace {
    // short aliases are accepted for the levels used most on command line
    constexpr std::array<std::pair<std::string_view, Level>, 12> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    for (std::string_view chunk : cfg) {
      // bare level applies to the root group
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        BOOST_OUTCOME_TRY(auto level, str2lvl(chunk));
        logging_system_->setLevelOfGroup(defaultGroupName, level);
        continue;
      }

      std::string group_name{chunk.substr(0, eq)};
      if (not logging_system_->getGroup(group_name)) {
        return Error::WRONG_GROUP;
      }
      BOOST_OUTCOME_TRY(auto level, str2lvl(chunk.substr(eq + 1)));
      logging_system_->setLevelOfGroup(group_name, level);
    }
    return outcome::success();
  }

}  // namespace anchorwatch::log
