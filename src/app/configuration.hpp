/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <utils/ctor_limiters.hpp>

#include "types/checkpoint_info.hpp"
#include "types/manual_gen_config.hpp"

namespace anchorwatch::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct BitcoinConfig {
      std::string url;
      std::string user;
      std::string password;
    };

    struct FinalityConfig {
      uint64_t depth = 6;
      bool manual_gen = false;
      std::string gen_address;
      std::optional<std::chrono::seconds> proof_timeout;
      /// Number of consecutive checkpoints to check
      uint64_t checkpoints = 1;
      CheckpointIdx start_index = 0;
      /// Bound for organic confirmations when blocks are not mined manually
      std::chrono::seconds confirmation_timeout{3600};
    };

    struct GeneratorConfig {
      /// Zero disables the ambient generator
      std::chrono::milliseconds interval{0};
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::string &name() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;
    [[nodiscard]] virtual const std::string &sequencerUrl() const;
    [[nodiscard]] virtual const BitcoinConfig &bitcoin() const;
    [[nodiscard]] virtual const std::optional<std::string> &proverUrl() const;
    [[nodiscard]] virtual const FinalityConfig &finality() const;
    [[nodiscard]] virtual const GeneratorConfig &generator() const;
    [[nodiscard]] virtual const std::filesystem::path &datatoolPath() const;

    /// Set when blocks are mined explicitly to reach finality depth
    [[nodiscard]] std::optional<ManualGenConfig> manualGen() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;
    std::string sequencer_url_;
    BitcoinConfig bitcoin_;
    std::optional<std::string> prover_url_;
    FinalityConfig finality_;
    GeneratorConfig generator_;
    std::filesystem::path datatool_path_;
  };

}  // namespace anchorwatch::app
