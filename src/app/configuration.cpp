/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace anchorwatch::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("anchorwatch"),
        base_path_("."),
        sequencer_url_("http://localhost:8432"),
        bitcoin_{
            .url = "http://localhost:18443",
            .user = {},
            .password = {},
        },
        datatool_path_("strata-datatool") {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::string &Configuration::name() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const std::string &Configuration::sequencerUrl() const {
    return sequencer_url_;
  }

  const Configuration::BitcoinConfig &Configuration::bitcoin() const {
    return bitcoin_;
  }

  const std::optional<std::string> &Configuration::proverUrl() const {
    return prover_url_;
  }

  const Configuration::FinalityConfig &Configuration::finality() const {
    return finality_;
  }

  const Configuration::GeneratorConfig &Configuration::generator() const {
    return generator_;
  }

  const std::filesystem::path &Configuration::datatoolPath() const {
    return datatool_path_;
  }

  std::optional<ManualGenConfig> Configuration::manualGen() const {
    const auto &config = finality();
    if (not config.manual_gen) {
      return std::nullopt;
    }
    return ManualGenConfig{
        .finality_depth = config.depth,
        .gen_addr = config.gen_address,
    };
  }

}  // namespace anchorwatch::app
