/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */


#pragma once

#include <gmock/gmock.h>

#include "app/configuration.hpp"

namespace anchorwatch::app {

  class ConfigurationMock : public Configuration {
   public:
    // clang-format off
    MOCK_METHOD(const std::string&, version, (), (const, override));
    MOCK_METHOD(const std::string&, name, (), (const, override));
    MOCK_METHOD(const std::filesystem::path&, basePath, (), (const, override));
    MOCK_METHOD(const std::string&, sequencerUrl, (), (const, override));
    MOCK_METHOD(const BitcoinConfig &, bitcoin, (), (const, override));
    MOCK_METHOD(const std::optional<std::string> &, proverUrl, (), (const, override));

    MOCK_METHOD(const FinalityConfig &, finality, (), (const, override));
    MOCK_METHOD(const GeneratorConfig &, generator, (), (const, override));

    MOCK_METHOD(const std::filesystem::path&, datatoolPath, (), (const, override));
    // clang-format on
  };

}  // namespace anchorwatch::app
