/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <utils/ctor_limiters.hpp>

namespace ics02::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct RegistryConfig {
      std::filesystem::path script;
      std::optional<std::filesystem::path> state;
      bool dump_state = false;
    };

    struct MetricsConfig {
      bool dump = false;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;

    [[nodiscard]] virtual const RegistryConfig &registry() const;

    [[nodiscard]] virtual const MetricsConfig &metrics() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;

    RegistryConfig registry_;
    MetricsConfig metrics_;
  };

}  // namespace ics02::app
