/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace ics02::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        registry_{
            .script{},
            .state{},
            .dump_state = false,
        },
        metrics_{
            .dump = false,
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const Configuration::RegistryConfig &Configuration::registry() const {
    return registry_;
  }

  const Configuration::MetricsConfig &Configuration::metrics() const {
    return metrics_;
  }

}  // namespace ics02::app
