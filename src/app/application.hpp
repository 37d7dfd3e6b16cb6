/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utils/ctor_limiters.hpp>

namespace prozchain::app {

  /// @class Application - ProzChain-application interface
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Runs node until it is stopped; returns exit code of process
    virtual int run() = 0;
  };

}  // namespace prozchain::app
