/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "app/impl/local_testnet.hpp"
#include "clock/impl/clock_impl.hpp"
#include "commands/generate_validators.hpp"
#include "log/logger.hpp"
#include "metrics/impl/exposer.hpp"
#include "metrics/impl/metrics_impl.hpp"
#include "metrics/impl/prometheus/registry_impl.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using prozchain::app::Configuration;
  using prozchain::app::LocalTestnet;
  using prozchain::log::LoggingSystem;

  int run_node(std::shared_ptr<LoggingSystem> logsys,
               std::shared_ptr<Configuration> appcfg) {
    std::shared_ptr<prozchain::metrics::PrometheusRegistry> registry =
        prozchain::metrics::PrometheusRegistry::create();
    auto metrics = std::make_shared<prozchain::metrics::MetricsImpl>(registry);
    auto exposer = std::make_shared<prozchain::metrics::Exposer>(
        logsys, registry->registry());

    auto logger =
        logsys->getLogger("Main", prozchain::log::defaultGroupName);
    auto app = std::make_unique<LocalTestnet>(
        logsys,
        appcfg,
        metrics,
        std::make_shared<prozchain::clock::SystemClockImpl>(),
        std::make_shared<prozchain::clock::SteadyClockImpl>(),
        exposer);
    SL_INFO(logger, "Node started. Version: {} ", appcfg->nodeVersion());

    auto exit_code = app->run();

    SL_INFO(logger, "Node stopped");
    logger->flush();

    return exit_code;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("prozchain-node");

  auto getArg = [&](size_t i) {
    return static_cast<ptrdiff_t>(i) < argc
             ? std::make_optional(std::string_view{argv[i]})
             : std::nullopt;
  };

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc == 0) {
    // Abnormal run
    wrong_usage();
    return EXIT_FAILURE;
  }

  if (getArg(1) == "generate-validators") {
    return cmdGenerateValidators(getArg);
  }

  auto app_configurator =
      std::make_unique<prozchain::app::Configurator>(argc, argv, env);

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

  if (auto res = logging_system->tuneLoggingSystem(
          app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Wrong logging filter: {}", res.error());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "prozchain");

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

  auto exit_code = run_node(logging_system, app_configuration);

  auto logger =
      logging_system->getLogger("Main", prozchain::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
