/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"

using Endpoint = boost::asio::ip::tcp::endpoint;

OUTCOME_CPP_DEFINE_CATEGORY(prozchain::app, Configurator::Error, e) {
  using E = prozchain::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown log::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

}  // namespace

namespace prozchain::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "noname";

    config_->metrics_.endpoint = {boost::asio::ip::address_v4::any(), 9615};
    config_->metrics_.enabled = std::nullopt;

    const auto &timeouts = config_->consensus_.round.timeouts;
    const auto &pool = config_->consensus_.vote_pool;

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lconsensus=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description consensus_options("Consensus options");
    consensus_options.add_options()
        ("propose-timeout", po::value<uint32_t>()->default_value(timeouts.propose_base.count()), "Propose step timeout of round 0 <ms>.")
        ("propose-timeout-delta", po::value<uint32_t>()->default_value(timeouts.propose_delta.count()), "Propose step timeout increase per round <ms>.")
        ("prevote-timeout", po::value<uint32_t>()->default_value(timeouts.prevote_base.count()), "Prevote step timeout of round 0 <ms>.")
        ("prevote-timeout-delta", po::value<uint32_t>()->default_value(timeouts.prevote_delta.count()), "Prevote step timeout increase per round <ms>.")
        ("precommit-timeout", po::value<uint32_t>()->default_value(timeouts.precommit_base.count()), "Precommit step timeout of round 0 <ms>.")
        ("precommit-timeout-delta", po::value<uint32_t>()->default_value(timeouts.precommit_delta.count()), "Precommit step timeout increase per round <ms>.")
        ("future-heights", po::value<uint64_t>()->default_value(pool.future_heights), "Heights above current for which messages are buffered.")
        ("max-rounds-ahead", po::value<uint64_t>()->default_value(pool.max_rounds_ahead), "Rounds above current for which messages are buffered.")
        ("evidence-window", po::value<uint64_t>()->default_value(pool.evidence_window), "Heights below current kept for late messages and evidence.")
        ("liveness-alert-round", po::value<uint64_t>()->default_value(config_->consensus_.round.liveness_alert_round), "Round of one height from which stall is reported.")
        ("downtime-threshold", po::value<uint64_t>()->default_value(config_->consensus_.fault_detector.downtime_threshold), "Consecutive heights without precommit reported as downtime.")
        ("verification-threads", po::value<uint32_t>()->default_value(config_->consensus_.verification_threads), "Threads verifying signatures of inbound messages.")
        ("state-file", po::value<std::string>(), "File to persist entered rounds into. Can be relative on base path.")
        ;

    po::options_description testnet_options("Testnet options");
    testnet_options.add_options()
        ("validators", po::value<uint32_t>()->default_value(config_->testnet_.validators), "Number of generated validators.")
        ("validator-power", po::value<std::vector<uint64_t>>()->multitoken(), "Voting powers of generated validators, in order.")
        ("validators-file", po::value<std::string>(), "Path to yaml-file with validators and their seeds (see `generate-validators`).")
        ("fake-signatures", "Use fake signatures instead of ed25519.")
        ("target-height", po::value<uint64_t>()->default_value(config_->testnet_.target_height), "Stop after height is committed by all validators; 0 runs endlessly.")
        ("tick-interval", po::value<uint32_t>()->default_value(config_->testnet_.tick_interval.count()), "Interval of timeouts check <ms>.")
        ("equivocator", po::value<std::vector<uint32_t>>()->multitoken(), "Index of validator which signs conflicting prevotes.")
        ;

    po::options_description metrics_options("Metric options");
    metrics_options.add_options()
        ("prometheus_disable", "Set to disable OpenMetrics.")
        ("prometheus_host", po::value<std::string>(), "Set address for OpenMetrics over HTTP.")
        ("prometheus_port", po::value<uint16_t>(), "Set port for OpenMetrics over HTTP.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(consensus_options)
        .add(testnet_options)
        .add(metrics_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "ProzChain node version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      std::println(std::cout, "Other commands:");
      std::println(std::cout,
                   "  prozchain_node generate-validators <file> <count> [fake]");
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "ProzChain node version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: prozchain
        children:
          - name: consensus
          - name: testnet
          - name: application
          - name: metrics
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initConsensusConfig());
    OUTCOME_TRY(initTestnetConfig());
    OUTCOME_TRY(initOpenMetricsConfig());

    return config_;
  }

  template <typename T>
  std::optional<T> Configurator::scalar(const YAML::Node &section,
                                        std::string_view section_name,
                                        const char *name) {
    auto node = section[name];
    if (not node.IsDefined()) {
      return std::nullopt;
    }
    if (not node.IsScalar()) {
      file_errors_ << "E: Value '" << section_name << "." << name
                   << "' must be scalar\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    try {
      return node.as<T>();
    } catch (const YAML::BadConversion &) {
      file_errors_ << "E: Value '" << section_name << "." << name
                   << "' has invalid value\n";
      file_has_error_ = true;
      return std::nullopt;
    }
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  std::filesystem::path Configurator::makeAbsolute(
      const std::filesystem::path &path) const {
    return weakly_canonical(path.is_absolute() ? path
                                               : (config_->base_path_ / path));
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar<std::string>(section, "general", "name")) {
            config_->name_ = *value;
          }
          if (auto value =
                  scalar<std::string>(section, "general", "base-path")) {
            config_->base_path_ = *value;
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    if (config_->base_path_.empty()) {
      config_->base_path_ = std::filesystem::current_path();
    }
    if (not config_->base_path_.is_absolute()) {
      SL_ERROR(logger_,
               "The 'base_path' must be defined as absolute: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initConsensusConfig() {
    auto &consensus = config_->consensus_;
    auto &timeouts = consensus.round.timeouts;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["consensus"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto ms = [&](const char *name, std::chrono::milliseconds &target) {
            if (auto value = scalar<uint32_t>(section, "consensus", name)) {
              target = std::chrono::milliseconds(*value);
            }
          };
          ms("propose-timeout", timeouts.propose_base);
          ms("propose-timeout-delta", timeouts.propose_delta);
          ms("prevote-timeout", timeouts.prevote_base);
          ms("prevote-timeout-delta", timeouts.prevote_delta);
          ms("precommit-timeout", timeouts.precommit_base);
          ms("precommit-timeout-delta", timeouts.precommit_delta);

          auto u64 = [&](const char *name, uint64_t &target) {
            if (auto value = scalar<uint64_t>(section, "consensus", name)) {
              target = *value;
            }
          };
          u64("future-heights", consensus.vote_pool.future_heights);
          u64("max-rounds-ahead", consensus.vote_pool.max_rounds_ahead);
          u64("evidence-window", consensus.vote_pool.evidence_window);
          u64("liveness-alert-round", consensus.round.liveness_alert_round);
          u64("downtime-threshold",
              consensus.fault_detector.downtime_threshold);

          if (auto value =
                  scalar<uint32_t>(section, "consensus", "verification-threads")) {
            consensus.verification_threads = *value;
          }
          if (auto value =
                  scalar<std::string>(section, "consensus", "state-file")) {
            consensus.state_file = *value;
          }
        } else {
          file_errors_ << "E: Section 'consensus' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    auto ms = [&](const char *name, std::chrono::milliseconds &target) {
      find_argument<uint32_t>(cli_values_map_, name, [&](uint32_t value) {
        target = std::chrono::milliseconds(value);
      });
    };
    ms("propose-timeout", timeouts.propose_base);
    ms("propose-timeout-delta", timeouts.propose_delta);
    ms("prevote-timeout", timeouts.prevote_base);
    ms("prevote-timeout-delta", timeouts.prevote_delta);
    ms("precommit-timeout", timeouts.precommit_base);
    ms("precommit-timeout-delta", timeouts.precommit_delta);

    auto u64 = [&](const char *name, uint64_t &target) {
      find_argument<uint64_t>(
          cli_values_map_, name, [&](uint64_t value) { target = value; });
    };
    u64("future-heights", consensus.vote_pool.future_heights);
    u64("max-rounds-ahead", consensus.vote_pool.max_rounds_ahead);
    u64("evidence-window", consensus.vote_pool.evidence_window);
    u64("liveness-alert-round", consensus.round.liveness_alert_round);
    u64("downtime-threshold", consensus.fault_detector.downtime_threshold);

    find_argument<uint32_t>(
        cli_values_map_, "verification-threads", [&](uint32_t value) {
          consensus.verification_threads = value;
        });
    find_argument<std::string>(
        cli_values_map_, "state-file", [&](const std::string &value) {
          consensus.state_file = value;
        });

    // Check values
    if (timeouts.propose_base.count() == 0
        or timeouts.prevote_base.count() == 0
        or timeouts.precommit_base.count() == 0) {
      SL_ERROR(logger_, "Step timeouts of round 0 must be positive");
      return Error::InvalidValue;
    }
    if (consensus.vote_pool.evidence_window == 0) {
      SL_ERROR(logger_, "The 'evidence-window' must be at least 1");
      return Error::InvalidValue;
    }
    if (consensus.vote_pool.max_rounds_ahead == 0) {
      SL_ERROR(logger_, "The 'max-rounds-ahead' must be at least 1");
      return Error::InvalidValue;
    }
    if (consensus.verification_threads == 0) {
      SL_ERROR(logger_, "The 'verification-threads' must be at least 1");
      return Error::InvalidValue;
    }
    if (not consensus.state_file.empty()) {
      consensus.state_file = makeAbsolute(consensus.state_file);
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initTestnetConfig() {
    auto &testnet = config_->testnet_;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["testnet"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar<uint32_t>(section, "testnet", "validators")) {
            testnet.validators = *value;
          }
          auto powers = section["validator-powers"];
          if (powers.IsDefined()) {
            if (powers.IsSequence()) {
              testnet.powers.clear();
              for (const auto &power : powers) {
                try {
                  testnet.powers.push_back(power.as<VotingPower>());
                } catch (const YAML::BadConversion &) {
                  file_errors_ << "E: Value 'testnet.validator-powers' must "
                                  "contain only numbers\n";
                  file_has_error_ = true;
                  break;
                }
              }
            } else {
              file_errors_ << "E: Value 'testnet.validator-powers' must be "
                              "sequence\n";
              file_has_error_ = true;
            }
          }
          if (auto value =
                  scalar<std::string>(section, "testnet", "validators-file")) {
            testnet.validators_file = *value;
          }
          if (auto value =
                  scalar<bool>(section, "testnet", "fake-signatures")) {
            testnet.fake_signatures = *value;
          }
          if (auto value =
                  scalar<uint64_t>(section, "testnet", "target-height")) {
            testnet.target_height = *value;
          }
          if (auto value =
                  scalar<uint32_t>(section, "testnet", "tick-interval")) {
            testnet.tick_interval = std::chrono::milliseconds(*value);
          }
          auto equivocators = section["equivocators"];
          if (equivocators.IsDefined()) {
            if (equivocators.IsSequence()) {
              testnet.equivocators.clear();
              for (const auto &index : equivocators) {
                try {
                  testnet.equivocators.push_back(index.as<size_t>());
                } catch (const YAML::BadConversion &) {
                  file_errors_ << "E: Value 'testnet.equivocators' must "
                                  "contain only indices\n";
                  file_has_error_ = true;
                  break;
                }
              }
            } else {
              file_errors_
                  << "E: Value 'testnet.equivocators' must be sequence\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'testnet' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<uint32_t>(cli_values_map_, "validators", [&](uint32_t value) {
      testnet.validators = value;
    });
    find_argument<std::vector<uint64_t>>(
        cli_values_map_,
        "validator-power",
        [&](const std::vector<uint64_t> &values) {
          testnet.powers.assign(values.begin(), values.end());
        });
    find_argument<std::string>(
        cli_values_map_, "validators-file", [&](const std::string &value) {
          testnet.validators_file = value;
        });
    if (find_argument(cli_values_map_, "fake-signatures")) {
      testnet.fake_signatures = true;
    }
    find_argument<uint64_t>(
        cli_values_map_, "target-height", [&](uint64_t value) {
          testnet.target_height = value;
        });
    find_argument<uint32_t>(
        cli_values_map_, "tick-interval", [&](uint32_t value) {
          testnet.tick_interval = std::chrono::milliseconds(value);
        });
    find_argument<std::vector<uint32_t>>(
        cli_values_map_,
        "equivocator",
        [&](const std::vector<uint32_t> &values) {
          testnet.equivocators.assign(values.begin(), values.end());
        });

    // Check values
    if (testnet.tick_interval.count() == 0) {
      SL_ERROR(logger_, "The 'tick-interval' must be positive");
      return Error::InvalidValue;
    }
    if (std::ranges::contains(testnet.powers, VotingPower{0})) {
      SL_ERROR(logger_, "Validator power must be positive");
      return Error::InvalidValue;
    }
    if (not testnet.validators_file.empty()) {
      testnet.validators_file = makeAbsolute(testnet.validators_file);
      if (not is_regular_file(testnet.validators_file)) {
        SL_ERROR(logger_,
                 "The 'validators-file' does not exist or is not a file: {}",
                 testnet.validators_file.c_str());
        return Error::InvalidValue;
      }
    } else {
      if (testnet.validators == 0) {
        SL_ERROR(logger_, "At least one validator is required");
        return Error::InvalidValue;
      }
      if (testnet.powers.size() > testnet.validators) {
        SL_ERROR(logger_,
                 "{} powers given for {} validators",
                 testnet.powers.size(),
                 testnet.validators);
        return Error::InvalidValue;
      }
      for (auto index : testnet.equivocators) {
        if (index >= testnet.validators) {
          SL_ERROR(logger_,
                   "Equivocator index {} is out of {} validators",
                   index,
                   testnet.validators);
          return Error::InvalidValue;
        }
      }
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initOpenMetricsConfig() {
    if (config_file_.has_value()) {
      auto section = (*config_file_)["metrics"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto enabled = section["enabled"];
          if (enabled.IsDefined()) {
            if (enabled.IsScalar()) {
              auto value = enabled.as<std::string>();
              if (value == "true") {
                config_->metrics_.enabled = true;
              } else if (value == "false") {
                config_->metrics_.enabled = false;
              } else {
                file_errors_ << "E: Value 'metrics.enabled' has wrong value. "
                                "Expected 'true' or 'false'\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'metrics.enabled' must be scalar\n";
              file_has_error_ = true;
            }
          }

          auto host = section["host"];
          if (host.IsDefined()) {
            if (host.IsScalar()) {
              auto value = host.as<std::string>();
              boost::system::error_code ec;
              auto address = boost::asio::ip::make_address(value, ec);
              if (!ec) {
                config_->metrics_.endpoint = {
                    address, config_->metrics_.endpoint.port()};
                if (not config_->metrics_.enabled.has_value()) {
                  config_->metrics_.enabled = true;
                }
              } else {
                file_errors_ << "E: Value 'metrics.host' defined, "
                                "but has invalid value\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'metrics.host' defined, "
                              "but is not scalar\n";
              file_has_error_ = true;
            }
          }

          auto port = section["port"];
          if (port.IsDefined()) {
            if (port.IsScalar()) {
              auto value = port.as<ssize_t>();
              if (value > 0 and value <= 65535) {
                config_->metrics_.endpoint = {
                    config_->metrics_.endpoint.address(),
                    static_cast<uint16_t>(value)};
                if (not config_->metrics_.enabled.has_value()) {
                  config_->metrics_.enabled = true;
                }
              } else {
                file_errors_ << "E: Value 'metrics.port' defined, "
                                "but has invalid value\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'metrics.port' defined, "
                              "but is not scalar\n";
              file_has_error_ = true;
            }
          }

        } else {
          file_errors_ << "E: Section 'metrics' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    bool fail;

    fail = false;
    find_argument<std::string>(
        cli_values_map_, "prometheus_host", [&](const std::string &value) {
          boost::system::error_code ec;
          auto address = boost::asio::ip::make_address(value, ec);
          if (!ec) {
            config_->metrics_.endpoint = {address,
                                          config_->metrics_.endpoint.port()};
            if (not config_->metrics_.enabled.has_value()) {
              config_->metrics_.enabled = true;
            }
          } else {
            std::cerr << "Option --prometheus_host has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    fail = false;
    find_argument<uint16_t>(
        cli_values_map_, "prometheus_port", [&](const uint16_t &value) {
          if (value > 0) {
            config_->metrics_.endpoint = {config_->metrics_.endpoint.address(),
                                          value};
            if (not config_->metrics_.enabled.has_value()) {
              config_->metrics_.enabled = true;
            }
          } else {
            std::cerr << "Option --prometheus_port has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    if (find_argument(cli_values_map_, "prometheus_disable")) {
      config_->metrics_.enabled = false;
    }
    if (not config_->metrics_.enabled.has_value()) {
      config_->metrics_.enabled = false;
    }

    return outcome::success();
  }

}  // namespace prozchain::app
