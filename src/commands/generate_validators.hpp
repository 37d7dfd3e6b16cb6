/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <yaml-cpp/yaml.h>

#include "testnet/validator_keys.hpp"

/**
 * `generate-validators <file> <count> [fake]`: writes validators file with
 * random seeds, loadable by `--validators-file`
 */
inline int cmdGenerateValidators(auto &&getArg) {
  auto cmd = [](const std::filesystem::path &path,
                size_t validator_count,
                bool fake) {
    auto keys =
        prozchain::testnet::randomValidatorKeys(validator_count, fake);
    if (keys.has_error()) {
      fmt::println(std::cerr, "Can't generate validators: {}", keys.error());
      return EXIT_FAILURE;
    }
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file{path};
    file << prozchain::testnet::toYaml(keys.value()) << "\n";
    file.close();
    if (not file) {
      fmt::println(std::cerr, "Can't write {}", path.string());
      return EXIT_FAILURE;
    }
    for (const auto &key : keys.value()) {
      fmt::println("{} {:0xx}", key.name, key.address());
    }
    return EXIT_SUCCESS;
  };
  if (auto arg_2 = getArg(2)) {
    std::filesystem::path path{*arg_2};
    if (auto arg_3 = getArg(3)) {
      size_t validator_count = 0;
      try {
        validator_count = std::stoul(std::string{*arg_3});
      } catch (const std::exception &) {
        validator_count = 0;
      }
      if (validator_count != 0) {
        auto arg_4 = getArg(4);
        auto fake = arg_4 == "fake";
        if (not arg_4 or fake) {
          return cmd(path, validator_count, fake);
        }
      }
    }
  }
  auto exe = std::filesystem::path{getArg(0).value()}.filename().string();
  fmt::println(std::cerr,
               "Usage: {} generate-validators (file) (validator_count) (fake?)",
               exe);
  return EXIT_FAILURE;
}
