//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "app/review_session.hpp"
#include "config/session_config.hpp"
#include "error/errors.hpp"

namespace {
struct CommandLine {
  std::filesystem::path                source_;
  std::filesystem::path                destination_;
  std::optional<std::filesystem::path> config_{};
  bool                                 warm_    = false;
  bool                                 verbose_ = false;
};

void PrintUsage(const char* program) {
  std::cerr << "usage: " << program
            << " <source_folder> <destination_folder> [--config <file>] [--warm] [--verbose]\n";
}

auto ParseCommandLine(int argc, char* argv[]) -> std::optional<CommandLine> {
  CommandLine              cmd;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) return std::nullopt;
      cmd.config_ = argv[++i];
    } else if (arg == "--warm") {
      cmd.warm_ = true;
    } else if (arg == "--verbose" || arg == "-v") {
      cmd.verbose_ = true;
    } else if (arg.starts_with("--")) {
      return std::nullopt;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) {
    return std::nullopt;
  }
  cmd.source_      = positional[0];
  cmd.destination_ = positional[1];
  return cmd;
}
}  // namespace

int main(int argc, char* argv[]) {
  auto cmd = ParseCommandLine(argc, argv);
  if (!cmd.has_value()) {
    PrintUsage(argv[0]);
    return 1;
  }

  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);

  quickcull::SessionConfig config;
  if (cmd->config_.has_value()) {
    try {
      config = quickcull::SessionConfig::LoadFromFile(*cmd->config_);
    } catch (const quickcull::ConfigError& e) {
      spdlog::warn("[quickcull] {}, continuing with defaults", e.what());
    }
  }
  spdlog::set_level(cmd->verbose_ ? spdlog::level::debug
                                  : spdlog::level::from_str(config.log_level_));

  if (!std::filesystem::is_directory(cmd->source_)) {
    std::cerr << "source folder does not exist: " << cmd->source_.string() << "\n";
    return 1;
  }

  try {
    quickcull::ReviewSession session(cmd->source_, cmd->destination_, config);
    if (cmd->warm_) {
      session.WarmGrid(std::chrono::seconds(30));
    }
    return session.Run(std::cin, std::cout);
  } catch (const quickcull::IndexError& e) {
    spdlog::error("[quickcull] {}", e.what());
    return 1;
  } catch (const quickcull::ExportError& e) {
    spdlog::error("[quickcull] {}", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("[quickcull] Unexpected failure: {}", e.what());
    return 1;
  }
}
