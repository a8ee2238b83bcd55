#pragma once
#include "scaffold/core/result.hpp"

#include <cstdlib>
#include <expected>
#include <format>
#include <optional>
#include <spdlog/common.h>
#include <string>

namespace scaffold::core {

struct Config {
  std::string LogLevel{"info"};
  std::optional<std::string> LogDir;

  static std::expected<Config, Error> load() {
    auto *LogLevelEnv = std::getenv("LOG_LEVEL");
    auto *LogDirEnv = std::getenv("LOG_DIR");

    std::string LogLevel = "info";
    if (LogLevelEnv != nullptr && *LogLevelEnv != '\0') {
      LogLevel = LogLevelEnv;
    }

    // from_str maps anything it does not know to "off"
    if (spdlog::level::from_str(LogLevel) == spdlog::level::off &&
        LogLevel != "off") {
      return std::unexpected(Error{std::format(
          "LOG_LEVEL '{}' must be one of trace, debug, info, warn, error, "
          "critical, off",
          LogLevel
      )});
    }

    std::optional<std::string> LogDir;
    if (LogDirEnv != nullptr && *LogDirEnv != '\0') {
      LogDir = LogDirEnv;
    }

    return Config{
        .LogLevel = LogLevel,
        .LogDir = LogDir,
    };
  }
};

} // namespace scaffold::core
