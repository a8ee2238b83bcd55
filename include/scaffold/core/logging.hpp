#pragma once
#include "scaffold/core/config.hpp"

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace scaffold::core {

// Console output goes to stderr; stdout is reserved for JSON results.
inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> consoleSink() {
  static auto Sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  return Sink;
}

// Build a logger with console output and an optional rotating file.
// The file is placed at {LogDir}/{name}.log when LogDir is set.
inline std::shared_ptr<spdlog::logger>
createLogger(std::string_view Name, const Config &Cfg) {
  std::vector<spdlog::sink_ptr> Sinks{consoleSink()};

  if (Cfg.LogDir) {
    std::filesystem::path Dir{*Cfg.LogDir};
    std::filesystem::create_directories(Dir);
    Sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (Dir / (std::string(Name) + ".log")).string(), 1024 * 1024 * 10, 3
    ));
  }

  auto Logger = std::make_shared<spdlog::logger>(
      std::string(Name), Sinks.begin(), Sinks.end()
  );
  Logger->set_level(spdlog::level::from_str(Cfg.LogLevel));
  return Logger;
}

inline void setupLogging(const Config &Cfg) {
  // Becomes the default so bare spdlog::info() calls use it
  spdlog::drop("scaffold");
  auto Logger = createLogger("scaffold", Cfg);
  spdlog::register_logger(Logger);
  spdlog::set_default_logger(Logger);

  spdlog::flush_on(spdlog::level::warn);
}

} // namespace scaffold::core
