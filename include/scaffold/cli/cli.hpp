#pragma once
#include "scaffold/core/result.hpp"

#include <cstdint>
#include <expected>
#include <istream>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace scaffold::cli {

inline constexpr int ExitOk = 0;
inline constexpr int ExitFailed = 1;
inline constexpr int ExitUsage = 2;

// Parses a base-10 int32; trailing characters and out-of-range values fail.
std::expected<std::int32_t, core::Error> parseNumber(std::string_view Arg);

// Reads the whole batch document from Path, or from In when Path is "-".
std::expected<std::string, core::Error> readSource(std::string_view Path,
                                                   std::istream &In);

void printUsage(std::ostream &Err);

// Dispatches on the command line (Args[0] is the program name):
//   <text> <number>          single call, one Outcome on Out
//   --batch <file.json|->    batch call, array of Outcomes on Out
// Returns ExitOk, ExitFailed when a row failed validation, ExitUsage on
// bad arguments or unreadable input.
int run(std::span<char *> Args, std::istream &In, std::ostream &Out,
        std::ostream &Err);

// Loads core::Config, installs logging, then calls run. Configuration
// errors are written to Err since no logger exists yet.
int start(std::span<char *> Args, std::istream &In, std::ostream &Out,
          std::ostream &Err);

} // namespace scaffold::cli
