#include "scaffold/cli/cli.hpp"
#include "scaffold/batch/batch.hpp"
#include "scaffold/core/config.hpp"
#include "scaffold/core/logging.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

#include "spdlog/spdlog.h"

namespace scaffold::cli {
namespace {

int runSingle(std::string_view Text, std::string_view NumberArg,
              std::ostream &Out) {
  auto Number = parseNumber(NumberArg);
  if (!Number) {
    spdlog::error(Number.error().Message);
    return ExitUsage;
  }

  spdlog::debug("Processing text '{}' with number {}", Text, *Number);
  auto Outcome = batch::run(batch::Input{std::string(Text), *Number});
  if (!Outcome.ok()) {
    spdlog::warn("Validation failed: {}", *Outcome.Error);
  }

  auto Json = batch::serialize(Outcome);
  if (!Json) {
    spdlog::error(Json.error().Message);
    return ExitFailed;
  }
  Out << *Json << '\n';
  return Outcome.ok() ? ExitOk : ExitFailed;
}

int runBatch(std::string_view Path, std::istream &In, std::ostream &Out) {
  spdlog::info("Reading batch from {}", Path == "-" ? "stdin" : Path);
  auto Source = readSource(Path, In);
  if (!Source) {
    spdlog::error(Source.error().Message);
    return ExitUsage;
  }

  auto Inputs = batch::parse(*Source);
  if (!Inputs) {
    spdlog::error(Inputs.error().Message);
    return ExitUsage;
  }

  auto Outcomes = batch::run(*Inputs);
  auto Failed = std::ranges::count_if(
      Outcomes, [](const auto &Outcome) { return !Outcome.ok(); });
  spdlog::info("Processed {} rows, {} failed.", Outcomes.size(), Failed);

  auto Json = batch::serialize(Outcomes);
  if (!Json) {
    spdlog::error(Json.error().Message);
    return ExitFailed;
  }
  Out << *Json << '\n';
  return Failed == 0 ? ExitOk : ExitFailed;
}

} // namespace

std::expected<std::int32_t, core::Error> parseNumber(std::string_view Arg) {
  std::int32_t Number{0};
  auto [Ptr, Ec] = std::from_chars(Arg.data(), Arg.data() + Arg.size(), Number);
  if (Ec == std::errc::result_out_of_range) {
    return std::unexpected(core::Error{std::format("'{}' is out of range", Arg)});
  }
  if (Ec != std::errc{} || Ptr != Arg.data() + Arg.size()) {
    return std::unexpected(
        core::Error{std::format("'{}' is not an integer", Arg)});
  }
  return Number;
}

std::expected<std::string, core::Error> readSource(std::string_view Path,
                                                   std::istream &In) {
  if (Path == "-") {
    return std::string((std::istreambuf_iterator<char>(In)),
                       std::istreambuf_iterator<char>());
  }

  std::ifstream File{std::string(Path)};
  if (!File) {
    return std::unexpected(core::Error{std::format("Cannot open '{}'", Path)});
  }
  return std::string((std::istreambuf_iterator<char>(File)),
                     std::istreambuf_iterator<char>());
}

void printUsage(std::ostream &Err) {
  Err << "usage: scaffold <text> <number>\n"
      << "       scaffold --batch <file.json|->\n";
}

int run(std::span<char *> Args, std::istream &In, std::ostream &Out,
        std::ostream &Err) {
  if (Args.size() == 3 && std::string_view{Args[1]} == "--batch") {
    return runBatch(Args[2], In, Out);
  }
  if (Args.size() == 3) {
    return runSingle(Args[1], Args[2], Out);
  }

  printUsage(Err);
  return ExitUsage;
}

int start(std::span<char *> Args, std::istream &In, std::ostream &Out,
          std::ostream &Err) {
  // spdlog's stock logger writes to stdout, which carries JSON
  auto Config = core::Config::load();
  if (!Config) {
    Err << Config.error().Message << '\n';
    return ExitUsage;
  }

  try {
    core::setupLogging(*Config);
  } catch (const std::exception &Error) {
    Err << "Failed to set up logging: " << Error.what() << '\n';
    return ExitUsage;
  }

  spdlog::debug("Loaded config - LogLevel: {}, LogDir: {}", Config->LogLevel,
                Config->LogDir.value_or("<none>"));
  return run(Args, In, Out, Err);
}

} // namespace scaffold::cli
