#include "scaffold/batch/batch.hpp"
#include "scaffold/function/function.hpp"

#include <format>
#include <glaze/glaze.hpp>
#include <string>
#include <utility>

namespace scaffold::batch {
namespace {

inline constexpr auto JsonOpts = glz::opts{.error_on_missing_keys = true};

template <typename T>
std::expected<std::string, core::Error> toJson(const T &Value) {
  std::string Buffer;
  if (auto Error = glz::write_json(Value, Buffer)) {
    return std::unexpected(core::Error{std::format(
        "Failed to serialize batch output: {}", glz::format_error(Error)
    )});
  }
  return Buffer;
}

} // namespace

Outcome run(const Input &Row) {
  auto Result = function::process(Row.Text, Row.Number);
  if (!Result) {
    return Outcome{
        .Status = "error",
        .Kind = std::string(function::toString(Result.error().Kind)),
        .Error = Result.error().Message,
    };
  }
  return Outcome{.Status = "ok", .Result = std::move(Result).value()};
}

std::vector<Outcome> run(const std::vector<Input> &Inputs) {
  std::vector<Outcome> Outcomes;
  Outcomes.reserve(Inputs.size());
  for (const auto &Row : Inputs) {
    Outcomes.push_back(run(Row));
  }
  return Outcomes;
}

std::expected<std::vector<Input>, core::Error> parse(std::string_view Json) {
  std::vector<Input> Inputs;
  std::string Buffer{Json};
  auto Error = glz::read<JsonOpts>(Inputs, Buffer);
  if (Error) {
    return std::unexpected(core::Error{std::format(
        "Failed to parse batch input: {}", glz::format_error(Error, Buffer)
    )});
  }
  return Inputs;
}

std::expected<std::string, core::Error> serialize(const Outcome &Row) {
  return toJson(Row);
}

std::expected<std::string, core::Error>
serialize(const std::vector<Outcome> &Outcomes) {
  return toJson(Outcomes);
}

} // namespace scaffold::batch
