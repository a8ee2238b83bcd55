#pragma once
#include "scaffold/core/result.hpp"
#include "scaffold/function/models.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scaffold::batch {

struct Input {
  std::string Text;
  std::int32_t Number{0};
};

struct Outcome {
  std::string Status;
  std::optional<function::FunctionResult> Result;
  std::optional<std::string> Kind;
  std::optional<std::string> Error;

  bool ok() const { return Status == "ok"; }
};

Outcome run(const Input &Row);

// Runs function::process over every row, in order. A failing row does not
// stop the batch; it is reported in its own Outcome.
std::vector<Outcome> run(const std::vector<Input> &Inputs);

// Parses a JSON array of {"Text": ..., "Number": ...} rows.
// Both keys are required on every row.
std::expected<std::vector<Input>, core::Error> parse(std::string_view Json);

std::expected<std::string, core::Error> serialize(const Outcome &Row);
std::expected<std::string, core::Error>
serialize(const std::vector<Outcome> &Outcomes);

} // namespace scaffold::batch
