#pragma once
#include "scaffold/function/models.hpp"

#include <cstdint>
#include <expected>
#include <string_view>

namespace scaffold::function {

// Validates the inputs and produces a FunctionResult.
//
// The text must be non-empty and the number non-negative; the text check
// runs first, so an empty text with a negative number reports EmptyInput.
// On success:
//   Text   = "processed_" + Text
//   Number = 2 * Number, computed in 64 bits so it never overflows.
//
// Pure and reentrant: nothing outside the returned value is touched.
//
// Returns:
//   FunctionResult on success, ValidationError with Kind EmptyInput
//   ("...empty") or NegativeNumber ("...non-negative") otherwise.
//
// Usage:
//   auto Result = function::process("example", 42);
//   if (!Result) {
//     spdlog::warn("{}", Result.error().Message);
//     return;
//   }
//   // Result->Text == "processed_example", Result->Number == 84
std::expected<FunctionResult, ValidationError>
process(std::string_view Text, std::int32_t Number);

} // namespace scaffold::function
