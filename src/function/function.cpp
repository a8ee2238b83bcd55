#include "scaffold/function/function.hpp"

#include <string>
#include <utility>

namespace scaffold::function {
namespace {

constexpr std::string_view TextPrefix = "processed_";

std::expected<void, ValidationError> validateInput(std::string_view Text,
                                                   std::int32_t Number) {
  if (Text.empty()) {
    return std::unexpected(
        ValidationError{ErrorKind::EmptyInput, "Text cannot be empty"});
  }

  if (Number < 0) {
    return std::unexpected(ValidationError{ErrorKind::NegativeNumber,
                                           "Number must be non-negative"});
  }

  return {};
}

// Placeholder processing; replace with real domain logic.
FunctionResult transformInput(std::string_view Text, std::int32_t Number) {
  std::string Processed;
  Processed.reserve(TextPrefix.size() + Text.size());
  Processed.append(TextPrefix);
  Processed.append(Text);

  return FunctionResult{
      .Text = std::move(Processed),
      .Number = static_cast<std::int64_t>(Number) * 2,
  };
}

} // namespace

std::expected<FunctionResult, ValidationError>
process(std::string_view Text, std::int32_t Number) {
  return validateInput(Text, Number).transform(
      [&] { return transformInput(Text, Number); });
}

} // namespace scaffold::function
