#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace scaffold::function {

// Success value of function::process.
struct FunctionResult {
  std::string Text;
  std::int64_t Number{0};

  bool operator==(const FunctionResult &) const = default;
};

enum class ErrorKind : std::uint8_t {
  EmptyInput,
  NegativeNumber,
};

struct ValidationError {
  ErrorKind Kind;
  std::string Message;

  bool operator==(const ValidationError &) const = default;
};

constexpr std::string_view toString(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::EmptyInput:
    return "EmptyInput";
  case ErrorKind::NegativeNumber:
    return "NegativeNumber";
  }
  return "Unknown";
}

} // namespace scaffold::function
