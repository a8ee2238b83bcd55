#pragma once
#include <string>

namespace scaffold::core {

// Infrastructure failures (configuration, I/O, malformed JSON).
// Validation failures of the operation use function::ValidationError.
struct Error {
  std::string Message;
};

} // namespace scaffold::core
