#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace rowan::common {

// Raised when rowan itself breaks an invariant. User mistakes (bad data
// sources, bad configuration) never surface as InternalError.
class InternalError : public std::logic_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::logic_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in rowan, not in the test code using it.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace rowan::common
