#pragma once

#include <cstdint>
#include <exception>
#include <string>

namespace rowan::data {

enum class DataErrorKind : uint8_t {
  kMemberNotFound,        // No static member matches name and arguments
  kInvalidRowShape,       // A yielded item cannot become a row
  kUnsupportedDataShape,  // Source is not a (deferred) sync/async enumerable
};

auto ToString(DataErrorKind kind) -> const char*;

// Failure to resolve a data source. Resolution is all-or-nothing: once this
// is thrown no rows of the source are reported.
class DataResolutionError final : public std::exception {
 public:
  DataResolutionError(DataErrorKind kind, std::string message);

  [[nodiscard]] auto GetKind() const -> DataErrorKind {
    return kind_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return message_.c_str();
  }

 private:
  DataErrorKind kind_;
  std::string message_;
};

}  // namespace rowan::data
