#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace rowan {

enum class DiagKind : uint8_t {
  kError,      // Invalid input handed to rowan
  kHostError,  // I/O, malformed external files
  kNote,       // Auxiliary message
};

// Diagnostic for problems outside the data pipeline proper (configuration
// files, command line). Data source failures use DataResolutionError.
struct Diagnostic {
  DiagKind kind;
  std::string message;
  std::vector<std::string> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kError, .message = std::move(msg), .notes = {}};
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kHostError, .message = std::move(msg), .notes = {}};
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(std::move(msg));
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace rowan
