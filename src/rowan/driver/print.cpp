#include "rowan/driver/print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "rowan/common/diagnostic.hpp"

namespace rowan::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintLine(DiagKind kind, const std::string& message, bool is_primary) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("rowan", kToolStyle),
      fmt::styled(DiagKindToString(kind), DiagKindToStyle(kind)),
      fmt::styled(
          message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  PrintLine(DiagKind::kError, message, true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintLine(diag.kind, diag.message, true);
  for (const auto& note : diag.notes) {
    PrintLine(DiagKind::kNote, note, false);
  }
}

}  // namespace rowan::driver
