#include "rowan/reporters/reporter_message_handler.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "rowan/messages/message.hpp"

namespace rowan::reporters {

namespace {

constexpr std::string_view kUnknownTest = "<unknown test>";

// Logs `text` one line at a time, each line indented by `indent`.
template <typename Log>
void LogIndentedLines(std::string_view text, std::string_view indent, Log log) {
  size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    log(fmt::format("{}{}", indent, line));
    start = end + 1;
  }
}

}  // namespace

auto EscapeDisplayName(std::string_view name) -> std::string {
  std::string result;
  result.reserve(name.size());
  for (char c : name) {
    switch (c) {
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      case '\0':
        result += "\\0";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
          result += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
        } else {
          result += c;
        }
        break;
    }
  }
  return result;
}

auto DefaultReporterMessageHandler::Handle(const messages::Message& message)
    -> bool {
  using namespace messages;
  // Most derived types first.
  if (const auto* m = dynamic_cast<const TestCaseDiscovered*>(&message)) {
    OnMessage(*m);
  } else if (const auto* m = dynamic_cast<const TestStarting*>(&message)) {
    OnMessage(*m);
  } else if (const auto* m = dynamic_cast<const TestFinished*>(&message)) {
    OnMessage(*m);
  } else if (const auto* m = dynamic_cast<const TestNotRun*>(&message)) {
    OnMessage(*m);
  } else if (const auto* m = dynamic_cast<const TestSkipped*>(&message)) {
    OnMessage(*m);
  } else if (const auto* m = dynamic_cast<const TestFailed*>(&message)) {
    OnMessage(*m);
  } else if (const auto* m =
                 dynamic_cast<const DiscoveryStarting*>(&message)) {
    OnMessage(*m);
  } else if (const auto* m =
                 dynamic_cast<const DiscoveryComplete*>(&message)) {
    OnMessage(*m);
  } else {
    return false;
  }
  return true;
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::DiscoveryStarting& message) {
  assembly_names_.insert_or_assign(
      message.AssemblyUniqueId(), message.AssemblyName());
  Logger().LogImportantMessage(
      fmt::format("  Discovering: {}", message.AssemblyName()));
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::DiscoveryComplete& message) {
  auto it = assembly_names_.find(message.AssemblyUniqueId());
  std::string name = it != assembly_names_.end() ? it->second
                                                 : message.AssemblyUniqueId();
  int count = message.TestCasesToRun();
  Logger().LogImportantMessage(
      fmt::format(
          "  Discovered:  {} ({} test case{} to be run)", name, count,
          count == 1 ? "" : "s"));
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::TestCaseDiscovered& /*message*/) {
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::TestStarting& message) {
  metadata_cache_.Set(message);
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::TestFinished& message) {
  // Last message of the test.
  metadata_cache_.TryGetTestMetadata(message, true);
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::TestNotRun& message) {
  metadata_cache_.TryGetTestMetadata(message, true);
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::TestSkipped& message) {
  Logger().LogWarning(
      fmt::format("    {} [SKIP]", DisplayNameOf(message, false)));
  LogIndentedLines(
      message.Reason(), "      ",
      [this](const std::string& line) { Logger().LogWarning(line); });
}

void DefaultReporterMessageHandler::OnMessage(
    const messages::TestFailed& message) {
  Logger().LogError(
      fmt::format("    {} [FAIL]", DisplayNameOf(message, false)));
  LogIndentedLines(
      fmt::format("{} : {}", message.ExceptionType(), message.FailureMessage()),
      "      ", [this](const std::string& line) { Logger().LogError(line); });
}

auto DefaultReporterMessageHandler::DisplayNameOf(
    const messages::TestMessage& message, bool remove) -> std::string {
  auto metadata = metadata_cache_.TryGetTestMetadata(message, remove);
  if (!metadata) {
    return std::string(kUnknownTest);
  }
  return EscapeDisplayName(metadata->test_display_name);
}

void VerboseReporterMessageHandler::OnMessage(
    const messages::TestCaseDiscovered& message) {
  Logger().LogMessage(
      fmt::format(
          "    {} [DISCOVERED]",
          EscapeDisplayName(message.TestCaseDisplayName())));
}

void VerboseReporterMessageHandler::OnMessage(
    const messages::TestStarting& message) {
  DefaultReporterMessageHandler::OnMessage(message);
  Logger().LogMessage(
      fmt::format(
          "    {} [STARTING]", EscapeDisplayName(message.TestDisplayName())));
}

void VerboseReporterMessageHandler::OnMessage(
    const messages::TestFinished& message) {
  Logger().LogMessage(
      fmt::format(
          "    {} [FINISHED] Time: {}s", DisplayNameOf(message, true),
          message.ExecutionTime()));
}

void VerboseReporterMessageHandler::OnMessage(
    const messages::TestNotRun& message) {
  Logger().LogMessage(
      fmt::format("    {} [NOT RUN]", DisplayNameOf(message, true)));
}

}  // namespace rowan::reporters
