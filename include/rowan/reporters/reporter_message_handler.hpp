#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "rowan/messages/message.hpp"
#include "rowan/reporters/metadata_cache.hpp"
#include "rowan/reporters/runner_logger.hpp"

namespace rowan::reporters {

// Escapes control characters in a display name so that every reported test
// stays on one line: \n, \r, \t, \0, other control characters as \xNN.
auto EscapeDisplayName(std::string_view name) -> std::string;

// Default reporter: discovery progress, skipped and failed tests.
//
// Handle() dispatches on the message's dynamic type to the matching
// OnMessage() overload. The logger must outlive the handler.
class DefaultReporterMessageHandler {
 public:
  explicit DefaultReporterMessageHandler(RunnerLogger& logger)
      : logger_(&logger) {
  }
  virtual ~DefaultReporterMessageHandler() = default;

  DefaultReporterMessageHandler(const DefaultReporterMessageHandler&) = delete;
  auto operator=(const DefaultReporterMessageHandler&)
      -> DefaultReporterMessageHandler& = delete;
  DefaultReporterMessageHandler(DefaultReporterMessageHandler&&) = delete;
  auto operator=(DefaultReporterMessageHandler&&)
      -> DefaultReporterMessageHandler& = delete;

  // Returns false for message types no overload handles.
  auto Handle(const messages::Message& message) -> bool;

  virtual void OnMessage(const messages::DiscoveryStarting& message);
  virtual void OnMessage(const messages::DiscoveryComplete& message);
  virtual void OnMessage(const messages::TestCaseDiscovered& message);
  virtual void OnMessage(const messages::TestStarting& message);
  virtual void OnMessage(const messages::TestFinished& message);
  virtual void OnMessage(const messages::TestNotRun& message);
  virtual void OnMessage(const messages::TestSkipped& message);
  virtual void OnMessage(const messages::TestFailed& message);

 protected:
  [[nodiscard]] auto Logger() const -> RunnerLogger& {
    return *logger_;
  }

  // Escaped display name of the test, or "<unknown test>".
  auto DisplayNameOf(const messages::TestMessage& message, bool remove)
      -> std::string;

 private:
  RunnerLogger* logger_;
  MetadataCache metadata_cache_;
  std::unordered_map<std::string, std::string> assembly_names_;
};

// Adds one line per discovered, starting, finished and not-run test.
class VerboseReporterMessageHandler : public DefaultReporterMessageHandler {
 public:
  using DefaultReporterMessageHandler::DefaultReporterMessageHandler;
  using DefaultReporterMessageHandler::OnMessage;

  void OnMessage(const messages::TestCaseDiscovered& message) override;
  void OnMessage(const messages::TestStarting& message) override;
  void OnMessage(const messages::TestFinished& message) override;
  void OnMessage(const messages::TestNotRun& message) override;
};

}  // namespace rowan::reporters
