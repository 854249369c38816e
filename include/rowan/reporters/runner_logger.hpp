#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>

namespace rowan::reporters {

// Sink for reporter output: plain, already formatted lines.
class RunnerLogger {
 public:
  RunnerLogger() = default;
  virtual ~RunnerLogger() = default;

  RunnerLogger(const RunnerLogger&) = delete;
  auto operator=(const RunnerLogger&) -> RunnerLogger& = delete;
  RunnerLogger(RunnerLogger&&) = delete;
  auto operator=(RunnerLogger&&) -> RunnerLogger& = delete;

  virtual void LogMessage(std::string_view message) = 0;
  // Shown even by quiet reporters.
  virtual void LogImportantMessage(std::string_view message) = 0;
  virtual void LogWarning(std::string_view message) = 0;
  virtual void LogError(std::string_view message) = 0;
};

// Writes through a spdlog logger. Messages and important messages go out at
// info level, warnings and errors at their own levels.
class SpdlogRunnerLogger final : public RunnerLogger {
 public:
  explicit SpdlogRunnerLogger(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {
  }

  void LogMessage(std::string_view message) override;
  void LogImportantMessage(std::string_view message) override;
  void LogWarning(std::string_view message) override;
  void LogError(std::string_view message) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

// Colored stdout logger with a bare "%v" pattern. Not registered with
// spdlog, so any number of them can coexist.
auto MakeConsoleRunnerLogger(const std::string& name = "rowan.runner")
    -> std::unique_ptr<SpdlogRunnerLogger>;

}  // namespace rowan::reporters
