#include "rowan/reporters/runner_logger.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rowan::reporters {

void SpdlogRunnerLogger::LogMessage(std::string_view message) {
  logger_->info("{}", message);
}

void SpdlogRunnerLogger::LogImportantMessage(std::string_view message) {
  logger_->info("{}", message);
}

void SpdlogRunnerLogger::LogWarning(std::string_view message) {
  logger_->warn("{}", message);
}

void SpdlogRunnerLogger::LogError(std::string_view message) {
  logger_->error("{}", message);
}

auto MakeConsoleRunnerLogger(const std::string& name)
    -> std::unique_ptr<SpdlogRunnerLogger> {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  return std::make_unique<SpdlogRunnerLogger>(std::move(logger));
}

}  // namespace rowan::reporters
