#include "rowan/common/logging.hpp"

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rowan::common {

auto Logger() -> std::shared_ptr<spdlog::logger> {
  static std::mutex creation_mutex;
  std::scoped_lock lock(creation_mutex);

  auto logger = spdlog::get(std::string(kLoggerName));
  if (logger == nullptr) {
    logger = spdlog::stderr_color_mt(std::string(kLoggerName));
    logger->set_pattern("[%n][%l] %v");
    logger->set_level(spdlog::level::warn);
  }
  return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
  Logger()->set_level(level);
}

}  // namespace rowan::common
