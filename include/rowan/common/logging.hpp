#pragma once

#include <memory>
#include <string_view>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace rowan::common {

// Name of the library-wide spdlog logger. Resolution traces go here at
// debug level; reporter output goes through RunnerLogger instead.
inline constexpr std::string_view kLoggerName = "rowan";

// Returns the library logger, creating it (stderr, colored) on first use.
// A logger registered under kLoggerName beforehand is used as-is, which lets
// an embedding runner route rowan traces into its own sinks.
auto Logger() -> std::shared_ptr<spdlog::logger>;

void SetLogLevel(spdlog::level::level_enum level);

}  // namespace rowan::common
