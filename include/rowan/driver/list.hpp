#pragma once

#include <memory>

#include "rowan/config/runner_config.hpp"
#include "rowan/discovery/test_catalog.hpp"
#include "rowan/reporters/reporter_message_handler.hpp"
#include "rowan/reporters/runner_logger.hpp"

namespace rowan::driver {

auto MakeReporter(config::ReporterKind kind, reporters::RunnerLogger& logger)
    -> std::unique_ptr<reporters::DefaultReporterMessageHandler>;

// Discovers every theory of `catalog` accepted by the configuration's
// filters and writes one line per test case to `logger`, with the
// configured reporter's progress lines around them. Configuration and
// data resolution errors are printed; returns the process exit code.
auto ListTheories(
    const config::RunnerConfig& config, const discovery::TestCatalog& catalog,
    reporters::RunnerLogger& logger) -> int;

}  // namespace rowan::driver
