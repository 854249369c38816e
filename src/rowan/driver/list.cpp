#include "rowan/driver/list.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "rowan/common/logging.hpp"
#include "rowan/config/runner_config.hpp"
#include "rowan/data/data_error.hpp"
#include "rowan/discovery/test_catalog.hpp"
#include "rowan/discovery/theory_discoverer.hpp"
#include "rowan/driver/print.hpp"
#include "rowan/messages/message.hpp"
#include "rowan/reporters/reporter_message_handler.hpp"
#include "rowan/reporters/runner_logger.hpp"

namespace rowan::driver {

namespace {

auto FormatListing(const messages::TestCaseDiscovered& test_case)
    -> std::string {
  auto name = reporters::EscapeDisplayName(test_case.TestCaseDisplayName());
  if (test_case.SkipReason()) {
    return fmt::format(
        "{} [SKIP: {}]", name,
        reporters::EscapeDisplayName(*test_case.SkipReason()));
  }
  return name;
}

}  // namespace

auto MakeReporter(config::ReporterKind kind, reporters::RunnerLogger& logger)
    -> std::unique_ptr<reporters::DefaultReporterMessageHandler> {
  switch (kind) {
    case config::ReporterKind::kVerbose:
      return std::make_unique<reporters::VerboseReporterMessageHandler>(
          logger);
    case config::ReporterKind::kDefault:
      break;
  }
  return std::make_unique<reporters::DefaultReporterMessageHandler>(logger);
}

auto ListTheories(
    const config::RunnerConfig& config, const discovery::TestCatalog& catalog,
    reporters::RunnerLogger& logger) -> int {
  auto filter = config::NameFilter::Create(config);
  if (!filter) {
    PrintDiagnostic(filter.error());
    return 1;
  }

  auto reporter = MakeReporter(config.reporter, logger);
  discovery::TheoryDiscoverer discoverer(
      catalog, discovery::DiscoveryOptions{
                   .pre_enumerate_theories = config.pre_enumerate_theories});

  try {
    int count = discoverer.Run(
        [&](const messages::Message& message) {
          message.Validate();
          reporter->Handle(message);
          if (const auto* test_case =
                  dynamic_cast<const messages::TestCaseDiscovered*>(&message)) {
            logger.LogMessage(FormatListing(*test_case));
          }
        },
        [&](const discovery::Theory& theory) {
          return filter->Matches(theory.method.QualifiedName());
        });
    common::Logger()->debug("listed {} test cases", count);
  } catch (const data::DataResolutionError& e) {
    PrintError(e.what());
    return 1;
  } catch (const std::invalid_argument& e) {
    PrintError(e.what());
    return 1;
  }
  return 0;
}

}  // namespace rowan::driver
