#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "rowan/common/logging.hpp"
#include "rowan/config/runner_config.hpp"
#include "rowan/discovery/test_catalog.hpp"
#include "rowan/driver/list.hpp"
#include "rowan/driver/print.hpp"
#include "rowan/reporters/runner_logger.hpp"
#include "rowan/samples/sample_catalog.hpp"

namespace {

namespace fs = std::filesystem;

// CLI --config wins over rowan.yaml found from the working directory.
auto LoadRunnerConfig(const argparse::ArgumentParser& cmd)
    -> std::optional<rowan::config::RunnerConfig> {
  std::optional<fs::path> config_path;
  if (auto path = cmd.present<std::string>("--config")) {
    config_path = fs::path(*path);
  } else {
    config_path = rowan::config::FindConfig();
  }
  if (!config_path) {
    return rowan::config::RunnerConfig{};
  }

  auto config = rowan::config::LoadConfig(*config_path);
  if (!config) {
    rowan::driver::PrintDiagnostic(config.error());
    return std::nullopt;
  }
  return *std::move(config);
}

auto ListCommand(
    const argparse::ArgumentParser& cmd,
    const rowan::discovery::TestCatalog& catalog) -> int {
  auto config = LoadRunnerConfig(cmd);
  if (!config) {
    return 1;
  }

  if (cmd.get<bool>("--verbose")) {
    config->reporter = rowan::config::ReporterKind::kVerbose;
  }
  if (cmd.get<bool>("--no-enumerate")) {
    config->pre_enumerate_theories = false;
  }
  if (auto filters = cmd.present<std::vector<std::string>>("--filter")) {
    config->include_regex.insert(
        config->include_regex.end(), filters->begin(), filters->end());
  }

  rowan::common::SetLogLevel(config->log_level);
  auto logger = rowan::reporters::MakeConsoleRunnerLogger();
  return rowan::driver::ListTheories(*config, catalog, *logger);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("rowan", "0.1.0");
  program.add_description("Theory data discovery for the sample catalog");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: list
  argparse::ArgumentParser list_cmd("list");
  list_cmd.add_description("Resolve theory data and list the test cases");
  list_cmd.add_argument("--config").help(
      "Configuration file (default: rowan.yaml found from the working dir)");
  list_cmd.add_argument("--verbose", "-v")
      .default_value(false)
      .implicit_value(true)
      .help("Use the verbose reporter");
  list_cmd.add_argument("--filter")
      .append()
      .help("Only list theories whose name matches this regex (repeatable)");
  list_cmd.add_argument("--no-enumerate")
      .default_value(false)
      .implicit_value(true)
      .help("Report one test case per theory without resolving its data");

  program.add_subparser(list_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    rowan::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      rowan::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("list")) {
    try {
      rowan::discovery::TestCatalog catalog(
          rowan::samples::kSampleAssemblyName);
      rowan::samples::PopulateSampleCatalog(catalog);
      return ListCommand(list_cmd, catalog);
    } catch (const std::exception& e) {
      rowan::driver::PrintError(e.what());
      return 1;
    }
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
