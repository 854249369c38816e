#include "rowan/config/runner_config.hpp"

#include <algorithm>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/common.h>
// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "rowan/common/diagnostic.hpp"

namespace rowan::config {

namespace fs = std::filesystem;

namespace {

auto ErrorAt(
    const fs::path& path, const YAML::Mark& mark, const std::string& message)
    -> Diagnostic {
  if (mark.is_null()) {
    return Diagnostic::HostError(
        fmt::format("{}: {}", path.string(), message));
  }
  return Diagnostic::HostError(
      fmt::format("{}:{}: {}", path.string(), mark.line + 1, message));
}

auto ValidateKeys(
    const YAML::Node& node, std::initializer_list<std::string_view> allowed,
    const fs::path& path) -> Result<void> {
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    if (std::ranges::find(allowed, key) == allowed.end()) {
      return std::unexpected(
          ErrorAt(
              path, pair.first.Mark(),
              fmt::format("Unknown field '{}' in {}", key, kConfigFileName)));
    }
  }
  return {};
}

auto ReadStringList(
    const YAML::Node& node, std::string_view key, const fs::path& path)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> result;
  if (node.IsScalar()) {
    result.push_back(node.as<std::string>());
    return result;
  }
  if (!node.IsSequence()) {
    return std::unexpected(
        ErrorAt(
            path, node.Mark(),
            fmt::format("'{}' must be a string or a list of strings", key)));
  }
  for (const auto& item : node) {
    result.push_back(item.as<std::string>());
  }
  return result;
}

auto CompilePatterns(const std::vector<std::string>& patterns)
    -> Result<std::vector<std::regex>> {
  std::vector<std::regex> compiled;
  compiled.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    try {
      compiled.emplace_back(pattern);
    } catch (const std::regex_error& e) {
      return std::unexpected(
          Diagnostic::Error(
              fmt::format("invalid filter regex '{}': {}", pattern, e.what())));
    }
  }
  return compiled;
}

}  // namespace

auto ParseReporterKind(std::string_view name) -> std::optional<ReporterKind> {
  if (name == "default") {
    return ReporterKind::kDefault;
  }
  if (name == "verbose") {
    return ReporterKind::kVerbose;
  }
  return std::nullopt;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<RunnerConfig> {
  RunnerConfig config;
  config.root_dir = config_path.parent_path();

  try {
    // NOLINTNEXTLINE(misc-include-cleaner): LoadFile is provided by yaml.h
    auto root = YAML::LoadFile(config_path.string());
    if (root.IsNull()) {
      // Empty file: defaults
      return config;
    }
    if (!root.IsMap()) {
      return std::unexpected(
          ErrorAt(config_path, root.Mark(), "expected a map at top level"));
    }
    if (auto valid = ValidateKeys(
            root,
            {"reporter", "pre_enumerate_theories", "log_level",
             "include_regex", "exclude_regex"},
            config_path);
        !valid) {
      return std::unexpected(std::move(valid.error()));
    }

    if (root["reporter"]) {
      auto name = root["reporter"].as<std::string>();
      auto kind = ParseReporterKind(name);
      if (!kind) {
        return std::unexpected(
            ErrorAt(
                config_path, root["reporter"].Mark(),
                fmt::format(
                    "unknown reporter '{}', use 'default' or 'verbose'",
                    name)));
      }
      config.reporter = *kind;
    }

    if (root["pre_enumerate_theories"]) {
      config.pre_enumerate_theories =
          root["pre_enumerate_theories"].as<bool>();
    }

    if (root["log_level"]) {
      auto name = root["log_level"].as<std::string>();
      auto level = spdlog::level::from_str(name);
      // from_str maps unknown names to "off"
      if (level == spdlog::level::off && name != "off") {
        return std::unexpected(
            ErrorAt(
                config_path, root["log_level"].Mark(),
                fmt::format("unknown log level '{}'", name)));
      }
      config.log_level = level;
    }

    for (auto [key, target] :
         {std::pair{"include_regex", &config.include_regex},
          std::pair{"exclude_regex", &config.exclude_regex}}) {
      if (!root[key]) {
        continue;
      }
      auto patterns = ReadStringList(root[key], key, config_path);
      if (!patterns) {
        return std::unexpected(std::move(patterns.error()));
      }
      *target = std::move(*patterns);
    }
  } catch (const YAML::BadFile& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to read {}: {}", config_path.string(), e.what())));
  } catch (const YAML::Exception& e) {
    return std::unexpected(ErrorAt(config_path, e.mark, e.msg));
  }

  if (auto filter = NameFilter::Create(config); !filter) {
    return std::unexpected(
        std::move(filter.error())
            .WithNote(fmt::format("in {}", config_path.string())));
  }
  return config;
}

auto NameFilter::Create(const RunnerConfig& config) -> Result<NameFilter> {
  NameFilter filter;
  auto include = CompilePatterns(config.include_regex);
  if (!include) {
    return std::unexpected(std::move(include.error()));
  }
  auto exclude = CompilePatterns(config.exclude_regex);
  if (!exclude) {
    return std::unexpected(std::move(exclude.error()));
  }
  filter.include_ = std::move(*include);
  filter.exclude_ = std::move(*exclude);
  return filter;
}

auto NameFilter::Matches(const std::string& name) const -> bool {
  auto matches = [&name](const std::regex& pattern) {
    return std::regex_search(name, pattern);
  };
  if (!include_.empty() && std::ranges::none_of(include_, matches)) {
    return false;
  }
  return std::ranges::none_of(exclude_, matches);
}

}  // namespace rowan::config
