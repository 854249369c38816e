#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>

#include "rowan/common/diagnostic.hpp"

namespace rowan::config {

inline constexpr std::string_view kConfigFileName = "rowan.yaml";

enum class ReporterKind : uint8_t {
  kDefault,
  kVerbose,
};

auto ParseReporterKind(std::string_view name) -> std::optional<ReporterKind>;

struct RunnerConfig {
  ReporterKind reporter = ReporterKind::kDefault;
  bool pre_enumerate_theories = true;
  spdlog::level::level_enum log_level = spdlog::level::warn;
  // Matched (std::regex_search) against "ns::Class.Method".
  std::vector<std::string> include_regex;
  std::vector<std::string> exclude_regex;

  // Directory where rowan.yaml was found; empty for the built-in defaults.
  std::filesystem::path root_dir;
};

// Search for rowan.yaml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse rowan.yaml. Unknown keys, wrong value types and bad regexes are
// errors naming the file and line.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<RunnerConfig>;

// Compiled include/exclude filters of a configuration.
class NameFilter {
 public:
  static auto Create(const RunnerConfig& config) -> Result<NameFilter>;

  // True when no include pattern is given or one matches, and no exclude
  // pattern matches.
  [[nodiscard]] auto Matches(const std::string& name) const -> bool;

 private:
  std::vector<std::regex> include_;
  std::vector<std::regex> exclude_;
};

}  // namespace rowan::config
