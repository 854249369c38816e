#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "rowan/reflect/value.hpp"

namespace rowan::data {

// Trait name -> values, ordered for deterministic output.
using TraitMap = std::map<std::string, std::vector<std::string>>;

// One set of arguments for one invocation of a theory, plus the optional
// metadata a row may carry for itself. Metadata left unset falls back to the
// data source's, then to the theory's.
class TheoryDataRow {
 public:
  TheoryDataRow() = default;
  explicit TheoryDataRow(std::vector<reflect::Value> data)
      : data_(std::move(data)) {
  }

  [[nodiscard]] auto GetData() const -> const std::vector<reflect::Value>& {
    return data_;
  }
  [[nodiscard]] auto TestDisplayName() const
      -> const std::optional<std::string>& {
    return test_display_name_;
  }
  [[nodiscard]] auto Skip() const -> const std::optional<std::string>& {
    return skip_;
  }
  [[nodiscard]] auto Explicit() const -> std::optional<bool> {
    return explicit_;
  }
  [[nodiscard]] auto Traits() const -> const TraitMap& {
    return traits_;
  }

  auto WithTestDisplayName(std::string name) && -> TheoryDataRow {
    test_display_name_ = std::move(name);
    return std::move(*this);
  }
  auto WithSkip(std::string reason) && -> TheoryDataRow {
    skip_ = std::move(reason);
    return std::move(*this);
  }
  auto WithExplicit(bool value) && -> TheoryDataRow {
    explicit_ = value;
    return std::move(*this);
  }
  auto WithTrait(std::string name, std::string value) && -> TheoryDataRow {
    traits_[std::move(name)].push_back(std::move(value));
    return std::move(*this);
  }

  auto operator==(const TheoryDataRow&) const -> bool = default;

 private:
  std::vector<reflect::Value> data_;
  std::optional<std::string> test_display_name_;
  std::optional<std::string> skip_;
  std::optional<bool> explicit_;
  TraitMap traits_;
};

using ResolvedDataSet = std::vector<TheoryDataRow>;

// Normalizes a yielded item into a row. Object arrays and tuples become
// positional arguments, rows pass through unchanged; every other shape
// yields nullopt.
auto ToTheoryDataRow(const reflect::Value& item)
    -> std::optional<TheoryDataRow>;

// GTest printer
void PrintTo(const TheoryDataRow& row, std::ostream* os);

}  // namespace rowan::data
