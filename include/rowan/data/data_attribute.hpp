#pragma once

#include <optional>
#include <string>
#include <utility>

#include "rowan/async/task.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

// A declarative source of theory data attached to a test method.
//
// Subclasses implement ResolveData(); the row metadata kept here (skip
// reason, display name, explicit flag, traits) is applied by discovery to
// rows that do not set their own.
class DataAttribute {
 public:
  DataAttribute() = default;
  virtual ~DataAttribute() = default;

  DataAttribute(const DataAttribute&) = delete;
  auto operator=(const DataAttribute&) -> DataAttribute& = delete;
  DataAttribute(DataAttribute&&) = delete;
  auto operator=(DataAttribute&&) -> DataAttribute& = delete;

  // Resolves every row the source provides for `test_method`. The task
  // completes once the whole data set is materialized; it fails with
  // DataResolutionError on the first problem. `tracker` ends in kDone either
  // way.
  [[nodiscard]] auto GetData(const reflect::TestMethod& test_method) const
      -> async::Task<ResolvedDataSet>;
  [[nodiscard]] auto GetData(
      const reflect::TestMethod& test_method, ResolutionTracker& tracker) const
      -> async::Task<ResolvedDataSet>;

  // False when rows must not be enumerated during discovery; the theory is
  // then reported as a single test case and data is resolved at execution.
  [[nodiscard]] virtual auto SupportsDiscoveryEnumeration() const -> bool {
    return true;
  }

  // Human-readable description of where rows come from, for diagnostics.
  [[nodiscard]] virtual auto Describe(
      const reflect::TestMethod& test_method) const -> std::string = 0;

  [[nodiscard]] auto Skip() const -> const std::optional<std::string>& {
    return skip_;
  }
  void SetSkip(std::string reason) {
    skip_ = std::move(reason);
  }

  [[nodiscard]] auto TestDisplayName() const
      -> const std::optional<std::string>& {
    return test_display_name_;
  }
  void SetTestDisplayName(std::string name) {
    test_display_name_ = std::move(name);
  }

  [[nodiscard]] auto Explicit() const -> std::optional<bool> {
    return explicit_;
  }
  void SetExplicit(bool value) {
    explicit_ = value;
  }

  [[nodiscard]] auto Traits() const -> const TraitMap& {
    return traits_;
  }
  void AddTrait(std::string name, std::string value) {
    traits_[std::move(name)].push_back(std::move(value));
  }

 protected:
  [[nodiscard]] virtual auto ResolveData(
      const reflect::TestMethod& test_method, ResolutionTracker& tracker) const
      -> async::Task<ResolvedDataSet> = 0;

  // Converts one yielded item. The base version throws a generic
  // kInvalidRowShape error; subclasses rethrow it naming their source.
  [[nodiscard]] virtual auto ConvertDataRow(
      const reflect::TestMethod& test_method, const reflect::Value& item) const
      -> TheoryDataRow;

  // Shape list used in kInvalidRowShape messages.
  static constexpr const char* kAcceptedRowShapes =
      "'Value[]', 'rowan::data::TheoryDataRow' or 'std::tuple<...>'";

 private:
  std::optional<std::string> skip_;
  std::optional<std::string> test_display_name_;
  std::optional<bool> explicit_;
  TraitMap traits_;
};

}  // namespace rowan::data
