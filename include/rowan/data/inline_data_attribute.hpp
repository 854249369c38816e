#pragma once

#include <string>
#include <utility>
#include <vector>

#include "rowan/async/task.hpp"
#include "rowan/data/data_attribute.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

// A single row whose arguments are given literally.
class InlineDataAttribute : public DataAttribute {
 public:
  explicit InlineDataAttribute(std::vector<reflect::Value> arguments)
      : arguments_(std::move(arguments)) {
  }

  [[nodiscard]] auto Arguments() const -> const std::vector<reflect::Value>& {
    return arguments_;
  }

  [[nodiscard]] auto Describe(const reflect::TestMethod& test_method) const
      -> std::string override;

 protected:
  [[nodiscard]] auto ResolveData(
      const reflect::TestMethod& test_method, ResolutionTracker& tracker) const
      -> async::Task<ResolvedDataSet> override;

 private:
  std::vector<reflect::Value> arguments_;
};

}  // namespace rowan::data
