#pragma once

#include <string>

#include "rowan/async/task.hpp"
#include "rowan/data/data_attribute.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

// Data taken from a fresh instance of `data_class`, created through its
// default constructor. The instance must be a sync or async enumerable;
// deferred values are not unwrapped.
class ClassDataAttribute : public DataAttribute {
 public:
  explicit ClassDataAttribute(const reflect::Type& data_class)
      : data_class_(&data_class) {
  }

  [[nodiscard]] auto DataClass() const -> const reflect::Type& {
    return *data_class_;
  }

  [[nodiscard]] auto Describe(const reflect::TestMethod& test_method) const
      -> std::string override;

 protected:
  [[nodiscard]] auto ResolveData(
      const reflect::TestMethod& test_method, ResolutionTracker& tracker) const
      -> async::Task<ResolvedDataSet> override;

  [[nodiscard]] auto ConvertDataRow(
      const reflect::TestMethod& test_method, const reflect::Value& item) const
      -> TheoryDataRow override;

 private:
  const reflect::Type* data_class_;
};

}  // namespace rowan::data
