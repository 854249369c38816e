#include "rowan/data/data_attribute.hpp"

#include <fmt/core.h>

#include "rowan/async/task.hpp"
#include "rowan/data/data_error.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

auto DataAttribute::GetData(const reflect::TestMethod& test_method) const
    -> async::Task<ResolvedDataSet> {
  ResolutionTracker tracker;
  co_return co_await ResolveData(test_method, tracker);
}

auto DataAttribute::GetData(
    const reflect::TestMethod& test_method, ResolutionTracker& tracker) const
    -> async::Task<ResolvedDataSet> {
  try {
    co_return co_await ResolveData(test_method, tracker);
  } catch (...) {
    tracker.Advance(ResolutionPhase::kDone);
    throw;
  }
}

auto DataAttribute::ConvertDataRow(
    const reflect::TestMethod& test_method, const reflect::Value& item) const
    -> TheoryDataRow {
  auto row = ToTheoryDataRow(item);
  if (!row) {
    throw DataResolutionError(
        DataErrorKind::kInvalidRowShape,
        fmt::format(
            "Data source for test method '{}' yielded an item of type '{}' "
            "which is not a {}",
            test_method.QualifiedName(), item.TypeName(), kAcceptedRowShapes));
  }
  return std::move(*row);
}

}  // namespace rowan::data
