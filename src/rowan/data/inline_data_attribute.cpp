#include "rowan/data/inline_data_attribute.hpp"

#include <string>

#include <fmt/core.h>

#include "rowan/async/task.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"

namespace rowan::data {

auto InlineDataAttribute::Describe(
    const reflect::TestMethod& /*test_method*/) const -> std::string {
  return fmt::format("inline data ({} arguments)", arguments_.size());
}

auto InlineDataAttribute::ResolveData(
    const reflect::TestMethod& /*test_method*/,
    ResolutionTracker& tracker) const -> async::Task<ResolvedDataSet> {
  tracker.Advance(ResolutionPhase::kDone);
  co_return ResolvedDataSet{TheoryDataRow(arguments_)};
}

}  // namespace rowan::data
