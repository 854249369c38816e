#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "rowan/async/task.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

enum class ResolutionPhase : uint8_t {
  kNotStarted,
  kAwaitingSource,  // Waiting on a deferred source value
  kIterating,       // Pulling items from a sync or async sequence
  kDone,            // Completed or failed
};

auto ToString(ResolutionPhase phase) -> const char*;

// Records how far a resolution has progressed. Owned by whoever drives the
// resolution; data sources only advance it.
class ResolutionTracker {
 public:
  [[nodiscard]] auto Phase() const -> ResolutionPhase {
    return phase_;
  }
  void Advance(ResolutionPhase phase) {
    phase_ = phase;
  }

 private:
  ResolutionPhase phase_ = ResolutionPhase::kNotStarted;
};

// Source shapes a data source accepts.
enum class SourceShapes : uint8_t {
  kEnumerable,            // Sync or async enumerable
  kEnumerableOrDeferred,  // ...or a deferred value resolving to one
};

using RowConverter = std::function<TheoryDataRow(const reflect::Value&)>;

// Materializes every row of a source value, in source order. Null items are
// skipped; every other item goes through `convert`.
//
// Sync sequences are read without suspending. Deferred values are awaited
// once; async sequences are consumed to the end. Completes with nullopt when
// `source` has none of the accepted shapes, leaving the error message to the
// caller, which knows what the source was.
auto ReadDataSource(
    reflect::Value source, SourceShapes shapes, RowConverter convert,
    ResolutionTracker& tracker) -> async::Task<std::optional<ResolvedDataSet>>;

}  // namespace rowan::data
