#include "rowan/data/data_source_reader.hpp"

#include <optional>
#include <utility>

#include "rowan/async/task.hpp"
#include "rowan/common/logging.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

namespace {

auto ReadSequence(
    const reflect::Sequence& sequence, const RowConverter& convert,
    ResolutionTracker& tracker) -> ResolvedDataSet {
  tracker.Advance(ResolutionPhase::kIterating);
  ResolvedDataSet rows;
  auto items = sequence.Enumerate();
  while (auto item = items.Next()) {
    if (!item->IsNull()) {
      rows.push_back(convert(*item));
    }
  }
  return rows;
}

auto ReadAsyncSequence(
    const reflect::AsyncSequence& sequence, const RowConverter& convert,
    ResolutionTracker& tracker) -> async::Task<ResolvedDataSet> {
  tracker.Advance(ResolutionPhase::kIterating);
  ResolvedDataSet rows;
  auto items = sequence.Enumerate();
  for (;;) {
    auto item = co_await items.Next();
    if (!item) {
      break;
    }
    if (!item->IsNull()) {
      rows.push_back(convert(*item));
    }
  }
  co_return rows;
}

}  // namespace

auto ToString(ResolutionPhase phase) -> const char* {
  switch (phase) {
    case ResolutionPhase::kNotStarted:
      return "not started";
    case ResolutionPhase::kAwaitingSource:
      return "awaiting source";
    case ResolutionPhase::kIterating:
      return "iterating";
    case ResolutionPhase::kDone:
      return "done";
  }
  return "unknown";
}

auto ReadDataSource(
    reflect::Value source, SourceShapes shapes, RowConverter convert,
    ResolutionTracker& tracker)
    -> async::Task<std::optional<ResolvedDataSet>> {
  if (source.Kind() == reflect::ValueKind::kSequence) {
    co_return ReadSequence(*source.AsSequence(), convert, tracker);
  }

  if (source.Kind() == reflect::ValueKind::kDeferred &&
      shapes == SourceShapes::kEnumerableOrDeferred) {
    auto deferred = source.AsDeferred();
    common::Logger()->debug(
        "awaiting deferred source '{}'", deferred->TypeName());
    tracker.Advance(ResolutionPhase::kAwaitingSource);
    source = co_await deferred->Get();
    if (source.Kind() == reflect::ValueKind::kSequence) {
      co_return ReadSequence(*source.AsSequence(), convert, tracker);
    }
  }

  if (source.Kind() == reflect::ValueKind::kAsyncSequence) {
    auto sequence = source.AsAsyncSequence();
    co_return co_await ReadAsyncSequence(*sequence, convert, tracker);
  }

  co_return std::nullopt;
}

}  // namespace rowan::data
