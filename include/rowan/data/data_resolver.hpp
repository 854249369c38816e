#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "rowan/async/event_loop.hpp"
#include "rowan/async/task.hpp"
#include "rowan/data/data_attribute.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

// Rows come from a default-constructed instance of `data_class`.
struct ClassDataSource {
  const reflect::Type* data_class = nullptr;
};

// Rows come from a static member. `member_type` overrides the type searched
// (the test method's declaring type by default).
struct MemberDataSource {
  std::string member_name;
  std::vector<reflect::Value> parameters;
  const reflect::Type* member_type = nullptr;
};

using DataSourceDescriptor = std::variant<ClassDataSource, MemberDataSource>;

// Throws std::invalid_argument for a class source without a class or a
// member source without a name.
auto MakeDataAttribute(const DataSourceDescriptor& descriptor)
    -> std::unique_ptr<DataAttribute>;

// Resolves a data source to completion on a private event loop. Throws
// DataResolutionError when the source cannot be resolved and
// std::invalid_argument for a null test method.
auto Resolve(
    const DataSourceDescriptor& descriptor,
    const reflect::TestMethod* test_method) -> ResolvedDataSet;
auto Resolve(
    const DataAttribute& attribute, const reflect::TestMethod& test_method)
    -> ResolvedDataSet;

// A resolution driven by the caller, one event-loop step at a time.
//
//   async::EventLoop loop;
//   DataResolution resolution(loop, attribute, method);
//   resolution.Start();
//   while (!resolution.Done()) {
//     resolution.Step();  // Phase() reports where it is
//   }
//   auto rows = resolution.Result();
//
// The attribute, test method and loop must outlive the resolution.
class DataResolution {
 public:
  DataResolution(
      async::EventLoop& loop, const DataAttribute& attribute,
      const reflect::TestMethod& test_method);

  DataResolution(const DataResolution&) = delete;
  auto operator=(const DataResolution&) -> DataResolution& = delete;
  DataResolution(DataResolution&&) = delete;
  auto operator=(DataResolution&&) -> DataResolution& = delete;
  ~DataResolution() = default;

  // Runs the resolution up to its first suspension point.
  void Start();

  // Resumes one ready coroutine on the loop. Throws InternalError if the
  // resolution is suspended with nothing ready to run.
  void Step();

  [[nodiscard]] auto Done() const -> bool {
    return started_ && task_.Done();
  }
  [[nodiscard]] auto Phase() const -> ResolutionPhase {
    return tracker_.Phase();
  }

  // Requires Done(). Rethrows the resolution failure, if any.
  auto Result() -> ResolvedDataSet;

 private:
  async::EventLoop* loop_;
  ResolutionTracker tracker_;
  async::Task<ResolvedDataSet> task_;
  bool started_ = false;
};

}  // namespace rowan::data
