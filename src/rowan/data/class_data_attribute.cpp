#include "rowan/data/class_data_attribute.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "rowan/async/task.hpp"
#include "rowan/common/logging.hpp"
#include "rowan/data/data_error.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

namespace {

auto UnsupportedClassMessage(
    const reflect::Type& data_class, const reflect::TestMethod& test_method,
    std::string_view problem) -> std::string {
  const auto* declaring = test_method.DeclaringType();
  return fmt::format(
      "'{}' {} to be used as class data for the test method named '{}' on "
      "'{}':\n"
      "- a default constructor producing a Sequence of rows\n"
      "- a default constructor producing an AsyncSequence of rows",
      data_class.FullName(), problem, test_method.Name(),
      declaring != nullptr ? declaring->FullName() : "<none>");
}

}  // namespace

auto ClassDataAttribute::Describe(const reflect::TestMethod& /*test_method*/)
    const -> std::string {
  return fmt::format("class '{}'", data_class_->FullName());
}

auto ClassDataAttribute::ResolveData(
    const reflect::TestMethod& test_method, ResolutionTracker& tracker) const
    -> async::Task<ResolvedDataSet> {
  if (!data_class_->HasDefaultConstructor()) {
    throw DataResolutionError(
        DataErrorKind::kUnsupportedDataShape,
        UnsupportedClassMessage(
            *data_class_, test_method, "has no default constructor; it needs"));
  }

  reflect::Value instance = data_class_->CreateInstance();
  common::Logger()->debug(
      "class data '{}' produced {}", data_class_->FullName(),
      instance.TypeName());

  auto rows = co_await ReadDataSource(
      instance, SourceShapes::kEnumerable,
      [this, &test_method](const reflect::Value& item) {
        return ConvertDataRow(test_method, item);
      },
      tracker);
  if (!rows) {
    throw DataResolutionError(
        DataErrorKind::kUnsupportedDataShape,
        UnsupportedClassMessage(
            *data_class_, test_method, "must provide one of the following"));
  }
  tracker.Advance(ResolutionPhase::kDone);
  co_return std::move(*rows);
}

auto ClassDataAttribute::ConvertDataRow(
    const reflect::TestMethod& test_method, const reflect::Value& item) const
    -> TheoryDataRow {
  try {
    return DataAttribute::ConvertDataRow(test_method, item);
  } catch (const DataResolutionError& e) {
    if (e.GetKind() != DataErrorKind::kInvalidRowShape) {
      throw;
    }
    throw DataResolutionError(
        DataErrorKind::kInvalidRowShape,
        fmt::format(
            "Class '{}' yielded an item of type '{}' which is not a {} (test "
            "method '{}')",
            data_class_->FullName(), item.TypeName(), kAcceptedRowShapes,
            test_method.QualifiedName()));
  }
}

}  // namespace rowan::data
