#include "rowan/data/member_data_attribute.hpp"

#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "rowan/async/task.hpp"
#include "rowan/common/logging.hpp"
#include "rowan/data/data_error.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

namespace {

constexpr const char* kAcceptedMemberShapes =
    "- Sequence of rows\n"
    "- Deferred<Sequence of rows>\n"
    "- AsyncSequence of rows\n"
    "- Deferred<AsyncSequence of rows>";

}  // namespace

MemberDataAttribute::MemberDataAttribute(
    std::string member_name, std::vector<reflect::Value> parameters)
    : member_name_(std::move(member_name)),
      parameters_(std::move(parameters)) {
  if (member_name_.empty()) {
    throw std::invalid_argument("member data requires a member name");
  }
}

auto MemberDataAttribute::Describe(const reflect::TestMethod& test_method) const
    -> std::string {
  const reflect::Type* type =
      member_type_ != nullptr ? member_type_ : test_method.DeclaringType();
  if (type == nullptr) {
    return fmt::format("member '{}'", member_name_);
  }
  return fmt::format("member '{}' on '{}'", member_name_, type->FullName());
}

auto MemberDataAttribute::TargetType(
    const reflect::TestMethod& test_method) const -> const reflect::Type& {
  if (member_type_ != nullptr) {
    return *member_type_;
  }
  if (test_method.DeclaringType() == nullptr) {
    throw std::invalid_argument(
        fmt::format(
            "member data '{}' for test method '{}' has no type to search: set "
            "a member type",
            member_name_, test_method.QualifiedName()));
  }
  return *test_method.DeclaringType();
}

auto MemberDataAttribute::FindFieldAccessor(const reflect::Type& type) const
    -> Accessor {
  const reflect::FieldInfo* field = nullptr;
  for (const reflect::Type* t = &type; t != nullptr; t = t->BaseType()) {
    field = t->FindField(member_name_);
    if (field != nullptr) {
      break;
    }
  }
  if (field == nullptr || field->binding != reflect::Binding::kStatic) {
    return nullptr;
  }
  return [field] { return field->value; };
}

auto MemberDataAttribute::FindPropertyAccessor(const reflect::Type& type) const
    -> Accessor {
  const reflect::PropertyInfo* property = nullptr;
  for (const reflect::Type* t = &type; t != nullptr; t = t->BaseType()) {
    property = t->FindProperty(member_name_);
    if (property != nullptr) {
      break;
    }
  }
  if (property == nullptr || !property->getter ||
      property->binding != reflect::Binding::kStatic) {
    return nullptr;
  }
  return [property] { return property->getter(); };
}

auto MemberDataAttribute::FindMethodAccessor(const reflect::Type& type) const
    -> Accessor {
  const reflect::MethodInfo* method = nullptr;
  for (const reflect::Type* t = &type; t != nullptr && method == nullptr;
       t = t->BaseType()) {
    for (const auto* candidate : t->FindMethods(member_name_)) {
      if (candidate->AcceptsArguments(parameters_)) {
        method = candidate;
        break;
      }
    }
  }
  if (method == nullptr || method->binding != reflect::Binding::kStatic) {
    return nullptr;
  }
  return [method, this] {
    return method->invoke(std::span<const reflect::Value>(parameters_));
  };
}

auto MemberDataAttribute::MemberNotFoundMessage(
    const reflect::Type& type) const -> std::string {
  auto message = fmt::format(
      "Could not find public static member (field, property, or method) "
      "named '{}' on '{}'",
      member_name_, type.FullName());
  if (!parameters_.empty()) {
    std::vector<std::string> type_names;
    type_names.reserve(parameters_.size());
    for (const auto& parameter : parameters_) {
      type_names.push_back(
          parameter.IsNull() ? "(null)" : parameter.TypeName());
    }
    message += fmt::format(
        " with parameter types: {}", fmt::join(type_names, ", "));
  }
  return message;
}

auto MemberDataAttribute::ResolveData(
    const reflect::TestMethod& test_method, ResolutionTracker& tracker) const
    -> async::Task<ResolvedDataSet> {
  const reflect::Type& type = TargetType(test_method);

  Accessor accessor = FindFieldAccessor(type);
  if (!accessor) {
    accessor = FindPropertyAccessor(type);
  }
  if (!accessor) {
    accessor = FindMethodAccessor(type);
  }
  if (!accessor) {
    throw DataResolutionError(
        DataErrorKind::kMemberNotFound, MemberNotFoundMessage(type));
  }

  reflect::Value source = accessor();
  common::Logger()->debug(
      "member '{}' on '{}' returned {}", member_name_, type.FullName(),
      source.TypeName());
  if (source.IsNull()) {
    tracker.Advance(ResolutionPhase::kDone);
    co_return ResolvedDataSet{};
  }

  auto rows = co_await ReadDataSource(
      source, SourceShapes::kEnumerableOrDeferred,
      [this, &test_method](const reflect::Value& item) {
        return ConvertDataRow(test_method, item);
      },
      tracker);
  if (!rows) {
    throw DataResolutionError(
        DataErrorKind::kUnsupportedDataShape,
        fmt::format(
            "Member '{}' on '{}' must return data in one of the following "
            "formats (got '{}'):\n{}",
            member_name_, type.FullName(), source.TypeName(),
            kAcceptedMemberShapes));
  }
  tracker.Advance(ResolutionPhase::kDone);
  co_return std::move(*rows);
}

auto MemberDataAttribute::ConvertDataRow(
    const reflect::TestMethod& test_method, const reflect::Value& item) const
    -> TheoryDataRow {
  try {
    return DataAttribute::ConvertDataRow(test_method, item);
  } catch (const DataResolutionError& e) {
    if (e.GetKind() != DataErrorKind::kInvalidRowShape) {
      throw;
    }
    const reflect::Type* type =
        member_type_ != nullptr ? member_type_ : test_method.DeclaringType();
    throw DataResolutionError(
        DataErrorKind::kInvalidRowShape,
        fmt::format(
            "Member '{}' on '{}' yielded an item of type '{}' which is not a "
            "{} (test method '{}')",
            member_name_, type != nullptr ? type->FullName() : "<unknown>",
            item.TypeName(), kAcceptedRowShapes, test_method.QualifiedName()));
  }
}

}  // namespace rowan::data
