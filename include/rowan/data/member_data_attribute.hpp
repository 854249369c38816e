#pragma once

#include <functional>
#include <string>
#include <vector>

#include "rowan/async/task.hpp"
#include "rowan/data/data_attribute.hpp"
#include "rowan/data/data_source_reader.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::data {

// Data taken from a public static member (field, property or method) of the
// test class, or of `member_type` when set.
//
// The member may hold a sync or async enumerable, or a deferred value
// resolving to one. A null member value means "no data".
class MemberDataAttribute : public DataAttribute {
 public:
  // Throws std::invalid_argument for an empty member name. `parameters` are
  // passed to a method member and take part in overload matching; fields
  // and properties ignore them.
  explicit MemberDataAttribute(
      std::string member_name, std::vector<reflect::Value> parameters = {});

  [[nodiscard]] auto MemberName() const -> const std::string& {
    return member_name_;
  }
  [[nodiscard]] auto Parameters() const -> const std::vector<reflect::Value>& {
    return parameters_;
  }

  [[nodiscard]] auto MemberType() const -> const reflect::Type* {
    return member_type_;
  }
  void SetMemberType(const reflect::Type* type) {
    member_type_ = type;
  }

  [[nodiscard]] auto DisableDiscoveryEnumeration() const -> bool {
    return disable_discovery_enumeration_;
  }
  void SetDisableDiscoveryEnumeration(bool value) {
    disable_discovery_enumeration_ = value;
  }

  [[nodiscard]] auto SupportsDiscoveryEnumeration() const -> bool override {
    return !disable_discovery_enumeration_;
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
  using Accessor = std::function<reflect::Value()>;

  // Type searched for the member. Throws std::invalid_argument when neither
  // member_type nor the test method's declaring type is available.
  [[nodiscard]] auto TargetType(const reflect::TestMethod& test_method) const
      -> const reflect::Type&;

  // Each walks the base chain; the first member of that kind found by name
  // decides, and an instance member yields no accessor.
  [[nodiscard]] auto FindFieldAccessor(const reflect::Type& type) const
      -> Accessor;
  [[nodiscard]] auto FindPropertyAccessor(const reflect::Type& type) const
      -> Accessor;
  [[nodiscard]] auto FindMethodAccessor(const reflect::Type& type) const
      -> Accessor;

  [[nodiscard]] auto MemberNotFoundMessage(const reflect::Type& type) const
      -> std::string;

  std::string member_name_;
  std::vector<reflect::Value> parameters_;
  const reflect::Type* member_type_ = nullptr;
  bool disable_discovery_enumeration_ = false;
};

}  // namespace rowan::data
