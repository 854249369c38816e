#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "rowan/reflect/value.hpp"

namespace rowan::reflect {

class Type;

enum class Binding : uint8_t {
  kStatic,
  kInstance,
};

// Declared type of a method or test-method parameter.
class ParameterType {
 public:
  // Accepts any value.
  static auto Any() -> ParameterType {
    return ParameterType{std::nullopt, nullptr};
  }
  static auto Of(ValueKind kind) -> ParameterType {
    return ParameterType{kind, nullptr};
  }
  // Accepts instances of `type` or of types deriving from it.
  static auto ObjectOf(const Type& type) -> ParameterType {
    return ParameterType{ValueKind::kObject, &type};
  }

  // Whether a value of this runtime shape can be passed to the parameter.
  // Null is accepted everywhere.
  [[nodiscard]] auto IsAssignableFrom(const Value& value) const -> bool;

  [[nodiscard]] auto Name() const -> std::string;

 private:
  ParameterType(std::optional<ValueKind> kind, const Type* object_type)
      : kind_(kind), object_type_(object_type) {
  }

  std::optional<ValueKind> kind_;
  const Type* object_type_;
};

struct Parameter {
  std::string name;
  ParameterType type;
};

struct FieldInfo {
  std::string name;
  Binding binding;
  Value value;
};

struct PropertyInfo {
  std::string name;
  Binding binding;
  std::function<Value()> getter;  // Empty for write-only properties
};

struct MethodInfo {
  std::string name;
  Binding binding;
  std::vector<Parameter> parameters;
  std::function<Value(std::span<const Value>)> invoke;

  // Same parameter count, and every supplied argument assignable to the
  // parameter at its position.
  [[nodiscard]] auto AcceptsArguments(std::span<const Value> arguments) const
      -> bool;
};

// Runtime description of a class: namespace-qualified name, base type and
// members. Lookups only search the type itself; walking the base chain is
// left to the caller, which decides how a match on a base type counts.
//
// Member storage is stable: pointers returned by Find* stay valid for the
// lifetime of the type.
class Type {
 public:
  explicit Type(std::string full_name, const Type* base_type = nullptr);

  Type(const Type&) = delete;
  auto operator=(const Type&) -> Type& = delete;
  Type(Type&&) = delete;
  auto operator=(Type&&) -> Type& = delete;
  ~Type() = default;

  // "ns::sub::Name"
  [[nodiscard]] auto FullName() const -> const std::string& {
    return full_name_;
  }
  // "Name"
  [[nodiscard]] auto Name() const -> std::string_view;
  // "ns::sub", empty for the global namespace
  [[nodiscard]] auto Namespace() const -> std::string_view;

  [[nodiscard]] auto BaseType() const -> const Type* {
    return base_type_;
  }

  // True when this type is `other` or derives from it.
  [[nodiscard]] auto DerivesFrom(const Type& other) const -> bool;

  auto AddField(
      std::string name, Value value, Binding binding = Binding::kStatic)
      -> Type&;
  auto AddProperty(
      std::string name, std::function<Value()> getter,
      Binding binding = Binding::kStatic) -> Type&;
  auto AddMethod(
      std::string name, std::vector<Parameter> parameters,
      std::function<Value(std::span<const Value>)> invoke,
      Binding binding = Binding::kStatic) -> Type&;
  auto SetDefaultConstructor(std::function<Value()> constructor) -> Type&;

  [[nodiscard]] auto FindField(std::string_view name) const
      -> const FieldInfo*;
  [[nodiscard]] auto FindProperty(std::string_view name) const
      -> const PropertyInfo*;
  // Overloads in declaration order.
  [[nodiscard]] auto FindMethods(std::string_view name) const
      -> std::vector<const MethodInfo*>;

  [[nodiscard]] auto HasDefaultConstructor() const -> bool {
    return static_cast<bool>(default_constructor_);
  }
  // Requires HasDefaultConstructor().
  [[nodiscard]] auto CreateInstance() const -> Value;

 private:
  std::string full_name_;
  const Type* base_type_;
  std::deque<FieldInfo> fields_;
  std::deque<PropertyInfo> properties_;
  std::deque<MethodInfo> methods_;
  std::function<Value()> default_constructor_;
};

}  // namespace rowan::reflect
