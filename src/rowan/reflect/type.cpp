#include "rowan/reflect/type.hpp"

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "rowan/common/internal_error.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::reflect {

namespace {

constexpr std::string_view kScopeSeparator = "::";

}  // namespace

auto ParameterType::IsAssignableFrom(const Value& value) const -> bool {
  if (value.IsNull() || !kind_.has_value()) {
    return true;
  }
  if (value.Kind() != *kind_) {
    return false;
  }
  if (object_type_ == nullptr) {
    return true;
  }
  return value.AsObject().GetType().DerivesFrom(*object_type_);
}

auto ParameterType::Name() const -> std::string {
  if (!kind_.has_value()) {
    return "any";
  }
  if (object_type_ != nullptr) {
    return object_type_->FullName();
  }
  return ToString(*kind_);
}

auto MethodInfo::AcceptsArguments(std::span<const Value> arguments) const
    -> bool {
  if (arguments.size() != parameters.size()) {
    return false;
  }
  for (size_t i = 0; i < arguments.size(); ++i) {
    if (!parameters[i].type.IsAssignableFrom(arguments[i])) {
      return false;
    }
  }
  return true;
}

Type::Type(std::string full_name, const Type* base_type)
    : full_name_(std::move(full_name)), base_type_(base_type) {
}

auto Type::Name() const -> std::string_view {
  std::string_view full = full_name_;
  auto pos = full.rfind(kScopeSeparator);
  if (pos == std::string_view::npos) {
    return full;
  }
  return full.substr(pos + kScopeSeparator.size());
}

auto Type::Namespace() const -> std::string_view {
  std::string_view full = full_name_;
  auto pos = full.rfind(kScopeSeparator);
  if (pos == std::string_view::npos) {
    return {};
  }
  return full.substr(0, pos);
}

auto Type::DerivesFrom(const Type& other) const -> bool {
  for (const Type* type = this; type != nullptr; type = type->base_type_) {
    if (type == &other) {
      return true;
    }
  }
  return false;
}

auto Type::AddField(std::string name, Value value, Binding binding) -> Type& {
  fields_.push_back(
      FieldInfo{
          .name = std::move(name),
          .binding = binding,
          .value = std::move(value)});
  return *this;
}

auto Type::AddProperty(
    std::string name, std::function<Value()> getter, Binding binding)
    -> Type& {
  properties_.push_back(
      PropertyInfo{
          .name = std::move(name),
          .binding = binding,
          .getter = std::move(getter)});
  return *this;
}

auto Type::AddMethod(
    std::string name, std::vector<Parameter> parameters,
    std::function<Value(std::span<const Value>)> invoke, Binding binding)
    -> Type& {
  methods_.push_back(
      MethodInfo{
          .name = std::move(name),
          .binding = binding,
          .parameters = std::move(parameters),
          .invoke = std::move(invoke)});
  return *this;
}

auto Type::SetDefaultConstructor(std::function<Value()> constructor)
    -> Type& {
  default_constructor_ = std::move(constructor);
  return *this;
}

auto Type::FindField(std::string_view name) const -> const FieldInfo* {
  for (const auto& field : fields_) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

auto Type::FindProperty(std::string_view name) const -> const PropertyInfo* {
  for (const auto& property : properties_) {
    if (property.name == name) {
      return &property;
    }
  }
  return nullptr;
}

auto Type::FindMethods(std::string_view name) const
    -> std::vector<const MethodInfo*> {
  std::vector<const MethodInfo*> result;
  for (const auto& method : methods_) {
    if (method.name == name) {
      result.push_back(&method);
    }
  }
  return result;
}

auto Type::CreateInstance() const -> Value {
  if (!default_constructor_) {
    common::ThrowInternalError(
        "Type::CreateInstance",
        fmt::format("'{}' has no default constructor", full_name_));
  }
  return default_constructor_();
}

}  // namespace rowan::reflect
