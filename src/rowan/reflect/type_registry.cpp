#include "rowan/reflect/type_registry.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace rowan::reflect {

auto TypeRegistry::Register(std::string full_name, const Type* base_type)
    -> Type& {
  if (by_name_.contains(full_name)) {
    throw std::invalid_argument(
        fmt::format("type '{}' is already registered", full_name));
  }
  auto type = std::make_unique<Type>(full_name, base_type);
  auto& registered = *type;
  by_name_.emplace(std::move(full_name), type.get());
  types_.push_back(std::move(type));
  return registered;
}

auto TypeRegistry::Find(std::string_view full_name) const -> const Type* {
  auto it = by_name_.find(std::string(full_name));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

auto TypeRegistry::Types() const -> std::vector<const Type*> {
  std::vector<const Type*> result;
  result.reserve(types_.size());
  for (const auto& type : types_) {
    result.push_back(type.get());
  }
  return result;
}

}  // namespace rowan::reflect
