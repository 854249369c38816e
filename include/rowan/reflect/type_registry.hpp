#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rowan/reflect/type.hpp"

namespace rowan::reflect {

// Owns the types of a test catalog, keyed by full name. Not thread-safe;
// types are registered up front and only read during discovery.
class TypeRegistry {
 public:
  // Throws std::invalid_argument if the name is already taken. The base
  // type, if any, must outlive the registered type.
  auto Register(std::string full_name, const Type* base_type = nullptr)
      -> Type&;

  [[nodiscard]] auto Find(std::string_view full_name) const -> const Type*;

  // Registration order.
  [[nodiscard]] auto Types() const -> std::vector<const Type*>;

 private:
  std::vector<std::unique_ptr<Type>> types_;
  std::unordered_map<std::string, Type*> by_name_;
};

}  // namespace rowan::reflect
