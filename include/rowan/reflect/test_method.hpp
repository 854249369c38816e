#pragma once

#include <string>
#include <utility>
#include <vector>

#include "rowan/reflect/type.hpp"

namespace rowan::reflect {

// Handle to a test method: where it is declared, its name and the
// parameters a data row is bound to.
class TestMethod {
 public:
  // `declaring_type` may be null for free-function tests; such tests can
  // only use data sources that name their type explicitly.
  TestMethod(
      const Type* declaring_type, std::string name,
      std::vector<Parameter> parameters = {})
      : declaring_type_(declaring_type),
        name_(std::move(name)),
        parameters_(std::move(parameters)) {
  }

  [[nodiscard]] auto DeclaringType() const -> const Type* {
    return declaring_type_;
  }
  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto Parameters() const -> const std::vector<Parameter>& {
    return parameters_;
  }

  // "ns::Class.Method", or just "Method" without a declaring type.
  [[nodiscard]] auto QualifiedName() const -> std::string {
    if (declaring_type_ == nullptr) {
      return name_;
    }
    return declaring_type_->FullName() + "." + name_;
  }

 private:
  const Type* declaring_type_;
  std::string name_;
  std::vector<Parameter> parameters_;
};

}  // namespace rowan::reflect
