#include "rowan/messages/message.hpp"

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "rowan/reflect/argument_formatter.hpp"

namespace rowan::messages {

UnsetPropertyError::UnsetPropertyError(
    std::string_view type_name, std::string_view property)
    : std::logic_error(
          fmt::format(
              "Attempted to get {} on an uninitialized '{}' object", property,
              type_name)) {
}

MessageValidationError::MessageValidationError(
    std::string_view type_name, const std::set<std::string>& properties)
    : std::logic_error(
          fmt::format(
              "Object of type '{}' had one or more properties that were not "
              "set: {}",
              type_name, fmt::join(properties, ", "))),
      properties_(properties) {
}

void Message::Validate() const {
  std::set<std::string> invalid;
  ValidateObjectState(invalid);
  if (!invalid.empty()) {
    throw MessageValidationError(TypeName(), invalid);
  }
}

auto Quoted(const std::optional<std::string>& text) -> std::string {
  if (!text) {
    return "null";
  }
  return fmt::format("\"{}\"", reflect::EscapeString(*text));
}

void AssemblyMessage::ValidateObjectState(
    std::set<std::string>& invalid) const {
  ValidateRequired(assembly_unique_id_, "AssemblyUniqueId", invalid);
}

void DiscoveryStarting::ValidateObjectState(
    std::set<std::string>& invalid) const {
  AssemblyMessage::ValidateObjectState(invalid);
  ValidateRequired(assembly_name_, "AssemblyName", invalid);
}

auto TestCaseMessage::ToString() const -> std::string {
  return fmt::format(
      "{} case={}", Message::ToString(), Quoted(test_case_unique_id_));
}

void TestCaseMessage::ValidateObjectState(
    std::set<std::string>& invalid) const {
  AssemblyMessage::ValidateObjectState(invalid);
  ValidateRequired(
      test_collection_unique_id_, "TestCollectionUniqueId", invalid);
  ValidateRequired(test_case_unique_id_, "TestCaseUniqueId", invalid);
}

void TestCaseDiscovered::SetTestCaseDisplayName(std::string name) {
  if (name.empty()) {
    throw std::invalid_argument("TestCaseDisplayName must not be empty");
  }
  test_case_display_name_ = std::move(name);
}

auto TestCaseDiscovered::TestClassName() const
    -> const std::optional<std::string>& {
  if (!test_class_name_ && test_method_name_) {
    throw UnsetPropertyError(TypeName(), "TestClassName");
  }
  return test_class_name_;
}

auto TestCaseDiscovered::TestClassNameWithNamespace() const
    -> const std::optional<std::string>& {
  if (!test_class_name_with_namespace_ && test_class_name_) {
    throw UnsetPropertyError(TypeName(), "TestClassNameWithNamespace");
  }
  return test_class_name_with_namespace_;
}

auto TestCaseDiscovered::ToString() const -> std::string {
  return fmt::format(
      "{} name={}", TestCaseMessage::ToString(),
      Quoted(test_case_display_name_));
}

void TestCaseDiscovered::ValidateObjectState(
    std::set<std::string>& invalid) const {
  TestCaseMessage::ValidateObjectState(invalid);
  ValidateRequired(serialization_, "Serialization", invalid);
  ValidateRequired(test_case_display_name_, "TestCaseDisplayName", invalid);
  if (test_method_name_) {
    ValidateRequired(test_class_name_, "TestClassName", invalid);
  }
  if (test_class_name_) {
    ValidateRequired(
        test_class_name_with_namespace_, "TestClassNameWithNamespace",
        invalid);
  }
}

void TestMessage::ValidateObjectState(std::set<std::string>& invalid) const {
  TestCaseMessage::ValidateObjectState(invalid);
  ValidateRequired(test_unique_id_, "TestUniqueId", invalid);
}

void TestStarting::SetTestDisplayName(std::string name) {
  if (name.empty()) {
    throw std::invalid_argument("TestDisplayName must not be empty");
  }
  test_display_name_ = std::move(name);
}

void TestStarting::ValidateObjectState(std::set<std::string>& invalid) const {
  TestMessage::ValidateObjectState(invalid);
  ValidateRequired(test_display_name_, "TestDisplayName", invalid);
}

void TestSkipped::ValidateObjectState(std::set<std::string>& invalid) const {
  TestMessage::ValidateObjectState(invalid);
  ValidateRequired(reason_, "Reason", invalid);
}

void TestFailed::ValidateObjectState(std::set<std::string>& invalid) const {
  TestMessage::ValidateObjectState(invalid);
  ValidateRequired(exception_type_, "ExceptionType", invalid);
  ValidateRequired(failure_message_, "FailureMessage", invalid);
}

}  // namespace rowan::messages
