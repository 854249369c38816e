#pragma once

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "rowan/data/theory_data_row.hpp"

namespace rowan::messages {

// Reading a required property that was never set.
class UnsetPropertyError : public std::logic_error {
 public:
  UnsetPropertyError(std::string_view type_name, std::string_view property);
};

// Validate() found required properties that were never set.
class MessageValidationError : public std::logic_error {
 public:
  MessageValidationError(
      std::string_view type_name, const std::set<std::string>& properties);

  [[nodiscard]] auto InvalidProperties() const
      -> const std::set<std::string>& {
    return properties_;
  }

 private:
  std::set<std::string> properties_;
};

// Base of every message exchanged between discovery, execution and
// reporters. Messages are plain data; required properties are checked when
// read and by Validate().
class Message {
 public:
  Message() = default;
  virtual ~Message() = default;

  Message(const Message&) = default;
  auto operator=(const Message&) -> Message& = default;
  Message(Message&&) = default;
  auto operator=(Message&&) -> Message& = default;

  [[nodiscard]] virtual auto TypeName() const -> std::string_view = 0;

  [[nodiscard]] virtual auto ToString() const -> std::string {
    return std::string(TypeName());
  }

  // Throws MessageValidationError naming every unset required property.
  void Validate() const;

 protected:
  virtual void ValidateObjectState(std::set<std::string>& invalid) const {
    (void)invalid;
  }

  template <typename T>
  static void ValidateRequired(
      const std::optional<T>& value, std::string_view property,
      std::set<std::string>& invalid) {
    if (!value.has_value()) {
      invalid.emplace(property);
    }
  }

  template <typename T>
  auto Require(const std::optional<T>& value, std::string_view property) const
      -> const T& {
    if (!value.has_value()) {
      throw UnsetPropertyError(TypeName(), property);
    }
    return *value;
  }
};

// "text" quoted and escaped, or null.
auto Quoted(const std::optional<std::string>& text) -> std::string;

// Messages scoped to one test assembly (a test catalog).
class AssemblyMessage : public Message {
 public:
  [[nodiscard]] auto AssemblyUniqueId() const -> const std::string& {
    return Require(assembly_unique_id_, "AssemblyUniqueId");
  }
  void SetAssemblyUniqueId(std::string id) {
    assembly_unique_id_ = std::move(id);
  }

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> assembly_unique_id_;
};

class DiscoveryStarting : public AssemblyMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "DiscoveryStarting";
  }

  [[nodiscard]] auto AssemblyName() const -> const std::string& {
    return Require(assembly_name_, "AssemblyName");
  }
  void SetAssemblyName(std::string name) {
    assembly_name_ = std::move(name);
  }

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> assembly_name_;
};

class DiscoveryComplete : public AssemblyMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "DiscoveryComplete";
  }

  [[nodiscard]] auto TestCasesToRun() const -> int {
    return test_cases_to_run_;
  }
  void SetTestCasesToRun(int count) {
    test_cases_to_run_ = count;
  }

 private:
  int test_cases_to_run_ = 0;
};

// Messages about one test case. The test case id is required; class and
// method ids are absent for tests that are not declared on a class.
class TestCaseMessage : public AssemblyMessage {
 public:
  [[nodiscard]] auto TestCollectionUniqueId() const -> const std::string& {
    return Require(test_collection_unique_id_, "TestCollectionUniqueId");
  }
  void SetTestCollectionUniqueId(std::string id) {
    test_collection_unique_id_ = std::move(id);
  }

  [[nodiscard]] auto TestClassUniqueId() const
      -> const std::optional<std::string>& {
    return test_class_unique_id_;
  }
  void SetTestClassUniqueId(std::optional<std::string> id) {
    test_class_unique_id_ = std::move(id);
  }

  [[nodiscard]] auto TestMethodUniqueId() const
      -> const std::optional<std::string>& {
    return test_method_unique_id_;
  }
  void SetTestMethodUniqueId(std::optional<std::string> id) {
    test_method_unique_id_ = std::move(id);
  }

  [[nodiscard]] auto TestCaseUniqueId() const -> const std::string& {
    return Require(test_case_unique_id_, "TestCaseUniqueId");
  }
  void SetTestCaseUniqueId(std::string id) {
    test_case_unique_id_ = std::move(id);
  }

  // "<TypeName> case=\"<id>\""
  [[nodiscard]] auto ToString() const -> std::string override;

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> test_collection_unique_id_;
  std::optional<std::string> test_class_unique_id_;
  std::optional<std::string> test_method_unique_id_;
  std::optional<std::string> test_case_unique_id_;
};

// A test case found during discovery, with everything a runner needs to
// filter, display and later execute it.
class TestCaseDiscovered : public TestCaseMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "TestCaseDiscovered";
  }

  // Opaque text from which the test case can be rebuilt.
  [[nodiscard]] auto Serialization() const -> const std::string& {
    return Require(serialization_, "Serialization");
  }
  void SetSerialization(std::string serialization) {
    serialization_ = std::move(serialization);
  }

  [[nodiscard]] auto SkipReason() const -> const std::optional<std::string>& {
    return skip_reason_;
  }
  void SetSkipReason(std::optional<std::string> reason) {
    skip_reason_ = std::move(reason);
  }

  [[nodiscard]] auto SourceFilePath() const
      -> const std::optional<std::string>& {
    return source_file_path_;
  }
  void SetSourceFilePath(std::optional<std::string> path) {
    source_file_path_ = std::move(path);
  }

  [[nodiscard]] auto SourceLineNumber() const -> std::optional<int> {
    return source_line_number_;
  }
  void SetSourceLineNumber(std::optional<int> line) {
    source_line_number_ = line;
  }

  [[nodiscard]] auto TestCaseDisplayName() const -> const std::string& {
    return Require(test_case_display_name_, "TestCaseDisplayName");
  }
  // Throws std::invalid_argument for an empty name.
  void SetTestCaseDisplayName(std::string name);

  // Throws UnsetPropertyError if unset while a method name is set.
  [[nodiscard]] auto TestClassName() const
      -> const std::optional<std::string>&;
  void SetTestClassName(std::optional<std::string> name) {
    test_class_name_ = std::move(name);
  }

  [[nodiscard]] auto TestClassNamespace() const
      -> const std::optional<std::string>& {
    return test_class_namespace_;
  }
  void SetTestClassNamespace(std::optional<std::string> ns) {
    test_class_namespace_ = std::move(ns);
  }

  // Throws UnsetPropertyError if unset while a class name is set.
  [[nodiscard]] auto TestClassNameWithNamespace() const
      -> const std::optional<std::string>&;
  void SetTestClassNameWithNamespace(std::optional<std::string> name) {
    test_class_name_with_namespace_ = std::move(name);
  }

  [[nodiscard]] auto TestMethodName() const
      -> const std::optional<std::string>& {
    return test_method_name_;
  }
  void SetTestMethodName(std::optional<std::string> name) {
    test_method_name_ = std::move(name);
  }

  [[nodiscard]] auto Explicit() const -> bool {
    return explicit_;
  }
  void SetExplicit(bool value) {
    explicit_ = value;
  }

  [[nodiscard]] auto Traits() const -> const data::TraitMap& {
    return traits_;
  }
  void SetTraits(data::TraitMap traits) {
    traits_ = std::move(traits);
  }

  // "TestCaseDiscovered case=\"<id>\" name=\"<display name>\""
  [[nodiscard]] auto ToString() const -> std::string override;

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> serialization_;
  std::optional<std::string> skip_reason_;
  std::optional<std::string> source_file_path_;
  std::optional<int> source_line_number_;
  std::optional<std::string> test_case_display_name_;
  std::optional<std::string> test_class_name_;
  std::optional<std::string> test_class_namespace_;
  std::optional<std::string> test_class_name_with_namespace_;
  std::optional<std::string> test_method_name_;
  bool explicit_ = false;
  data::TraitMap traits_;
};

// Messages about one test (one execution of a test case).
class TestMessage : public TestCaseMessage {
 public:
  [[nodiscard]] auto TestUniqueId() const -> const std::string& {
    return Require(test_unique_id_, "TestUniqueId");
  }
  void SetTestUniqueId(std::string id) {
    test_unique_id_ = std::move(id);
  }

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> test_unique_id_;
};

class TestStarting : public TestMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "TestStarting";
  }

  [[nodiscard]] auto TestDisplayName() const -> const std::string& {
    return Require(test_display_name_, "TestDisplayName");
  }
  // Throws std::invalid_argument for an empty name.
  void SetTestDisplayName(std::string name);

  [[nodiscard]] auto Explicit() const -> bool {
    return explicit_;
  }
  void SetExplicit(bool value) {
    explicit_ = value;
  }

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> test_display_name_;
  bool explicit_ = false;
};

class TestFinished : public TestMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "TestFinished";
  }

  // Seconds.
  [[nodiscard]] auto ExecutionTime() const -> double {
    return execution_time_;
  }
  void SetExecutionTime(double seconds) {
    execution_time_ = seconds;
  }

  [[nodiscard]] auto Output() const -> const std::string& {
    return output_;
  }
  void SetOutput(std::string output) {
    output_ = std::move(output);
  }

 private:
  double execution_time_ = 0.0;
  std::string output_;
};

class TestNotRun : public TestMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "TestNotRun";
  }
};

class TestSkipped : public TestMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "TestSkipped";
  }

  [[nodiscard]] auto Reason() const -> const std::string& {
    return Require(reason_, "Reason");
  }
  void SetReason(std::string reason) {
    reason_ = std::move(reason);
  }

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> reason_;
};

class TestFailed : public TestMessage {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "TestFailed";
  }

  [[nodiscard]] auto ExceptionType() const -> const std::string& {
    return Require(exception_type_, "ExceptionType");
  }
  void SetExceptionType(std::string type) {
    exception_type_ = std::move(type);
  }

  [[nodiscard]] auto FailureMessage() const -> const std::string& {
    return Require(failure_message_, "FailureMessage");
  }
  void SetFailureMessage(std::string message) {
    failure_message_ = std::move(message);
  }

 protected:
  void ValidateObjectState(std::set<std::string>& invalid) const override;

 private:
  std::optional<std::string> exception_type_;
  std::optional<std::string> failure_message_;
};

}  // namespace rowan::messages
