#include "rowan/reflect/value.hpp"

#include <coroutine>
#include <cstdint>
#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "rowan/async/event_loop.hpp"
#include "rowan/common/internal_error.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/argument_formatter.hpp"
#include "rowan/reflect/type.hpp"

namespace rowan::reflect {

auto ToString(ValueKind kind) -> const char* {
  switch (kind) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kBool:
      return "bool";
    case ValueKind::kInt:
      return "int";
    case ValueKind::kDouble:
      return "double";
    case ValueKind::kString:
      return "string";
    case ValueKind::kArray:
      return "array";
    case ValueKind::kTuple:
      return "tuple";
    case ValueKind::kRow:
      return "row";
    case ValueKind::kSequence:
      return "sequence";
    case ValueKind::kAsyncSequence:
      return "async sequence";
    case ValueKind::kDeferred:
      return "deferred";
    case ValueKind::kObject:
      return "object";
  }
  return "unknown";
}

Value::Value(data::TheoryDataRow row)
    : storage_(
          std::make_shared<const data::TheoryDataRow>(std::move(row))) {
}

Value::Value(std::shared_ptr<Sequence> sequence)
    : storage_(std::move(sequence)) {
}

Value::Value(std::shared_ptr<AsyncSequence> sequence)
    : storage_(std::move(sequence)) {
}

Value::Value(std::shared_ptr<Deferred> deferred)
    : storage_(std::move(deferred)) {
}

Value::Value(std::shared_ptr<const Object> object)
    : storage_(std::move(object)) {
}

auto Value::Array(std::vector<Value> elements) -> Value {
  Value result;
  result.storage_ =
      std::make_shared<const std::vector<Value>>(std::move(elements));
  return result;
}

auto Value::Tuple(std::vector<Value> elements) -> Value {
  Value result;
  result.storage_ = std::make_shared<const TupleValue>(
      TupleValue{.elements = std::move(elements)});
  return result;
}

void Value::ExpectKind(ValueKind expected, const char* accessor) const {
  if (Kind() != expected) {
    common::ThrowInternalError(
        accessor, fmt::format(
                      "value holds {} ({}), expected {}", ToString(Kind()),
                      TypeName(), ToString(expected)));
  }
}

auto Value::AsBool() const -> bool {
  ExpectKind(ValueKind::kBool, "Value::AsBool");
  return std::get<bool>(storage_);
}

auto Value::AsInt() const -> int64_t {
  ExpectKind(ValueKind::kInt, "Value::AsInt");
  return std::get<int64_t>(storage_);
}

auto Value::AsDouble() const -> double {
  ExpectKind(ValueKind::kDouble, "Value::AsDouble");
  return std::get<double>(storage_);
}

auto Value::AsString() const -> const std::string& {
  ExpectKind(ValueKind::kString, "Value::AsString");
  return std::get<std::string>(storage_);
}

auto Value::Elements() const -> const std::vector<Value>& {
  if (Kind() == ValueKind::kTuple) {
    return std::get<std::shared_ptr<const TupleValue>>(storage_)->elements;
  }
  ExpectKind(ValueKind::kArray, "Value::Elements");
  return *std::get<std::shared_ptr<const std::vector<Value>>>(storage_);
}

auto Value::AsRow() const -> const data::TheoryDataRow& {
  ExpectKind(ValueKind::kRow, "Value::AsRow");
  return *std::get<std::shared_ptr<const data::TheoryDataRow>>(storage_);
}

auto Value::AsSequence() const -> std::shared_ptr<Sequence> {
  ExpectKind(ValueKind::kSequence, "Value::AsSequence");
  return std::get<std::shared_ptr<Sequence>>(storage_);
}

auto Value::AsAsyncSequence() const -> std::shared_ptr<AsyncSequence> {
  ExpectKind(ValueKind::kAsyncSequence, "Value::AsAsyncSequence");
  return std::get<std::shared_ptr<AsyncSequence>>(storage_);
}

auto Value::AsDeferred() const -> std::shared_ptr<Deferred> {
  ExpectKind(ValueKind::kDeferred, "Value::AsDeferred");
  return std::get<std::shared_ptr<Deferred>>(storage_);
}

auto Value::AsObject() const -> const Object& {
  ExpectKind(ValueKind::kObject, "Value::AsObject");
  return *std::get<std::shared_ptr<const Object>>(storage_);
}

auto Value::TypeName() const -> std::string {
  switch (Kind()) {
    case ValueKind::kNull:
      return "std::nullptr_t";
    case ValueKind::kBool:
      return "bool";
    case ValueKind::kInt:
      return "int64_t";
    case ValueKind::kDouble:
      return "double";
    case ValueKind::kString:
      return "std::string";
    case ValueKind::kArray:
      return "Value[]";
    case ValueKind::kTuple: {
      std::string name = "std::tuple<";
      const auto& elements = Elements();
      for (size_t i = 0; i < elements.size(); ++i) {
        if (i != 0) {
          name += ", ";
        }
        name += elements[i].TypeName();
      }
      name += ">";
      return name;
    }
    case ValueKind::kRow:
      return "rowan::data::TheoryDataRow";
    case ValueKind::kSequence:
      return AsSequence()->TypeName();
    case ValueKind::kAsyncSequence:
      return AsAsyncSequence()->TypeName();
    case ValueKind::kDeferred:
      return AsDeferred()->TypeName();
    case ValueKind::kObject:
      return AsObject().GetType().FullName();
  }
  return "unknown";
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
  if (lhs.Kind() != rhs.Kind()) {
    return false;
  }
  switch (lhs.Kind()) {
    case ValueKind::kArray:
    case ValueKind::kTuple:
      return lhs.Elements() == rhs.Elements();
    case ValueKind::kRow:
      return lhs.AsRow() == rhs.AsRow();
    default:
      // Scalars compare by value, shared handles by identity.
      return lhs.storage_ == rhs.storage_;
  }
}

Deferred::Deferred(std::string type_name, async::Task<Value> computation)
    : type_name_(std::move(type_name)), computation_(std::move(computation)) {
}

struct Deferred::CompletionAwaiter {
  Deferred* deferred;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return !deferred->running_;
  }
  void await_suspend(std::coroutine_handle<> handle) const {
    deferred->waiters_.push_back(handle);
  }
  void await_resume() const noexcept {
  }
};

auto Deferred::Get() -> async::Task<Value> {
  if (running_) {
    co_await CompletionAwaiter{.deferred = this};
  } else if (!result_ && !failure_) {
    running_ = true;
    try {
      result_ = co_await std::move(*computation_);
    } catch (...) {
      failure_ = std::current_exception();
    }
    running_ = false;
    computation_.reset();
    WakeWaiters();
  }
  if (failure_) {
    std::rethrow_exception(failure_);
  }
  co_return *result_;
}

void Deferred::WakeWaiters() {
  if (waiters_.empty()) {
    return;
  }
  auto* loop = async::EventLoop::Current();
  if (loop == nullptr) {
    common::ThrowInternalError(
        "Deferred::Get",
        fmt::format(
            "'{}' finished outside of a running EventLoop with {} waiting",
            type_name_, waiters_.size()));
  }
  for (auto handle : std::exchange(waiters_, {})) {
    loop->Post(handle);
  }
}

auto MakeSequence(std::vector<Value> items, std::string type_name) -> Value {
  auto shared_items =
      std::make_shared<const std::vector<Value>>(std::move(items));
  return MakeSequence(std::move(type_name), [shared_items] {
    return async::FromItems(*shared_items);
  });
}

auto MakeSequence(std::string type_name, Sequence::Factory factory) -> Value {
  return std::make_shared<Sequence>(std::move(type_name), std::move(factory));
}

auto MakeAsyncSequence(std::string type_name, AsyncSequence::Factory factory)
    -> Value {
  return std::make_shared<AsyncSequence>(
      std::move(type_name), std::move(factory));
}

auto MakeDeferred(std::string type_name, async::Task<Value> computation)
    -> Value {
  return std::make_shared<Deferred>(
      std::move(type_name), std::move(computation));
}

auto MakeObject(const Type& type) -> Value {
  return std::shared_ptr<const Object>(std::make_shared<Object>(type));
}

void PrintTo(const Value& value, std::ostream* os) {
  *os << FormatArgument(value);
}

}  // namespace rowan::reflect
