#pragma once

#include <concepts>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "rowan/async/async_generator.hpp"
#include "rowan/async/generator.hpp"
#include "rowan/async/task.hpp"

namespace rowan::data {
class TheoryDataRow;
}  // namespace rowan::data

namespace rowan::reflect {

class Type;
class Sequence;
class AsyncSequence;
class Deferred;
class Object;
struct TupleValue;

// Order matches the alternatives of Value::Storage.
enum class ValueKind : uint8_t {
  kNull,
  kBool,
  kInt,
  kDouble,
  kString,
  kArray,          // Object array: positional arguments
  kTuple,          // Tuple-like: elements become arguments
  kRow,            // Structured data row
  kSequence,       // Synchronous enumerable
  kAsyncSequence,  // Asynchronous enumerable
  kDeferred,       // Deferred single value
  kObject,         // Instance of a registered Type
};

auto ToString(ValueKind kind) -> const char*;

// Integer types a Value stores as kInt: everything integral except bool and
// the character types. signed char and unsigned char count as small ints.
template <typename I>
concept CountingIntegral =
    std::integral<I> && !std::same_as<I, bool> && !std::same_as<I, char> &&
    !std::same_as<I, wchar_t> && !std::same_as<I, char8_t> &&
    !std::same_as<I, char16_t> && !std::same_as<I, char32_t>;

// Dynamically typed value flowing through data sources: member results,
// yielded items and row arguments.
//
// Aggregates (arrays, tuples, rows) are immutable and shared; copying a
// Value never deep-copies. Sequences, deferred values and objects compare
// by identity, everything else by content.
class Value {
 public:
  Value() = default;
  // NOLINTBEGIN(google-explicit-constructor)
  Value(std::nullptr_t) {
  }
  Value(bool value) : storage_(value) {
  }
  // Unsigned values above INT64_MAX throw std::out_of_range.
  template <CountingIntegral I>
  Value(I value) : storage_(ToInt64(value)) {
  }
  Value(double value) : storage_(value) {
  }
  Value(const char* value) : storage_(std::string(value)) {
  }
  Value(std::string value) : storage_(std::move(value)) {
  }
  Value(std::string_view value) : storage_(std::string(value)) {
  }
  Value(data::TheoryDataRow row);
  Value(std::shared_ptr<Sequence> sequence);
  Value(std::shared_ptr<AsyncSequence> sequence);
  Value(std::shared_ptr<Deferred> deferred);
  Value(std::shared_ptr<const Object> object);
  // NOLINTEND(google-explicit-constructor)

  static auto Array(std::vector<Value> elements) -> Value;
  static auto Tuple(std::vector<Value> elements) -> Value;

  [[nodiscard]] auto Kind() const -> ValueKind {
    return static_cast<ValueKind>(storage_.index());
  }
  [[nodiscard]] auto IsNull() const -> bool {
    return Kind() == ValueKind::kNull;
  }

  [[nodiscard]] auto AsBool() const -> bool;
  [[nodiscard]] auto AsInt() const -> int64_t;
  [[nodiscard]] auto AsDouble() const -> double;
  [[nodiscard]] auto AsString() const -> const std::string&;
  // Elements of an array or tuple.
  [[nodiscard]] auto Elements() const -> const std::vector<Value>&;
  [[nodiscard]] auto AsRow() const -> const data::TheoryDataRow&;
  [[nodiscard]] auto AsSequence() const -> std::shared_ptr<Sequence>;
  [[nodiscard]] auto AsAsyncSequence() const -> std::shared_ptr<AsyncSequence>;
  [[nodiscard]] auto AsDeferred() const -> std::shared_ptr<Deferred>;
  [[nodiscard]] auto AsObject() const -> const Object&;

  // Runtime type name used in diagnostics, e.g. "int64_t",
  // "std::tuple<int64_t, std::string>" or a registered type's full name.
  [[nodiscard]] auto TypeName() const -> std::string;

  friend auto operator==(const Value& lhs, const Value& rhs) -> bool;

 private:
  using Storage = std::variant<
      std::monostate, bool, int64_t, double, std::string,
      std::shared_ptr<const std::vector<Value>>,
      std::shared_ptr<const TupleValue>,
      std::shared_ptr<const data::TheoryDataRow>, std::shared_ptr<Sequence>,
      std::shared_ptr<AsyncSequence>, std::shared_ptr<Deferred>,
      std::shared_ptr<const Object>>;

  template <CountingIntegral I>
  static auto ToInt64(I value) -> int64_t {
    if constexpr (std::is_unsigned_v<I>) {
      if (std::cmp_greater(value, std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range(
            "unsigned integer does not fit the int64 range of a Value");
      }
    }
    return static_cast<int64_t>(value);
  }

  void ExpectKind(ValueKind expected, const char* accessor) const;

  Storage storage_;
};

struct TupleValue {
  std::vector<Value> elements;
};

// Synchronous enumerable. Every Enumerate() call starts an independent,
// single-pass walk over the items, the way re-reading a static member
// produces a fresh enumeration.
class Sequence {
 public:
  using Factory = std::function<async::Generator<Value>()>;

  Sequence(std::string type_name, Factory factory)
      : type_name_(std::move(type_name)), factory_(std::move(factory)) {
  }

  [[nodiscard]] auto TypeName() const -> const std::string& {
    return type_name_;
  }
  [[nodiscard]] auto Enumerate() const -> async::Generator<Value> {
    return factory_();
  }

 private:
  std::string type_name_;
  Factory factory_;
};

// Asynchronous enumerable; see Sequence.
class AsyncSequence {
 public:
  using Factory = std::function<async::AsyncGenerator<Value>()>;

  AsyncSequence(std::string type_name, Factory factory)
      : type_name_(std::move(type_name)), factory_(std::move(factory)) {
  }

  [[nodiscard]] auto TypeName() const -> const std::string& {
    return type_name_;
  }
  [[nodiscard]] auto Enumerate() const -> async::AsyncGenerator<Value> {
    return factory_();
  }

 private:
  std::string type_name_;
  Factory factory_;
};

// Deferred single value. The wrapped computation runs on the first Get();
// later calls observe the same result (or the same failure). A Get() that
// arrives while the computation is still suspended waits for it and is
// resumed through the current EventLoop once it finishes.
class Deferred {
 public:
  Deferred(std::string type_name, async::Task<Value> computation);

  [[nodiscard]] auto TypeName() const -> const std::string& {
    return type_name_;
  }

  auto Get() -> async::Task<Value>;

 private:
  struct CompletionAwaiter;

  void WakeWaiters();

  std::string type_name_;
  std::optional<async::Task<Value>> computation_;
  std::optional<Value> result_;
  std::exception_ptr failure_;
  bool running_ = false;
  std::vector<std::coroutine_handle<>> waiters_;
};

// Instance of a registered type with no further structure.
class Object {
 public:
  explicit Object(const Type& type) : type_(&type) {
  }

  [[nodiscard]] auto GetType() const -> const Type& {
    return *type_;
  }

 private:
  const Type* type_;
};

// Sequence whose enumerations replay a fixed list of items.
auto MakeSequence(
    std::vector<Value> items, std::string type_name = "std::vector<Value>")
    -> Value;
auto MakeSequence(std::string type_name, Sequence::Factory factory) -> Value;
auto MakeAsyncSequence(std::string type_name, AsyncSequence::Factory factory)
    -> Value;
auto MakeDeferred(std::string type_name, async::Task<Value> computation)
    -> Value;
auto MakeObject(const Type& type) -> Value;

// GTest printer
void PrintTo(const Value& value, std::ostream* os);

}  // namespace rowan::reflect
