#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "rowan/async/event_loop.hpp"
#include "rowan/common/internal_error.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/reflect/argument_formatter.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"
#include "tests/common/data_test_util.hpp"

namespace rowan::reflect {
namespace {

class ValueTest : public ::testing::Test {};

// =============================================================================
// Construction and access
// =============================================================================

TEST_F(ValueTest, ScalarKinds) {
  EXPECT_EQ(Value().Kind(), ValueKind::kNull);
  EXPECT_EQ(Value(nullptr).Kind(), ValueKind::kNull);
  EXPECT_EQ(Value(true).Kind(), ValueKind::kBool);
  EXPECT_EQ(Value(3).Kind(), ValueKind::kInt);
  EXPECT_EQ(Value(uint8_t{3}).Kind(), ValueKind::kInt);
  EXPECT_EQ(Value(2.5).Kind(), ValueKind::kDouble);
  EXPECT_EQ(Value("text").Kind(), ValueKind::kString);
  EXPECT_EQ(Value(std::string("text")).AsString(), "text");
}

TEST_F(ValueTest, IntegerConversions) {
  static_assert(!std::is_constructible_v<Value, char>);
  static_assert(!std::is_constructible_v<Value, char8_t>);
  static_assert(!std::is_constructible_v<Value, char32_t>);
  static_assert(std::is_constructible_v<Value, int8_t>);

  EXPECT_EQ(Value(int8_t{-3}).AsInt(), -3);
  EXPECT_EQ(Value(std::numeric_limits<int64_t>::min()).AsInt(), INT64_MIN);
  EXPECT_EQ(
      Value(static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
          .AsInt(),
      INT64_MAX);
  EXPECT_THROW(
      (void)Value(std::numeric_limits<uint64_t>::max()), std::out_of_range);
}

TEST_F(ValueTest, WrongAccessorIsInternalError) {
  EXPECT_THROW((void)Value(1).AsString(), common::InternalError);
  EXPECT_THROW((void)Value("x").Elements(), common::InternalError);
}

TEST_F(ValueTest, ArraysAndTuplesShareElementAccess) {
  auto array = Value::Array({1, "a"});
  auto tuple = Value::Tuple({1, "a"});
  EXPECT_EQ(array.Kind(), ValueKind::kArray);
  EXPECT_EQ(tuple.Kind(), ValueKind::kTuple);
  EXPECT_EQ(array.Elements(), tuple.Elements());
  // Same elements, different shapes
  EXPECT_NE(array, tuple);
}

TEST_F(ValueTest, TypeNames) {
  EXPECT_EQ(Value().TypeName(), "std::nullptr_t");
  EXPECT_EQ(Value(1).TypeName(), "int64_t");
  EXPECT_EQ(Value::Array({1}).TypeName(), "Value[]");
  EXPECT_EQ(
      Value::Tuple({1, "a"}).TypeName(), "std::tuple<int64_t, std::string>");
  EXPECT_EQ(
      Value(data::TheoryDataRow(std::vector<Value>{1})).TypeName(),
      "rowan::data::TheoryDataRow");
  EXPECT_EQ(MakeSequence({}, "Rows").TypeName(), "Rows");

  Type widget("ns::Widget");
  EXPECT_EQ(MakeObject(widget).TypeName(), "ns::Widget");
}

TEST_F(ValueTest, HandlesCompareByIdentity) {
  auto sequence = MakeSequence({1, 2});
  auto same = sequence;
  EXPECT_EQ(sequence, same);
  EXPECT_NE(sequence, MakeSequence({1, 2}));
}

TEST_F(ValueTest, SequenceEnumeratesAfresh) {
  auto sequence = MakeSequence({1, 2}).AsSequence();
  for (int pass = 0; pass < 2; ++pass) {
    auto items = sequence->Enumerate();
    EXPECT_EQ(items.Next(), Value(1));
    EXPECT_EQ(items.Next(), Value(2));
    EXPECT_EQ(items.Next(), std::nullopt);
  }
}

// =============================================================================
// Deferred
// =============================================================================

TEST_F(ValueTest, DeferredRunsOnceAndCaches) {
  int runs = 0;
  auto compute = [](int* runs) -> async::Task<Value> {
    ++*runs;
    co_await async::Yield();
    co_return Value(7);
  };
  auto deferred = MakeDeferred("Task<int>", compute(&runs)).AsDeferred();

  async::EventLoop loop;
  EXPECT_EQ(loop.RunUntilComplete(deferred->Get()), Value(7));
  EXPECT_EQ(loop.RunUntilComplete(deferred->Get()), Value(7));
  EXPECT_EQ(runs, 1);
}

TEST_F(ValueTest, DeferredCachesFailure) {
  auto compute = []() -> async::Task<Value> {
    co_await async::Yield();
    throw std::runtime_error("not ready");
  };
  auto deferred = MakeDeferred("Task<int>", compute()).AsDeferred();

  async::EventLoop loop;
  EXPECT_THROW(loop.RunUntilComplete(deferred->Get()), std::runtime_error);
  EXPECT_THROW(loop.RunUntilComplete(deferred->Get()), std::runtime_error);
}

TEST_F(ValueTest, DeferredAwaitedTwiceWhileRunning) {
  int runs = 0;
  auto compute = [](int* runs) -> async::Task<Value> {
    ++*runs;
    co_await async::Yield();
    co_return Value(7);
  };
  auto deferred = MakeDeferred("Task<int>", compute(&runs)).AsDeferred();

  async::EventLoop loop;
  auto first = deferred->Get();
  auto second = deferred->Get();
  {
    async::EventLoop::Activation active(loop);
    first.Resume();
    second.Resume();
  }
  EXPECT_FALSE(second.Done());
  while (loop.RunOne()) {
  }
  ASSERT_TRUE(first.Done());
  ASSERT_TRUE(second.Done());
  EXPECT_EQ(first.Result(), Value(7));
  EXPECT_EQ(second.Result(), Value(7));
  EXPECT_EQ(runs, 1);
}

TEST_F(ValueTest, DeferredFailureReachesEveryWaiter) {
  auto compute = []() -> async::Task<Value> {
    co_await async::Yield();
    throw std::runtime_error("not ready");
  };
  auto deferred = MakeDeferred("Task<int>", compute()).AsDeferred();

  async::EventLoop loop;
  auto first = deferred->Get();
  auto second = deferred->Get();
  {
    async::EventLoop::Activation active(loop);
    first.Resume();
    second.Resume();
  }
  while (loop.RunOne()) {
  }
  ASSERT_TRUE(second.Done());
  EXPECT_THROW((void)first.Result(), std::runtime_error);
  EXPECT_THROW((void)second.Result(), std::runtime_error);
}

// =============================================================================
// Argument formatting
// =============================================================================

TEST_F(ValueTest, FormatScalars) {
  EXPECT_EQ(FormatArgument(Value()), "null");
  EXPECT_EQ(FormatArgument(Value(true)), "true");
  EXPECT_EQ(FormatArgument(Value(-4)), "-4");
  EXPECT_EQ(FormatArgument(Value(1.5)), "1.5");
  EXPECT_EQ(FormatArgument(Value("hi")), "\"hi\"");
}

TEST_F(ValueTest, FormatEscapesStrings) {
  EXPECT_EQ(FormatArgument(Value("a\"b\\c\n")), R"("a\"b\\c\n")");
  EXPECT_EQ(EscapeString(std::string("\x01", 1)), "\\x01");
}

TEST_F(ValueTest, FormatTruncatesLongStrings) {
  std::string text(kMaxFormatStringLength + 10, 'x');
  EXPECT_EQ(
      FormatArgument(Value(text)),
      "\"" + std::string(kMaxFormatStringLength, 'x') + "\"...");
}

TEST_F(ValueTest, FormatTruncationKeepsUtf8Whole) {
  std::string prefix(kMaxFormatStringLength - 1, 'a');
  EXPECT_EQ(
      FormatArgument(Value(prefix + "\xc3\xa9" + "tail")),
      "\"" + prefix + "\"...");
  EXPECT_EQ(
      FormatArgument(Value(prefix + "b\xc3\xa9")),
      "\"" + prefix + "b\"...");
}

TEST_F(ValueTest, FormatAggregates) {
  EXPECT_EQ(FormatArgument(Value::Array({1, "a"})), "[1, \"a\"]");
  EXPECT_EQ(FormatArgument(Value::Tuple({1, 2})), "(1, 2)");
  EXPECT_EQ(
      FormatArgument(Value::Array({1, 2, 3, 4, 5, 6, 7})),
      "[1, 2, 3, 4, 5, ...]");
}

TEST_F(ValueTest, FormatLimitsDepth) {
  auto nested =
      Value::Array({Value::Array({Value::Array({Value::Array({1})})})});
  EXPECT_EQ(FormatArgument(nested), "[[[[...]]]]");
}

TEST_F(ValueTest, FormatLazyValuesByTypeName) {
  EXPECT_EQ(FormatArgument(MakeSequence({1}, "Rows")), "Rows");
  EXPECT_EQ(FormatArgument(test::DeferredOf(Value(1))), "Task<Value>");
}

}  // namespace
}  // namespace rowan::reflect
