#include "rowan/samples/sample_catalog.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "rowan/async/async_generator.hpp"
#include "rowan/async/event_loop.hpp"
#include "rowan/async/generator.hpp"
#include "rowan/async/task.hpp"
#include "rowan/data/class_data_attribute.hpp"
#include "rowan/data/inline_data_attribute.hpp"
#include "rowan/data/member_data_attribute.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/discovery/test_catalog.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"

namespace rowan::samples {

namespace {

using reflect::Parameter;
using reflect::ParameterType;
using reflect::Value;
using reflect::ValueKind;

auto CountUpTo(int64_t count) -> async::Generator<Value> {
  for (int64_t i = 1; i <= count; ++i) {
    auto row = Value::Array({i});
    co_yield std::move(row);
  }
}

auto SquaresAsync(int64_t count) -> async::AsyncGenerator<Value> {
  for (int64_t i = 1; i <= count; ++i) {
    co_await async::Yield();
    auto row = Value::Array({i, i * i});
    co_yield std::move(row);
  }
}

auto LoadPairs() -> async::Task<Value> {
  co_await async::Yield();
  auto pairs = reflect::MakeSequence(
      {Value::Tuple({"one", 1}), Value::Tuple({"two", 2}),
       Value::Tuple({"three", 3})},
      "std::vector<std::tuple<std::string, int64_t>>");
  co_return pairs;
}

auto LoadSquares(int64_t count) -> async::Task<Value> {
  co_await async::Yield();
  co_return reflect::MakeAsyncSequence(
      "AsyncGenerator<Value>", [count] { return SquaresAsync(count); });
}

auto IntParameter(const char* name) -> Parameter {
  return Parameter{.name = name, .type = ParameterType::Of(ValueKind::kInt)};
}

auto StringParameter(const char* name) -> Parameter {
  return Parameter{
      .name = name, .type = ParameterType::Of(ValueKind::kString)};
}

}  // namespace

void PopulateSampleCatalog(discovery::TestCatalog& catalog) {
  auto& types = catalog.Types();

  auto& widget = types.Register("samples::Widget");

  auto& prime_data = types.Register("samples::PrimeData");
  prime_data.SetDefaultConstructor([] {
    return reflect::MakeSequence(
        {Value::Array({2}),
         Value(
             data::TheoryDataRow(std::vector<Value>{3})
                 .WithTestDisplayName("odd prime")),
         Value(
             data::TheoryDataRow(std::vector<Value>{4})
                 .WithSkip("4 is not prime")),
         Value::Tuple({5})},
        "samples::PrimeData");
  });

  auto& math_data = types.Register("samples::MathData");
  math_data
      .AddField(
          "AdditionCases",
          reflect::MakeSequence(
              {Value::Array({1, 2, 3}), Value::Array({2, 3, 5}),
               Value::Array({-1, 1, 0})},
              "std::vector<Value[]>"))
      .AddMethod(
          "Range", {IntParameter("count")},
          [](std::span<const Value> args) {
            int64_t count = args[0].AsInt();
            return reflect::MakeSequence(
                "Generator<Value>", [count] { return CountUpTo(count); });
          })
      .AddMethod(
          "Squares", {IntParameter("count")},
          [](std::span<const Value> args) {
            int64_t count = args[0].AsInt();
            return reflect::MakeAsyncSequence(
                "AsyncGenerator<Value>",
                [count] { return SquaresAsync(count); });
          })
      .AddMethod(
          "LaterPairs", {},
          [](std::span<const Value> /*args*/) {
            return reflect::MakeDeferred(
                "Task<std::vector<std::tuple<std::string, int64_t>>>",
                LoadPairs());
          })
      .AddMethod(
          "LaterSquares", {},
          [](std::span<const Value> /*args*/) {
            return reflect::MakeDeferred(
                "Task<AsyncGenerator<Value>>", LoadSquares(2));
          })
      .AddProperty("AllWidgets", [&widget] {
        return reflect::MakeSequence(
            {Value::Array({reflect::MakeObject(widget)}),
             Value::Array({reflect::MakeObject(widget)})},
            "std::vector<samples::Widget>");
      });

  auto& math_tests = types.Register("samples::MathTests", &math_data);

  auto& add = catalog.AddTheory(
      reflect::TestMethod(
          &math_tests, "Add",
          {IntParameter("a"), IntParameter("b"), IntParameter("expected")}));
  add.AddDataSource<data::MemberDataAttribute>("AdditionCases");

  auto& positive = catalog.AddTheory(
      reflect::TestMethod(&math_tests, "IsPositive", {IntParameter("value")}));
  positive.AddDataSource<data::MemberDataAttribute>(
      "Range", std::vector<Value>{3});

  auto& square = catalog.AddTheory(
      reflect::TestMethod(
          &math_tests, "Square",
          {IntParameter("value"), IntParameter("square")}));
  square.AddDataSource<data::MemberDataAttribute>(
      "Squares", std::vector<Value>{3});
  square.AddDataSource<data::MemberDataAttribute>("LaterSquares");

  auto& named = catalog.AddTheory(
      reflect::TestMethod(
          &math_tests, "Named",
          {StringParameter("word"), IntParameter("number")}));
  named.AddDataSource<data::MemberDataAttribute>("LaterPairs");

  auto& primes = catalog.AddTheory(
      reflect::TestMethod(&math_tests, "IsPrime", {IntParameter("value")}));
  primes.AddDataSource<data::ClassDataAttribute>(prime_data);

  auto& concat = catalog.AddTheory(
      reflect::TestMethod(
          &math_tests, "Concat",
          {StringParameter("left"), StringParameter("right")}));
  concat.AddDataSource<data::InlineDataAttribute>(std::vector<Value>{"a", "b"});
  concat.AddDataSource<data::InlineDataAttribute>(std::vector<Value>{"x", ""});

  auto& widgets = catalog.AddTheory(
      reflect::TestMethod(
          &math_tests, "Spin",
          {Parameter{
              .name = "widget", .type = ParameterType::ObjectOf(widget)}}));
  widgets.AddDataSource<data::MemberDataAttribute>("AllWidgets")
      .SetDisableDiscoveryEnumeration(true);

  auto& pending = catalog.AddTheory(
      reflect::TestMethod(&math_tests, "Divide", {IntParameter("value")}));
  pending.skip = "division is not implemented yet";
  pending.AddDataSource<data::MemberDataAttribute>(
      "Range", std::vector<Value>{2});
}

}  // namespace rowan::samples
