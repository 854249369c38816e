#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "rowan/common/diagnostic.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/messages/test_case_serialization.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"
#include "tests/common/data_test_util.hpp"

namespace rowan::messages {
namespace {

using reflect::Value;
using ::testing::HasSubstr;

TEST(SerializationTest, FlowMapWithTaggedArguments) {
  SerializedTestCase test_case{
      .class_name = "ns::Math",
      .method_name = "Add",
      .arguments = std::vector<Value>{1, "one"}};

  EXPECT_EQ(
      SerializeTestCase(test_case),
      "{class: ns::Math, method: Add, args: [{i: 1}, {s: one}]}");
}

TEST(SerializationTest, RoundTripKeepsEveryKind) {
  SerializedTestCase test_case{
      .class_name = "ns::Math",
      .method_name = "Mixed",
      .arguments = std::vector<Value>{
          nullptr, true, -7, 2.5, "two words",
          Value::Array({1, Value::Tuple({"x", false})})}};

  auto parsed = DeserializeTestCase(SerializeTestCase(test_case));
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
  EXPECT_EQ(*parsed, test_case);
}

TEST(SerializationTest, ArgumentsAreOptional) {
  SerializedTestCase test_case{
      .class_name = "ns::Math", .method_name = "Add", .arguments = {}};

  auto text = SerializeTestCase(test_case);
  EXPECT_THAT(text, ::testing::Not(HasSubstr("args")));

  auto parsed = DeserializeTestCase(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->arguments, std::nullopt);
}

TEST(SerializationTest, NonSerializableArgumentThrows) {
  reflect::Type widget("ns::Widget");
  SerializedTestCase test_case{
      .class_name = "ns::Math",
      .method_name = "Spin",
      .arguments = std::vector<Value>{reflect::MakeObject(widget)}};

  EXPECT_THROW((void)SerializeTestCase(test_case), std::invalid_argument);
}

TEST(SerializationTest, MalformedInputIsHostError) {
  for (const char* text :
       {"[1, 2]", "{class: ns::Math}", "{method: Add, args: [{q: 1}]}",
        "{method: Add, args: 3}", "{method: Add, args: [{i: 1, s: x}]}",
        "{unclosed"}) {
    auto parsed = DeserializeTestCase(text);
    ASSERT_FALSE(parsed.has_value()) << text;
    EXPECT_EQ(parsed.error().kind, DiagKind::kHostError) << text;
  }
}

TEST(SerializationTest, UnknownTagIsNamed) {
  auto parsed = DeserializeTestCase("{method: Add, args: [{q: 1}]}");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().message, "unknown serialized value tag 'q'");
  ASSERT_EQ(parsed.error().notes.size(), 1U);
  EXPECT_THAT(parsed.error().notes[0], HasSubstr("while reading"));
}

TEST(SerializationTest, IsSerializable) {
  reflect::Type widget("ns::Widget");
  EXPECT_TRUE(IsSerializable(Value()));
  EXPECT_TRUE(IsSerializable(Value::Array({1, Value::Tuple({"a"})})));
  EXPECT_FALSE(IsSerializable(reflect::MakeObject(widget)));
  EXPECT_FALSE(
      IsSerializable(Value::Array({1, reflect::MakeObject(widget)})));
  EXPECT_FALSE(IsSerializable(reflect::MakeSequence({1})));
  EXPECT_FALSE(IsSerializable(test::DeferredOf(Value(1))));
  EXPECT_FALSE(IsSerializable(
      Value(data::TheoryDataRow(std::vector<Value>{1}))));
}

}  // namespace
}  // namespace rowan::messages
