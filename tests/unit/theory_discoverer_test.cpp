#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "rowan/data/data_error.hpp"
#include "rowan/data/inline_data_attribute.hpp"
#include "rowan/data/member_data_attribute.hpp"
#include "rowan/data/theory_data_row.hpp"
#include "rowan/discovery/test_catalog.hpp"
#include "rowan/discovery/theory_discoverer.hpp"
#include "rowan/messages/message.hpp"
#include "rowan/messages/test_case_serialization.hpp"
#include "rowan/reflect/test_method.hpp"
#include "rowan/reflect/type.hpp"
#include "rowan/reflect/value.hpp"
#include "tests/common/data_test_util.hpp"

namespace rowan::discovery {
namespace {

using data::MemberDataAttribute;
using data::TheoryDataRow;
using reflect::Value;

class TheoryDiscovererTest : public ::testing::Test {
 protected:
  TheoryDiscovererTest()
      : catalog_("assembly"), tests_(catalog_.Types().Register("ns::Tests")) {
  }

  auto AddRunTheory() -> Theory& {
    return catalog_.AddTheory(
        reflect::TestMethod(
            &tests_, "Run",
            {test::IntParameter("n"), test::StringParameter("s")}));
  }

  auto Discover(const Theory& theory, DiscoveryOptions options = {})
      -> std::vector<messages::TestCaseDiscovered> {
    return TheoryDiscoverer(catalog_, options).Discover(theory);
  }

  static auto DisplayNames(
      const std::vector<messages::TestCaseDiscovered>& cases)
      -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& test_case : cases) {
      names.push_back(test_case.TestCaseDisplayName());
    }
    return names;
  }

  TestCatalog catalog_;
  reflect::Type& tests_;
};

// =============================================================================
// Display names and ids
// =============================================================================

TEST_F(TheoryDiscovererTest, FormatDisplayName) {
  reflect::TestMethod method(
      &tests_, "Run", {test::IntParameter("n"), test::StringParameter("s")});

  EXPECT_EQ(
      FormatDisplayName("Run", method, std::vector<Value>{1, "a"}),
      "Run(n: 1, s: \"a\")");
  EXPECT_EQ(
      FormatDisplayName("Run", method, std::vector<Value>{1}),
      "Run(n: 1, s: ???)");
  EXPECT_EQ(
      FormatDisplayName("Run", method, std::vector<Value>{1, "a", 2.5}),
      "Run(n: 1, s: \"a\", ???: 2.5)");
  EXPECT_EQ(
      FormatDisplayName("Run", method, std::vector<Value>{}),
      "Run(n: ???, s: ???)");
}

TEST_F(TheoryDiscovererTest, FormatDisplayNameWithoutParameters) {
  reflect::TestMethod method(&tests_, "Plain");
  EXPECT_EQ(FormatDisplayName("Plain", method, {}), "Plain");
  EXPECT_EQ(
      FormatDisplayName("Plain", method, std::vector<Value>{true}),
      "Plain(???: true)");
}

TEST_F(TheoryDiscovererTest, UniqueIdsAreStable) {
  auto id = MakeUniqueId({"assembly", "ns::Tests"});
  EXPECT_EQ(id.size(), 16U);
  EXPECT_EQ(id, MakeUniqueId({"assembly", "ns::Tests"}));
  EXPECT_NE(MakeUniqueId({"ab", "c"}), MakeUniqueId({"a", "bc"}));
}

// =============================================================================
// Enumerated theories
// =============================================================================

TEST_F(TheoryDiscovererTest, OneTestCasePerRow) {
  tests_.AddField("Data", reflect::MakeSequence(test::NumberedRows(2)));
  auto& theory = AddRunTheory();
  theory.AddDataSource<MemberDataAttribute>("Data");

  auto cases = Discover(theory);
  EXPECT_EQ(
      DisplayNames(cases), (std::vector<std::string>{
                               "ns::Tests.Run(n: 1, s: \"a\")",
                               "ns::Tests.Run(n: 2, s: \"b\")"}));
  ASSERT_EQ(cases.size(), 2U);
  EXPECT_NE(cases[0].TestCaseUniqueId(), cases[1].TestCaseUniqueId());
  EXPECT_EQ(cases[0].TestMethodUniqueId(), cases[1].TestMethodUniqueId());

  const auto& first = cases[0];
  EXPECT_NO_THROW(first.Validate());
  EXPECT_EQ(first.TestClassName(), "Tests");
  EXPECT_EQ(first.TestClassNamespace(), "ns");
  EXPECT_EQ(first.TestClassNameWithNamespace(), "ns::Tests");
  EXPECT_EQ(first.TestMethodName(), "Run");
  EXPECT_EQ(first.SkipReason(), std::nullopt);

  auto identity = messages::DeserializeTestCase(first.Serialization());
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->class_name, "ns::Tests");
  EXPECT_EQ(identity->method_name, "Run");
  EXPECT_EQ(identity->arguments, (std::vector<Value>{1, "a"}));
}

TEST_F(TheoryDiscovererTest, IdsAreStableAcrossRuns) {
  tests_.AddField("Data", reflect::MakeSequence(test::NumberedRows(1)));
  auto& theory = AddRunTheory();
  theory.AddDataSource<MemberDataAttribute>("Data");

  EXPECT_EQ(
      Discover(theory)[0].TestCaseUniqueId(),
      Discover(theory)[0].TestCaseUniqueId());
}

TEST_F(TheoryDiscovererTest, RowsFromEverySourceInOrder) {
  tests_.AddField(
      "Later", test::DeferredOf(test::AsyncSequenceOf(test::NumberedRows(1))));
  auto& theory = AddRunTheory();
  theory.AddDataSource<data::InlineDataAttribute>(std::vector<Value>{9, "z"});
  theory.AddDataSource<MemberDataAttribute>("Later");

  EXPECT_EQ(
      DisplayNames(Discover(theory)), (std::vector<std::string>{
                                          "ns::Tests.Run(n: 9, s: \"z\")",
                                          "ns::Tests.Run(n: 1, s: \"a\")"}));
}

TEST_F(TheoryDiscovererTest, MetadataPrecedence) {
  tests_.AddField(
      "Data", reflect::MakeSequence(
                  {Value::Array({1, "a"}),
                   Value(TheoryDataRow(std::vector<Value>{2, "b"})
                             .WithTestDisplayName("Row")
                             .WithSkip("row skip")
                             .WithExplicit(true)
                             .WithTrait("kind", "row"))}));
  auto& theory = AddRunTheory();
  theory.traits["kind"].push_back("theory");
  auto& source = theory.AddDataSource<MemberDataAttribute>("Data");
  source.SetTestDisplayName("Custom");
  source.SetSkip("source skip");
  source.AddTrait("kind", "source");

  auto cases = Discover(theory);
  ASSERT_EQ(cases.size(), 2U);

  EXPECT_EQ(cases[0].TestCaseDisplayName(), "Custom(n: 1, s: \"a\")");
  EXPECT_EQ(cases[0].SkipReason(), "source skip");
  EXPECT_FALSE(cases[0].Explicit());
  EXPECT_EQ(
      cases[0].Traits().at("kind"),
      (std::vector<std::string>{"theory", "source"}));

  EXPECT_EQ(cases[1].TestCaseDisplayName(), "Row(n: 2, s: \"b\")");
  EXPECT_EQ(cases[1].SkipReason(), "row skip");
  EXPECT_TRUE(cases[1].Explicit());
  EXPECT_EQ(
      cases[1].Traits().at("kind"),
      (std::vector<std::string>{"theory", "source", "row"}));
}

TEST_F(TheoryDiscovererTest, SourceFileAndLineAreCarried) {
  auto& theory = AddRunTheory();
  theory.source_file_path = "math_tests.cpp";
  theory.source_line_number = 42;
  theory.AddDataSource<data::InlineDataAttribute>(std::vector<Value>{1, "a"});

  auto cases = Discover(theory);
  ASSERT_EQ(cases.size(), 1U);
  EXPECT_EQ(cases[0].SourceFilePath(), "math_tests.cpp");
  EXPECT_EQ(cases[0].SourceLineNumber(), 42);
}

// =============================================================================
// Single test case
// =============================================================================

TEST_F(TheoryDiscovererTest, SkippedTheoryIsNotResolved) {
  auto& theory = AddRunTheory();
  theory.skip = "later";
  // Would fail if resolved.
  theory.AddDataSource<MemberDataAttribute>("Missing");

  auto cases = Discover(theory);
  ASSERT_EQ(cases.size(), 1U);
  EXPECT_EQ(cases[0].TestCaseDisplayName(), "ns::Tests.Run");
  EXPECT_EQ(cases[0].SkipReason(), "later");

  auto identity = messages::DeserializeTestCase(cases[0].Serialization());
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->arguments, std::nullopt);
}

TEST_F(TheoryDiscovererTest, PreEnumerationDisabled) {
  tests_.AddField("Data", reflect::MakeSequence(test::NumberedRows(3)));
  auto& theory = AddRunTheory();
  theory.AddDataSource<MemberDataAttribute>("Data");

  auto cases = Discover(theory, {.pre_enumerate_theories = false});
  EXPECT_EQ(DisplayNames(cases), std::vector<std::string>{"ns::Tests.Run"});
}

TEST_F(TheoryDiscovererTest, SourceDisablesEnumeration) {
  tests_.AddField("Data", reflect::MakeSequence(test::NumberedRows(3)));
  tests_.AddField("More", reflect::MakeSequence(test::NumberedRows(1)));
  auto& theory = AddRunTheory();
  theory.AddDataSource<MemberDataAttribute>("More");
  theory.AddDataSource<MemberDataAttribute>("Data")
      .SetDisableDiscoveryEnumeration(true);

  EXPECT_EQ(Discover(theory).size(), 1U);
}

TEST_F(TheoryDiscovererTest, NonSerializableArgument) {
  const auto& widget = catalog_.Types().Register("ns::Widget");
  tests_.AddField(
      "Data", reflect::MakeSequence(
                  {Value::Array({1, "a"}),
                   Value::Array({2, reflect::MakeObject(widget)})}));
  auto& theory = AddRunTheory();
  theory.AddDataSource<MemberDataAttribute>("Data");

  EXPECT_EQ(
      DisplayNames(Discover(theory)),
      std::vector<std::string>{"ns::Tests.Run"});
}

TEST_F(TheoryDiscovererTest, NoRows) {
  tests_.AddField("Data", reflect::MakeSequence({}));
  auto& theory = AddRunTheory();
  theory.AddDataSource<MemberDataAttribute>("Data");

  EXPECT_EQ(
      DisplayNames(Discover(theory)),
      std::vector<std::string>{"ns::Tests.Run"});
}

TEST_F(TheoryDiscovererTest, ResolutionErrorPropagates) {
  auto& theory = AddRunTheory();
  theory.AddDataSource<MemberDataAttribute>("Missing");

  EXPECT_THROW((void)Discover(theory), data::DataResolutionError);
}

// =============================================================================
// Run
// =============================================================================

TEST_F(TheoryDiscovererTest, RunSendsMessagesInOrder) {
  tests_.AddField("Data", reflect::MakeSequence(test::NumberedRows(2)));
  AddRunTheory().AddDataSource<MemberDataAttribute>("Data");
  auto& skipped = catalog_.AddTheory(reflect::TestMethod(&tests_, "Other"));
  skipped.skip = "not now";

  TheoryDiscoverer discoverer(catalog_, {});
  std::vector<std::string> received;
  int count = discoverer.Run([&received](const messages::Message& message) {
    received.push_back(message.ToString());
  });

  EXPECT_EQ(count, 3);
  ASSERT_EQ(received.size(), 5U);
  EXPECT_EQ(received.front(), "DiscoveryStarting");
  EXPECT_THAT(received[1], ::testing::HasSubstr("n: 1"));
  EXPECT_THAT(received[3], ::testing::HasSubstr("ns::Tests.Other"));
  EXPECT_EQ(received.back(), "DiscoveryComplete");
}

TEST_F(TheoryDiscovererTest, RunAppliesFilter) {
  AddRunTheory().AddDataSource<data::InlineDataAttribute>(
      std::vector<Value>{1, "a"});
  catalog_.AddTheory(reflect::TestMethod(&tests_, "Other"));

  TheoryDiscoverer discoverer(catalog_, {});
  std::set<std::string> methods;
  int count = discoverer.Run(
      [&methods](const messages::Message& message) {
        if (const auto* test_case =
                dynamic_cast<const messages::TestCaseDiscovered*>(&message)) {
          methods.insert(*test_case->TestMethodName());
        }
      },
      [](const Theory& theory) { return theory.method.Name() == "Other"; });

  EXPECT_EQ(count, 1);
  EXPECT_EQ(methods, std::set<std::string>{"Other"});
}

}  // namespace
}  // namespace rowan::discovery
