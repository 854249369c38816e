#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include "rowan/messages/message.hpp"
#include "rowan/reporters/metadata_cache.hpp"
#include "rowan/reporters/reporter_message_handler.hpp"
#include "rowan/reporters/runner_logger.hpp"
#include "tests/common/capture_logger.hpp"

namespace rowan::reporters {
namespace {

using Level = test::CaptureLogger::Level;
using Entry = test::CaptureLogger::Entry;

template <typename T>
auto MakeTestMessage(const std::string& test_id) -> T {
  T message;
  message.SetAssemblyUniqueId("assembly");
  message.SetTestCollectionUniqueId("collection");
  message.SetTestCaseUniqueId("case");
  message.SetTestUniqueId(test_id);
  return message;
}

auto Starting(const std::string& test_id, const std::string& name)
    -> messages::TestStarting {
  auto message = MakeTestMessage<messages::TestStarting>(test_id);
  message.SetTestDisplayName(name);
  return message;
}

class Unhandled : public messages::Message {
 public:
  [[nodiscard]] auto TypeName() const -> std::string_view override {
    return "Unhandled";
  }
};

class ReporterTest : public ::testing::Test {
 protected:
  test::CaptureLogger logger_;
};

// =============================================================================
// Default reporter
// =============================================================================

TEST_F(ReporterTest, DiscoveryProgress) {
  DefaultReporterMessageHandler handler(logger_);

  messages::DiscoveryStarting starting;
  starting.SetAssemblyUniqueId("assembly");
  starting.SetAssemblyName("rowan-samples");
  messages::DiscoveryComplete complete;
  complete.SetAssemblyUniqueId("assembly");
  complete.SetTestCasesToRun(3);
  messages::DiscoveryComplete single;
  single.SetAssemblyUniqueId("other");
  single.SetTestCasesToRun(1);

  EXPECT_TRUE(handler.Handle(starting));
  EXPECT_TRUE(handler.Handle(complete));
  EXPECT_TRUE(handler.Handle(single));
  EXPECT_EQ(
      logger_.Entries(),
      (std::vector<Entry>{
          {Level::kImportant, "  Discovering: rowan-samples"},
          {Level::kImportant,
           "  Discovered:  rowan-samples (3 test cases to be run)"},
          {Level::kImportant, "  Discovered:  other (1 test case to be run)"},
      }));
}

TEST_F(ReporterTest, DefaultIsQuietAboutPassingTests) {
  DefaultReporterMessageHandler handler(logger_);
  messages::TestCaseDiscovered discovered;
  discovered.SetTestCaseDisplayName("Math.Add(a: 1)");
  handler.Handle(discovered);
  handler.Handle(Starting("t1", "Math.Add(a: 1)"));
  handler.Handle(MakeTestMessage<messages::TestFinished>("t1"));

  EXPECT_TRUE(logger_.Entries().empty());
}

TEST_F(ReporterTest, SkippedTestWithMultilineReason) {
  DefaultReporterMessageHandler handler(logger_);
  handler.Handle(Starting("t1", "Math.Divide"));
  auto skipped = MakeTestMessage<messages::TestSkipped>("t1");
  skipped.SetReason("not yet\r\nsee issue");
  handler.Handle(skipped);

  EXPECT_EQ(
      logger_.Entries(), (std::vector<Entry>{
                             {Level::kWarning, "    Math.Divide [SKIP]"},
                             {Level::kWarning, "      not yet"},
                             {Level::kWarning, "      see issue"},
                         }));
}

TEST_F(ReporterTest, FailedTest) {
  DefaultReporterMessageHandler handler(logger_);
  handler.Handle(Starting("t1", "Math.Add"));
  auto failed = MakeTestMessage<messages::TestFailed>("t1");
  failed.SetExceptionType("std::runtime_error");
  failed.SetFailureMessage("expected 3");
  handler.Handle(failed);

  EXPECT_EQ(
      logger_.Entries(),
      (std::vector<Entry>{
          {Level::kError, "    Math.Add [FAIL]"},
          {Level::kError, "      std::runtime_error : expected 3"},
      }));
}

TEST_F(ReporterTest, UnknownTestName) {
  DefaultReporterMessageHandler handler(logger_);
  auto skipped = MakeTestMessage<messages::TestSkipped>("never-started");
  skipped.SetReason("gone");
  handler.Handle(skipped);

  ASSERT_FALSE(logger_.Entries().empty());
  EXPECT_EQ(logger_.Lines()[0], "    <unknown test> [SKIP]");
}

TEST_F(ReporterTest, UnknownMessageTypeIsNotHandled) {
  DefaultReporterMessageHandler handler(logger_);
  EXPECT_FALSE(handler.Handle(Unhandled{}));
  EXPECT_TRUE(logger_.Entries().empty());
}

// =============================================================================
// Verbose reporter
// =============================================================================

TEST_F(ReporterTest, VerboseTestLifecycle) {
  VerboseReporterMessageHandler handler(logger_);
  messages::TestCaseDiscovered discovered;
  discovered.SetTestCaseDisplayName("Math.Add(a: 1)");
  auto finished = MakeTestMessage<messages::TestFinished>("t1");
  finished.SetExecutionTime(1.5);

  handler.Handle(discovered);
  handler.Handle(Starting("t1", "Math.Add(a: 1)"));
  handler.Handle(finished);
  handler.Handle(Starting("t2", "Math.Sub"));
  handler.Handle(MakeTestMessage<messages::TestNotRun>("t2"));

  EXPECT_EQ(
      logger_.Lines(), (std::vector<std::string>{
                           "    Math.Add(a: 1) [DISCOVERED]",
                           "    Math.Add(a: 1) [STARTING]",
                           "    Math.Add(a: 1) [FINISHED] Time: 1.5s",
                           "    Math.Sub [STARTING]",
                           "    Math.Sub [NOT RUN]",
                       }));
}

TEST_F(ReporterTest, VerboseEvictsFinishedTests) {
  VerboseReporterMessageHandler handler(logger_);
  handler.Handle(Starting("t1", "Math.Add"));
  handler.Handle(MakeTestMessage<messages::TestFinished>("t1"));
  // A second finish for the same id no longer knows the name.
  handler.Handle(MakeTestMessage<messages::TestFinished>("t1"));

  EXPECT_EQ(logger_.Lines().back(), "    <unknown test> [FINISHED] Time: 0s");
}

TEST_F(ReporterTest, DisplayNamesAreEscaped) {
  VerboseReporterMessageHandler handler(logger_);
  handler.Handle(Starting("t1", "line\nbreak"));
  EXPECT_EQ(logger_.Lines().back(), "    line\\nbreak [STARTING]");

  EXPECT_EQ(EscapeDisplayName("a\tb\rc"), "a\\tb\\rc");
  EXPECT_EQ(EscapeDisplayName(std::string("x\0y", 3)), "x\\0y");
  EXPECT_EQ(EscapeDisplayName("\x1b[0m"), "\\x1b[0m");
  EXPECT_EQ(EscapeDisplayName("plain"), "plain");
}

// =============================================================================
// Metadata cache
// =============================================================================

TEST(MetadataCacheTest, RemoveEvicts) {
  MetadataCache cache;
  auto starting = Starting("t1", "Math.Add");
  starting.SetExplicit(true);
  cache.Set(starting);

  auto finished = MakeTestMessage<messages::TestFinished>("t1");
  auto kept = cache.TryGetTestMetadata(finished);
  ASSERT_TRUE(kept.has_value());
  EXPECT_EQ(kept->test_display_name, "Math.Add");
  EXPECT_TRUE(kept->explicit_test);
  EXPECT_EQ(cache.Size(), 1U);

  EXPECT_TRUE(cache.TryGetTestMetadata(finished, true).has_value());
  EXPECT_EQ(cache.Size(), 0U);
  EXPECT_FALSE(cache.TryGetTestMetadata(finished).has_value());
}

// =============================================================================
// Spdlog runner logger
// =============================================================================

TEST(SpdlogRunnerLoggerTest, WritesLevelsThroughSink) {
  std::ostringstream stream;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%l|%v");
  SpdlogRunnerLogger runner_logger(logger);

  runner_logger.LogMessage("plain");
  runner_logger.LogImportantMessage("important");
  runner_logger.LogWarning("careful");
  runner_logger.LogError("broken");
  logger->flush();

  EXPECT_EQ(
      stream.str(),
      "info|plain\ninfo|important\nwarning|careful\nerror|broken\n");
}

}  // namespace
}  // namespace rowan::reporters
