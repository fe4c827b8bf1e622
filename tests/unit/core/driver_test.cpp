#include <recchain/core/chain.hpp>
#include <recchain/core/driver.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/input.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/sink.hpp>
#include "test_stages.hpp"
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace rc = recchain::core;
namespace rt = recchain::testing;

class DriverTest : public ::testing::Test {
 protected:
  rc::Result<void> run(const rc::PipelineSpec& spec, const rc::Input& input) {
    auto chain = rc::compile_chain(spec, catalog, bridge, context, sink);
    if (!chain) return std::unexpected(chain.error());
    return rc::drive(*chain, input, context);
  }

  rt::StageLog log;
  rc::StageCatalog catalog = rt::make_recording_catalog(log);
  rc::HostFunctionRegistry registry;
  rc::HostFunctionBridge bridge{registry};
  rc::RunContext context{registry};
  rc::RecordSink sink;
};

TEST_F(DriverTest, StreamStopsReadingOnStopSignal) {
  std::istringstream in("{\"i\":1}\n{\"i\":2}\n{\"i\":3}\n{\"i\":4}\n{\"i\":5}\n");
  const auto spec = rc::PipelineSpec::empty().call("stopper", {"2"});
  ASSERT_TRUE(run(spec, rc::Input::from_stream(in, "numbers")).has_value());

  EXPECT_EQ(log.count("stopper:finish"), 1u);
  EXPECT_EQ(sink.records().size(), 2u);
  std::size_t line_calls = 0;
  for (const auto& e : log.events) {
    if (e.starts_with("stopper:line:")) ++line_calls;
  }
  EXPECT_EQ(line_calls, 2u);

  std::string rest;
  std::vector<std::string> unread;
  while (std::getline(in, rest)) unread.push_back(rest);
  EXPECT_EQ(unread.size(), 3u);
}

TEST_F(DriverTest, StreamStripsTerminatorsAndTracksSource) {
  std::istringstream in("{\"a\":1}\r\n{\"a\":2}");
  const auto spec = rc::PipelineSpec::empty().call("a");
  ASSERT_TRUE(run(spec, rc::Input::from_stream(in, "data.jsonl")).has_value());
  EXPECT_EQ(log.events[0], R"(a:line:{"a":1})");
  EXPECT_EQ(log.events[1], R"(a:line:{"a":2})");
  EXPECT_EQ(context.current_source(), "data.jsonl");
  EXPECT_EQ(context.current_line(), 2u);
  EXPECT_EQ(context.location(), "data.jsonl:2: ");
}

TEST(StreamLabel, StdinAndSynthesized) {
  EXPECT_EQ(rc::stream_label(std::cin, "ignored"), "stdin");
  std::istringstream in;
  EXPECT_EQ(rc::stream_label(in, "file.txt"), "file.txt");
  EXPECT_TRUE(rc::stream_label(in, "").starts_with("stream@"));
}

TEST_F(DriverTest, LinesStopEarlyToo) {
  const auto spec = rc::PipelineSpec::empty().call("stopper", {"1"});
  ASSERT_TRUE(run(spec, rc::Input::from_lines({R"({"n":1})", R"({"n":2})"})).has_value());
  EXPECT_EQ(sink.records().size(), 1u);
  EXPECT_EQ(log.count("stopper:finish"), 1u);
}

TEST_F(DriverTest, RecordsPushedAsRecords) {
  const auto spec = rc::PipelineSpec::empty().call("a");
  ASSERT_TRUE(run(spec, rc::Input::from_records(
      {rc::Json::object({{"x", 1}}), rc::Json::object({{"x", 2}})})).has_value());
  EXPECT_EQ(log.events, (std::vector<std::string>{
                            R"(a:record:{"x":1})", R"(a:record:{"x":2})", "a:finish"}));
}

TEST_F(DriverTest, NonObjectRecordIsUnsupportedInput) {
  const auto spec = rc::PipelineSpec::empty().call("a");
  auto r = run(spec, rc::Input::from_records({rc::Json::object({{"x", 1}}), rc::Json(42)}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, rc::PipelineError::UnsupportedInput);
  EXPECT_NE(r.error().message.find("42"), std::string::npos);
  EXPECT_TRUE(log.events.empty());
}

TEST_F(DriverTest, MissingInputNamesTheStage) {
  const auto spec = rc::PipelineSpec::empty().call("filter").call("b");
  auto r = run(spec, rc::Input::none());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, rc::PipelineError::InputRequired);
  EXPECT_NE(r.error().message.find("filter"), std::string::npos);
  EXPECT_EQ(log.count("filter:finish"), 0u);
}

TEST_F(DriverTest, SelfGeneratingHeadIgnoresInput) {
  const auto spec = rc::PipelineSpec::empty().call("source").call("b");
  ASSERT_TRUE(run(spec, rc::Input::from_lines({"never fed"})).has_value());
  EXPECT_EQ(log.events, (std::vector<std::string>{
                            "source:finish", R"(b:record:{"generated":"source"})",
                            "b:finish"}));
}

TEST_F(DriverTest, SelfGeneratingHeadNeedsNoInput) {
  const auto spec = rc::PipelineSpec::empty().call("source");
  ASSERT_TRUE(run(spec, rc::Input::none()).has_value());
  ASSERT_EQ(sink.records().size(), 1u);
}

TEST_F(DriverTest, FinishRunsOnceForEmptyInput) {
  const auto spec = rc::PipelineSpec::empty().call("a").call("b");
  ASSERT_TRUE(run(spec, rc::Input::from_lines({})).has_value());
  EXPECT_EQ(log.events, (std::vector<std::string>{"a:finish", "b:finish"}));
}

TEST_F(DriverTest, StageErrorAbortsWithoutFinish) {
  const auto spec = rc::PipelineSpec::empty().call("a");
  auto r = run(spec, rc::Input::from_lines({R"({"ok":1})", "not json", R"({"ok":2})"}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, rc::PipelineError::InvalidRecord);
  EXPECT_EQ(log.count("a:finish"), 0u);
  EXPECT_EQ(sink.records().size(), 1u);
}
