#include <recchain/core/chain.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/pipeline_spec.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/sink.hpp>
#include "test_stages.hpp"
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

namespace rc = recchain::core;
namespace rt = recchain::testing;

class ChainTest : public ::testing::Test {
 protected:
  rt::StageLog log;
  rc::StageCatalog catalog = rt::make_recording_catalog(log);
  rc::HostFunctionRegistry registry;
  rc::HostFunctionBridge bridge{registry};
  rc::RunContext context{registry};
  rc::RecordSink sink;
};

TEST_F(ChainTest, EmptySpecCompilesToSink) {
  auto chain = rc::compile_chain(rc::PipelineSpec::empty(), catalog, bridge, context, sink);
  ASSERT_TRUE(chain.has_value());
  EXPECT_EQ(chain->head(), nullptr);
  EXPECT_EQ(chain->stage_count(), 0u);
  EXPECT_EQ(&chain->entry(), &sink);
  EXPECT_EQ(&chain->output_sink(), &sink);
}

TEST_F(ChainTest, NodesLinkedInCallOrder) {
  const auto spec = rc::PipelineSpec::empty().call("a").call("b").call("c");
  auto chain = rc::compile_chain(spec, catalog, bridge, context, sink);
  ASSERT_TRUE(chain.has_value());
  EXPECT_EQ(chain->stage_count(), 3u);

  std::vector<std::string> names;
  for (const rc::ChainNode* node = chain->head(); node; node = node->next_node()) {
    names.push_back(node->name());
    EXPECT_EQ(node->index(), names.size() - 1);
  }
  EXPECT_EQ(names, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(ChainTest, PushFlowsHeadToSink) {
  const auto spec = rc::PipelineSpec::empty().call("a").call("b");
  auto chain = rc::compile_chain(spec, catalog, bridge, context, sink);
  ASSERT_TRUE(chain.has_value());

  ASSERT_TRUE(chain->entry().accept_line(R"({"x":1})").value());
  ASSERT_TRUE(chain->entry().finish().has_value());

  EXPECT_EQ(log.events, (std::vector<std::string>{
                            R"(a:line:{"x":1})", R"(b:line:{"x":1})", "a:finish", "b:finish"}));
  ASSERT_EQ(sink.records().size(), 1u);
}

TEST_F(ChainTest, UnknownStageFailsAtCompileTime) {
  const auto spec = rc::PipelineSpec::empty().call("a").call("nope");
  auto chain = rc::compile_chain(spec, catalog, bridge, context, sink);
  ASSERT_FALSE(chain.has_value());
  EXPECT_EQ(chain.error().code, rc::PipelineError::UnknownStage);
  EXPECT_NE(chain.error().message.find("nope"), std::string::npos);
}

TEST_F(ChainTest, HostFunctionArgsAreBridgedBeforeFactory) {
  auto fn = rc::make_host_function([](const rc::Record&) { return rc::Json(true); });
  const auto spec = rc::PipelineSpec::empty().call("filter", {fn}).call("b", {fn});
  auto chain = rc::compile_chain(spec, catalog, bridge, context, sink);
  ASSERT_TRUE(chain.has_value());
  ASSERT_EQ(log.args["filter"].size(), 1u);
  EXPECT_EQ(log.args["filter"][0], "@call hf1");
  EXPECT_EQ(log.args["b"], log.args["filter"]);
  EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ChainTest, TraceCallbackSeesEveryForward) {
  std::vector<std::pair<std::size_t, rc::TraceEvent>> seen;
  rc::StageTraceCallback trace = [&](std::size_t index, std::string_view, rc::TraceEvent e) {
    seen.emplace_back(index, e);
  };
  const auto spec = rc::PipelineSpec::empty().call("a").call("b");
  auto chain = rc::compile_chain(spec, catalog, bridge, context, sink, &trace);
  ASSERT_TRUE(chain.has_value());

  rc::Record r;
  r.set("x", 1);
  ASSERT_TRUE(chain->entry().accept_record(r).value());
  ASSERT_TRUE(chain->entry().finish().has_value());

  using E = rc::TraceEvent;
  const std::vector<std::pair<std::size_t, E>> expected{
      {0, E::Record}, {1, E::Record}, {0, E::Finish}, {1, E::Finish}};
  EXPECT_EQ(seen, expected);
}
