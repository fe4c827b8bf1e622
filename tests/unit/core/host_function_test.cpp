#include <recchain/core/host_function.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/snippet.hpp>
#include <gtest/gtest.h>
#include <string>

namespace rc = recchain::core;

namespace {

rc::HostFunctionHandle double_x() {
  return rc::make_host_function(
      [](const rc::Record& r) {
        const auto* x = r.get("x");
        return x ? rc::Json(x->get<int>() * 2) : rc::Json{};
      },
      "x * 2");
}

}  // namespace

TEST(HostFunctionRegistry, SameClosureSameToken) {
  rc::HostFunctionRegistry registry;
  auto fn = double_x();
  auto t1 = registry.register_function(fn);
  auto t2 = registry.register_function(fn);
  ASSERT_TRUE(t1.has_value());
  ASSERT_TRUE(t2.has_value());
  EXPECT_EQ(*t1, *t2);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(HostFunctionRegistry, DistinctClosuresDistinctTokens) {
  rc::HostFunctionRegistry registry;
  auto t1 = registry.register_function(double_x());
  auto t2 = registry.register_function(double_x());
  ASSERT_TRUE(t1.has_value());
  ASSERT_TRUE(t2.has_value());
  EXPECT_NE(*t1, *t2);
  EXPECT_EQ(registry.size(), 2u);
}

TEST(HostFunctionRegistry, RejectsEmptyAndOverCapacity) {
  rc::HostFunctionRegistry registry(1);
  auto empty = registry.register_function(nullptr);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, rc::PipelineError::RegistrationFailed);

  auto fn = double_x();
  ASSERT_TRUE(registry.register_function(fn).has_value());
  EXPECT_TRUE(registry.register_function(fn).has_value());  // already known

  auto full = registry.register_function(double_x());
  ASSERT_FALSE(full.has_value());
  EXPECT_EQ(full.error().code, rc::PipelineError::RegistrationFailed);
}

TEST(HostFunctionRegistry, InvokeByToken) {
  rc::HostFunctionRegistry registry;
  auto token = registry.register_function(double_x());
  ASSERT_TRUE(token.has_value());

  rc::Record r;
  r.set("x", 21);
  auto value = registry.invoke(*token, r);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);

  auto missing = registry.invoke("hf999", r);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, rc::PipelineError::InvalidArgument);
}

TEST(HostFunctionRegistry, ThrowingClosureBecomesError) {
  rc::HostFunctionRegistry registry;
  auto token = registry.register_function(double_x());
  ASSERT_TRUE(token.has_value());

  rc::Record r;
  r.set("x", "old");
  auto value = registry.invoke(*token, r);
  ASSERT_FALSE(value.has_value());
  EXPECT_EQ(value.error().code, rc::PipelineError::HostFunctionFailed);
  EXPECT_NE(value.error().message.find("host function " + *token + " failed"),
            std::string::npos);

  rc::Record missing;
  auto null_value = registry.invoke(*token, missing);
  ASSERT_TRUE(null_value.has_value());
  EXPECT_TRUE(null_value->is_null());
}

TEST(HostFunctionBridge, EmitsCallInstructionWithComment) {
  rc::HostFunctionRegistry registry;
  rc::HostFunctionBridge bridge(registry);
  auto fn = double_x();
  auto text = bridge.bridge(fn);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "# x * 2\n@call hf1");

  auto snippet = rc::Snippet::parse(*text);
  ASSERT_TRUE(snippet.has_value());
  EXPECT_EQ(snippet->kind(), rc::Snippet::Kind::HostCall);
  EXPECT_EQ(snippet->target(), "hf1");
}

TEST(HostFunctionBridge, AnnotationIsOptional) {
  rc::HostFunctionRegistry registry;
  rc::HostFunctionBridge bridge(registry, /*annotate=*/false);
  auto text = bridge.bridge(double_x());
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "@call hf1");
}

TEST(HostFunctionBridge, SameClosureBridgedTwiceSharesToken) {
  rc::HostFunctionRegistry registry;
  rc::HostFunctionBridge bridge(registry, false);
  auto fn = double_x();
  auto args = bridge.bridge_args({std::string("-v"), fn, fn, double_x()});
  ASSERT_TRUE(args.has_value());
  ASSERT_EQ(args->size(), 4u);
  EXPECT_EQ((*args)[0], "-v");
  EXPECT_EQ((*args)[1], (*args)[2]);
  EXPECT_NE((*args)[1], (*args)[3]);
}

TEST(HostFunctionBridge, RegistrationFailurePropagates) {
  rc::HostFunctionRegistry registry;
  rc::HostFunctionBridge bridge(registry);
  auto args = bridge.bridge_args({rc::HostFunctionHandle{}});
  ASSERT_FALSE(args.has_value());
  EXPECT_EQ(args.error().code, rc::PipelineError::RegistrationFailed);
}
