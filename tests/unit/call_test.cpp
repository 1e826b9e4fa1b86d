#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include "common/kernels.hpp"
#include "common/test_traces.hpp"
#include "stax/common/diagnostic.hpp"
#include "stax/config/core_config.hpp"
#include "stax/core/call.hpp"
#include "stax/core/concrete.hpp"
#include "stax/core/value.hpp"
#include "stax/core/wrapped_fun.hpp"
#include "stax/trace/trace_context.hpp"

namespace stax::core {
namespace {

using test::AsInt;
using test::InnerOf;
using test::Int;
using test::TraceEvents;

class CallTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TraceEvents().clear();
  }

  static auto Negate() -> WrappedFun {
    return WrappedFun(
        "negate",
        [](trace::TraceContext& ctx,
           std::span<const Value> args) -> Result<Values> {
          return test::NegPrimitive().Bind(ctx, Values{args[0]});
        });
  }

  // Multiplies its argument by a value captured from the enclosing scope.
  static auto ScaleBy(Value factor) -> WrappedFun {
    return WrappedFun(
        "scale",
        [factor](trace::TraceContext& ctx,
                 std::span<const Value> args) -> Result<Values> {
          return test::MulPrimitive().Bind(ctx, Values{factor, args[0]});
        });
  }

  static auto Occurs(const std::string& event) -> bool {
    const auto& events = TraceEvents();
    return std::find(events.begin(), events.end(), event) != events.end();
  }

  trace::TraceContext ctx_{
      test::ScalarRegistry(), config::CoreConfig{.check_leaks = true}};
};

TEST_F(CallTest, ConcreteArgumentsRunTheFunction) {
  auto outs = Call(ctx_, Negate(), {Int(2)});
  ASSERT_TRUE(outs.has_value()) << outs.error().Render();
  ASSERT_EQ(outs->size(), 1U);
  EXPECT_EQ(AsInt((*outs)[0]), -2);
  EXPECT_EQ(ctx_.SublevelDepth(), 1U);
}

TEST_F(CallTest, CallReturnsEveryOutput) {
  WrappedFun split(
      "split",
      [](trace::TraceContext& ctx,
         std::span<const Value> args) -> Result<Values> {
        return test::DivmodPrimitive().Bind(ctx, Values(args.begin(), args.end()));
      });
  auto outs = Call(ctx_, split, {Int(7), Int(2)});
  ASSERT_TRUE(outs.has_value()) << outs.error().Render();
  ASSERT_EQ(outs->size(), 2U);
  EXPECT_EQ(AsInt((*outs)[0]), 3);
  EXPECT_EQ(AsInt((*outs)[1]), 1);
}

TEST_F(CallTest, TracedArgumentGoesThroughProcessCall) {
  auto scope = ctx_.NewMaster<test::RecordingTrace>();
  auto x = scope.NewTrace()->Pure(Concrete::Of<int64_t>(2));
  ASSERT_TRUE(x.has_value());
  TraceEvents().clear();

  auto outs = Call(ctx_, Negate(), {*x});
  ASSERT_TRUE(outs.has_value()) << outs.error().Render();
  const auto* result = GetTracer((*outs)[0]);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ((*result)->GetTrace()->Master(), scope.Master());
  EXPECT_EQ(AsInt(InnerOf(*result)), -2);
  EXPECT_EQ(
      TraceEvents(), (std::vector<std::string>{
                         "Recording@0 process_call call",
                         "Recording@0 process_primitive neg",
                     }));
  EXPECT_EQ(ctx_.SublevelDepth(), 1U);
}

TEST_F(CallTest, EscapedTracerIsPostProcessed) {
  auto scope = ctx_.NewMaster<test::PostProcessTrace>();
  auto x = scope.NewTrace()->Pure(Concrete::Of<int64_t>(6));
  ASSERT_TRUE(x.has_value());
  TraceEvents().clear();

  auto outs = Call(ctx_, ScaleBy(*x), {Int(7)});
  ASSERT_TRUE(outs.has_value()) << outs.error().Render();
  const auto* result = GetTracer((*outs)[0]);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ((*result)->GetTrace()->Master(), scope.Master());
  EXPECT_EQ((*result)->GetTrace()->sublevel().value(), 0);
  EXPECT_EQ(AsInt(InnerOf(*result)), 42);
  EXPECT_TRUE(Occurs("PostProcess@0 sublift PostProcess(level=0/0)"));
  EXPECT_TRUE(Occurs("PostProcess@0 post_process_call call"));
}

TEST_F(CallTest, EscapedTracerWithoutPostProcessingFails) {
  auto scope = ctx_.NewMaster<test::RecordingTrace>();
  auto x = scope.NewTrace()->Pure(Concrete::Of<int64_t>(6));
  ASSERT_TRUE(x.has_value());

  auto outs = Call(ctx_, ScaleBy(*x), {Int(7)});
  ASSERT_FALSE(outs.has_value());
  EXPECT_EQ(outs.error().kind, ErrorKind::kUnimplementedRule);
  EXPECT_EQ(ctx_.SublevelDepth(), 1U);
}

TEST_F(CallTest, CallNeedsExactlyOneFunction) {
  std::vector<WrappedFun> subfuns{Negate(), Negate()};
  auto outs = CallPrimitive().Bind(ctx_, std::move(subfuns), {Int(1)}, {});
  ASSERT_FALSE(outs.has_value());
  EXPECT_EQ(outs.error().kind, ErrorKind::kDispatch);
}

TEST_F(CallTest, CustomCallPrimitive) {
  Primitive remat = MakeCallPrimitive("remat");
  EXPECT_EQ(remat.name(), "remat");
  EXPECT_TRUE(remat.MultipleResults());
  EXPECT_TRUE(remat.HasImpl());
  EXPECT_TRUE(remat.HasCustomBind());

  std::vector<WrappedFun> subfuns{Negate()};
  auto outs = remat.Bind(ctx_, std::move(subfuns), {Int(5)}, {});
  ASSERT_TRUE(outs.has_value()) << outs.error().Render();
  EXPECT_EQ(AsInt((*outs)[0]), -5);
}

TEST_F(CallTest, ThenFeedsOutputsForward) {
  WrappedFun twice = Negate().Then(
      [](trace::TraceContext& ctx, Values outs) -> Result<Values> {
        return test::NegPrimitive().Bind(ctx, std::move(outs));
      });
  auto outs = twice.CallWrapped(ctx_, Values{Int(9)});
  ASSERT_TRUE(outs.has_value()) << outs.error().Render();
  EXPECT_EQ(AsInt((*outs)[0]), 9);
  EXPECT_EQ(twice.name(), "negate");
}

// ============================================================================
// Several escaped traces
// ============================================================================

TEST_F(CallTest, NestedEscapesAreReconciledHighestFirst) {
  auto outer = ctx_.NewMaster<test::PostProcessTrace>();
  auto inner = ctx_.NewMaster<test::PostProcessTrace>();
  auto x = outer.NewTrace()->Pure(Concrete::Of<int64_t>(6));
  ASSERT_TRUE(x.has_value());
  auto factor = inner.NewTrace()->FullRaise(*x);
  ASSERT_TRUE(factor.has_value());
  TraceEvents().clear();

  auto outs = Call(ctx_, ScaleBy(*factor), {Int(7)});
  ASSERT_TRUE(outs.has_value()) << outs.error().Render();

  std::vector<std::string> post_processed;
  std::copy_if(
      TraceEvents().begin(), TraceEvents().end(),
      std::back_inserter(post_processed), [](const std::string& event) {
        return event.find("post_process_call") != std::string::npos;
      });
  EXPECT_EQ(
      post_processed, (std::vector<std::string>{
                          "PostProcess@1 post_process_call call",
                          "PostProcess@0 post_process_call call",
                      }));

  // The lowest finalizer runs first, so the result nests the same way the
  // captured value did.
  const auto& top = *GetTracer((*outs)[0]);
  EXPECT_EQ(top->GetTrace()->Master(), inner.Master());
  EXPECT_EQ(top->GetTrace()->sublevel().value(), 0);
  const auto* below = GetTracer(InnerOf(top));
  ASSERT_NE(below, nullptr);
  EXPECT_EQ((*below)->GetTrace()->Master(), outer.Master());
  EXPECT_EQ((*below)->GetTrace()->sublevel().value(), 0);
  EXPECT_EQ(AsInt(InnerOf(*below)), 42);
  EXPECT_EQ(ctx_.SublevelDepth(), 1U);
}

TEST_F(CallTest, OutputFromAnotherContextIsRejected) {
  trace::TraceContext other(test::ScalarRegistry());
  auto scope = other.NewMaster<test::PostProcessTrace>();
  auto foreign = scope.NewTrace()->Pure(Concrete::Of<int64_t>(1));
  ASSERT_TRUE(foreign.has_value());
  TracerPtr smuggled = *foreign;
  WrappedFun smuggle(
      "smuggle",
      [smuggled](trace::TraceContext&, std::span<const Value>)
          -> Result<Values> { return Values{smuggled}; });
  TraceEvents().clear();

  auto outs = Call(ctx_, smuggle, {Int(1)});
  ASSERT_FALSE(outs.has_value());
  EXPECT_EQ(outs.error().kind, ErrorKind::kDispatch);
  EXPECT_NE(
      outs.error().message.find("different execution context"),
      std::string::npos);
  EXPECT_FALSE(Occurs("PostProcess@0 post_process_call call"));
  EXPECT_EQ(ctx_.SublevelDepth(), 1U);
}

}  // namespace
}  // namespace stax::core
