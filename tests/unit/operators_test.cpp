#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>

#include "common/kernels.hpp"
#include "common/test_traces.hpp"
#include "stax/common/diagnostic.hpp"
#include "stax/common/internal_error.hpp"
#include "stax/core/abstract_value.hpp"
#include "stax/core/concrete.hpp"
#include "stax/core/operators.hpp"
#include "stax/core/type_registry.hpp"
#include "stax/core/value.hpp"
#include "stax/trace/trace_context.hpp"
#include "stax/trace/tracer.hpp"

namespace stax::core {
namespace {

using test::AsInt;
using test::InnerOf;
using test::Int;
using test::TraceEvents;

class OperatorsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TraceEvents().clear();
  }

  static auto Processed(const std::string& name) -> bool {
    const auto& events = TraceEvents();
    return std::any_of(events.begin(), events.end(), [&](const auto& e) {
      return e.find("process_primitive " + name) != std::string::npos;
    });
  }

  trace::TraceContext ctx_{test::ScalarRegistry()};
};

// =============================================================================
// Concrete operands
// =============================================================================

TEST_F(OperatorsTest, ConcreteOperandsUseRegisteredPrimitive) {
  auto sum = Add(ctx_, Int(2), Int(3));
  ASSERT_TRUE(sum.has_value()) << sum.error().Render();
  EXPECT_EQ(AsInt(*sum), 5);

  auto product = Mul(ctx_, Int(4), Int(5));
  ASSERT_TRUE(product.has_value()) << product.error().Render();
  EXPECT_EQ(AsInt(*product), 20);

  auto negated = Neg(ctx_, Int(4));
  ASSERT_TRUE(negated.has_value()) << negated.error().Render();
  EXPECT_EQ(AsInt(*negated), -4);
}

TEST_F(OperatorsTest, OperatorWithoutPrimitiveIsUnimplemented) {
  auto diff = Sub(ctx_, Int(1), Int(2));
  ASSERT_FALSE(diff.has_value());
  EXPECT_EQ(diff.error().kind, ErrorKind::kUnimplementedRule);
  EXPECT_EQ(diff.error().message, "no primitive registered for operator sub");
}

TEST_F(OperatorsTest, ConcreteUnitHasNoArithmetic) {
  auto negated = Neg(ctx_, Value(Concrete::Of(kUnit)));
  ASSERT_FALSE(negated.has_value());
  EXPECT_EQ(negated.error().kind, ErrorKind::kUnimplementedRule);
  EXPECT_EQ(
      negated.error().message, "AbstractUnit does not support operator neg");
}

TEST_F(OperatorsTest, OperandCountMustMatchArity) {
  auto r = ApplyOperator(ctx_, Operator::kNeg, Values{Int(1), Int(2)});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::kDispatch);
  EXPECT_EQ(r.error().message, "operator neg expects 1 operands, got 2");
}

// =============================================================================
// Tracer operands
// =============================================================================

TEST_F(OperatorsTest, TracerOnEitherSideGoesThroughItsTrace) {
  auto scope = ctx_.NewMaster<test::RecordingTrace>();
  auto x = scope.NewTrace()->Pure(Concrete::Of<int64_t>(2));
  ASSERT_TRUE(x.has_value());
  EXPECT_TRUE((*x)->SupportedOperators().Contains(Operator::kAdd));
  TraceEvents().clear();

  auto sum = Add(ctx_, Int(3), *x);
  ASSERT_TRUE(sum.has_value()) << sum.error().Render();
  const auto* tracer = GetTracer(*sum);
  ASSERT_NE(tracer, nullptr);
  EXPECT_EQ((*tracer)->GetTrace()->Master(), scope.Master());
  EXPECT_EQ(AsInt(InnerOf(*tracer)), 5);
  EXPECT_TRUE(Processed("add"));
}

TEST_F(OperatorsTest, UnitTracerRejectsOperatorBeforeDispatch) {
  auto scope = ctx_.NewMaster<test::RecordingTrace>();
  auto unit = scope.NewTrace()->Pure(Concrete::Of(kUnit));
  ASSERT_TRUE(unit.has_value());
  EXPECT_FALSE((*unit)->SupportedOperators().Contains(Operator::kMul));
  TraceEvents().clear();

  // The tracer decides even when it is the second operand.
  auto product = Mul(ctx_, Int(2), *unit);
  ASSERT_FALSE(product.has_value());
  EXPECT_EQ(product.error().kind, ErrorKind::kUnimplementedRule);
  EXPECT_EQ(
      product.error().message, "AbstractUnit does not support operator mul");
  EXPECT_FALSE(Processed("mul"));
}

TEST_F(OperatorsTest, TracerFromAnotherContextIsRejected) {
  trace::TraceContext other(test::ScalarRegistry());
  auto scope = other.NewMaster<test::RecordingTrace>();
  auto x = scope.NewTrace()->Pure(Concrete::Of<int64_t>(2));
  ASSERT_TRUE(x.has_value());

  auto sum = Add(ctx_, *x, Int(1));
  ASSERT_FALSE(sum.has_value());
  EXPECT_EQ(sum.error().kind, ErrorKind::kDispatch);
}

// =============================================================================
// Registration
// =============================================================================

TEST_F(OperatorsTest, MultiResultPrimitiveCannotBackOperator) {
  TypeRegistry registry;
  EXPECT_THROW(
      registry.DefOperator(Operator::kDiv, test::DivmodPrimitive()),
      common::InternalError);
  EXPECT_EQ(registry.OperatorPrimitive(Operator::kDiv), nullptr);
}

TEST_F(OperatorsTest, RegistryReportsBackingPrimitive) {
  EXPECT_EQ(
      test::ScalarRegistry().OperatorPrimitive(Operator::kAdd),
      &test::AddPrimitive());
  EXPECT_EQ(test::ScalarRegistry().OperatorPrimitive(Operator::kLt), nullptr);
}

}  // namespace
}  // namespace stax::core
