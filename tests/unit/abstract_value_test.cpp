#include <gtest/gtest.h>

#include <cstdint>
#include <optional>

#include "stax/common/diagnostic.hpp"
#include "stax/core/abstract_value.hpp"

namespace stax::core {
namespace {

class AbstractValueTest : public ::testing::Test {
 protected:
  static auto Int(int64_t v) -> AbstractValue {
    return ConcreteScalar{.dtype = DType::kInt64, .value = v};
  }
  static auto IntType() -> AbstractValue {
    return AbstractScalar{.dtype = DType::kInt64};
  }
};

// =============================================================================
// Join
// =============================================================================

TEST_F(AbstractValueTest, BotIsIdentity) {
  auto joined = Join(Bot{}, Int(3));
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ(*joined, Int(3));

  joined = Join(AbstractUnit{}, Bot{});
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ(*joined, AbstractValue(AbstractUnit{}));
}

TEST_F(AbstractValueTest, EqualConcreteScalarsStayConcrete) {
  auto joined = Join(Int(3), Int(3));
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ(*joined, Int(3));
}

TEST_F(AbstractValueTest, DifferentValuesWidenToDType) {
  auto joined = Join(Int(3), Int(4));
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ(*joined, IntType());

  joined = Join(IntType(), Int(4));
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ(*joined, IntType());
}

TEST_F(AbstractValueTest, IncompatibleJoinIsTypeMismatch) {
  auto joined = Join(Int(1), AbstractScalar{.dtype = DType::kFloat64});
  ASSERT_FALSE(joined.has_value());
  EXPECT_EQ(joined.error().kind, ErrorKind::kTypeMismatch);

  joined = Join(AbstractUnit{}, Int(1));
  ASSERT_FALSE(joined.has_value());
  EXPECT_EQ(joined.error().kind, ErrorKind::kTypeMismatch);
}

TEST_F(AbstractValueTest, LatticeJoinTreatsNulloptAsBottom) {
  auto joined = LatticeJoin(std::nullopt, Int(2));
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ(*joined, std::optional<AbstractValue>(Int(2)));

  joined = LatticeJoin(std::nullopt, std::nullopt);
  ASSERT_TRUE(joined.has_value());
  EXPECT_FALSE(joined->has_value());
}

// =============================================================================
// Vector space
// =============================================================================

TEST_F(AbstractValueTest, ScalarsGoToFloatSpace) {
  auto space = AtLeastVspace(Int(2));
  ASSERT_TRUE(space.has_value());
  EXPECT_EQ(*space, AbstractValue(AbstractScalar{.dtype = DType::kFloat64}));
}

TEST_F(AbstractValueTest, BotHasNoVectorSpace) {
  auto space = AtLeastVspace(Bot{});
  ASSERT_FALSE(space.has_value());
  EXPECT_EQ(space.error().kind, ErrorKind::kUnimplementedRule);
}

TEST_F(AbstractValueTest, ToString) {
  EXPECT_EQ(ToString(IntType()), "AbstractScalar(dtype=int64)");
  EXPECT_EQ(ToString(Int(5)), "ConcreteScalar(dtype=int64, value=5)");
  EXPECT_EQ(DTypeOf(ScalarPayload(2.0)), DType::kFloat64);
}

// =============================================================================
// Operator capabilities
// =============================================================================

TEST_F(AbstractValueTest, ScalarsSupportEveryOperator) {
  for (auto op :
       {Operator::kNeg, Operator::kAdd, Operator::kSub, Operator::kMul,
        Operator::kDiv, Operator::kEq, Operator::kLt}) {
    EXPECT_TRUE(SupportedOperators(Int(1)).Contains(op)) << ToString(op);
    EXPECT_TRUE(SupportedOperators(IntType()).Contains(op)) << ToString(op);
  }
}

TEST_F(AbstractValueTest, BotAndUnitSupportNoOperator) {
  EXPECT_FALSE(SupportedOperators(Bot{}).Contains(Operator::kAdd));
  EXPECT_FALSE(SupportedOperators(AbstractUnit{}).Contains(Operator::kNeg));
  EXPECT_FALSE(SupportedOperators(AbstractUnit{}).Contains(Operator::kEq));
}

TEST_F(AbstractValueTest, OperatorArity) {
  EXPECT_EQ(Arity(Operator::kNeg), 1U);
  EXPECT_EQ(Arity(Operator::kLt), 2U);
  EXPECT_STREQ(ToString(Operator::kDiv), "div");
}

}  // namespace
}  // namespace stax::core
