#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>

#include "stax/common/diagnostic.hpp"
#include "stax/core/concrete.hpp"

namespace stax::core {

enum class DType : uint8_t {
  kBool,
  kInt64,
  kFloat64,
};

auto ToString(DType dtype) -> const char*;

// Operators a value can take part in. Each one is carried out by the
// primitive registered for it in the TypeRegistry (see ApplyOperator).
enum class Operator : uint8_t {
  kNeg,
  kAdd,
  kSub,
  kMul,
  kDiv,
  kEq,
  kLt,
};

auto ToString(Operator op) -> const char*;

// Number of operands op takes.
auto Arity(Operator op) -> size_t;

class OperatorSet {
 public:
  constexpr OperatorSet() = default;
  constexpr OperatorSet(std::initializer_list<Operator> ops) {
    for (Operator op : ops) {
      bits_ |= Bit(op);
    }
  }

  [[nodiscard]] constexpr auto Contains(Operator op) const -> bool {
    return (bits_ & Bit(op)) != 0;
  }

 private:
  static constexpr auto Bit(Operator op) -> uint32_t {
    return uint32_t{1} << static_cast<uint32_t>(op);
  }

  uint32_t bits_ = 0;
};

inline constexpr OperatorSet kScalarOperators{
    Operator::kNeg, Operator::kAdd, Operator::kSub, Operator::kMul,
    Operator::kDiv, Operator::kEq,  Operator::kLt,
};

// Bottom of the lattice: carries no information.
struct Bot {
  static constexpr OperatorSet kOperators{};

  auto operator==(const Bot&) const -> bool = default;
  [[nodiscard]] auto ToString() const -> std::string {
    return "Bot";
  }
};

// Abstraction of the unit value.
struct AbstractUnit {
  static constexpr OperatorSet kOperators{};

  auto operator==(const AbstractUnit&) const -> bool = default;
  [[nodiscard]] auto ToString() const -> std::string {
    return "AbstractUnit";
  }
};

// A scalar whose dtype is known but whose value is not.
struct AbstractScalar {
  static constexpr OperatorSet kOperators = kScalarOperators;

  DType dtype;

  auto operator==(const AbstractScalar&) const -> bool = default;
  [[nodiscard]] auto ToString() const -> std::string;
};

// A scalar whose value is known at trace time.
struct ConcreteScalar {
  static constexpr OperatorSet kOperators = kScalarOperators;

  DType dtype;
  ScalarPayload value;

  auto operator==(const ConcreteScalar&) const -> bool = default;
  [[nodiscard]] auto ToString() const -> std::string;
};

// Capabilities every lattice member provides, including the fixed set of
// operators values it describes support.
template <typename A>
concept AbstractValueMember =
    std::equality_comparable<A> && requires(const A& aval) {
      { aval.ToString() } -> std::convertible_to<std::string>;
      { A::kOperators } -> std::convertible_to<OperatorSet>;
    };

using AbstractValue =
    std::variant<Bot, AbstractUnit, AbstractScalar, ConcreteScalar>;

static_assert(AbstractValueMember<Bot>);
static_assert(AbstractValueMember<AbstractUnit>);
static_assert(AbstractValueMember<AbstractScalar>);
static_assert(AbstractValueMember<ConcreteScalar>);

auto ToString(const AbstractValue& aval) -> std::string;

auto SupportedOperators(const AbstractValue& aval) -> OperatorSet;

// Least upper bound. Commutative; Bot is the identity. Descriptions of
// incompatible values fail with kTypeMismatch.
auto Join(const AbstractValue& x, const AbstractValue& y)
    -> Result<AbstractValue>;

// Join where an absent operand is the identity.
auto LatticeJoin(
    const std::optional<AbstractValue>& x,
    const std::optional<AbstractValue>& y)
    -> Result<std::optional<AbstractValue>>;

// The abstraction of the tangent space of values described by aval.
auto AtLeastVspace(const AbstractValue& aval) -> Result<AbstractValue>;

// Dtype of a scalar payload.
auto DTypeOf(const ScalarPayload& value) -> DType;

}  // namespace stax::core
