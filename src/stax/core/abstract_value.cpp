#include "stax/core/abstract_value.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/common/overloaded.hpp"

namespace stax::core {

namespace {

auto FormatPayload(const ScalarPayload& value) -> std::string {
  return std::visit([](auto v) { return fmt::format("{}", v); }, value);
}

auto Incompatible(const AbstractValue& x, const AbstractValue& y)
    -> Diagnostic {
  return Diagnostic::TypeMismatch(
      fmt::format(
          "cannot join incompatible abstract values {} and {}", ToString(x),
          ToString(y)));
}

// Join for the scalar members, with x ordered no higher than y.
auto JoinScalars(const AbstractValue& x, const AbstractValue& y)
    -> Result<AbstractValue> {
  return std::visit(
      Overloaded{
          [&](const ConcreteScalar& a,
              const ConcreteScalar& b) -> Result<AbstractValue> {
            if (a.dtype != b.dtype) return std::unexpected(Incompatible(x, y));
            if (a.value == b.value) return a;
            return AbstractScalar{.dtype = a.dtype};
          },
          [&](const ConcreteScalar& a,
              const AbstractScalar& b) -> Result<AbstractValue> {
            if (a.dtype != b.dtype) return std::unexpected(Incompatible(x, y));
            return b;
          },
          [&](const AbstractScalar& a,
              const ConcreteScalar& b) -> Result<AbstractValue> {
            if (a.dtype != b.dtype) return std::unexpected(Incompatible(x, y));
            return a;
          },
          [&](const AbstractScalar& a,
              const AbstractScalar& b) -> Result<AbstractValue> {
            if (a.dtype != b.dtype) return std::unexpected(Incompatible(x, y));
            return a;
          },
          [&](const auto&, const auto&) -> Result<AbstractValue> {
            return std::unexpected(Incompatible(x, y));
          },
      },
      x, y);
}

}  // namespace

auto ToString(DType dtype) -> const char* {
  switch (dtype) {
    case DType::kBool:
      return "bool";
    case DType::kInt64:
      return "int64";
    case DType::kFloat64:
      return "float64";
  }
  return "?";
}

auto ToString(Operator op) -> const char* {
  switch (op) {
    case Operator::kNeg:
      return "neg";
    case Operator::kAdd:
      return "add";
    case Operator::kSub:
      return "sub";
    case Operator::kMul:
      return "mul";
    case Operator::kDiv:
      return "div";
    case Operator::kEq:
      return "eq";
    case Operator::kLt:
      return "lt";
  }
  return "?";
}

auto Arity(Operator op) -> size_t {
  return op == Operator::kNeg ? 1 : 2;
}

auto AbstractScalar::ToString() const -> std::string {
  return fmt::format("AbstractScalar(dtype={})", core::ToString(dtype));
}

auto ConcreteScalar::ToString() const -> std::string {
  return fmt::format(
      "ConcreteScalar(dtype={}, value={})", core::ToString(dtype),
      FormatPayload(value));
}

auto ToString(const AbstractValue& aval) -> std::string {
  return std::visit([](const auto& a) { return a.ToString(); }, aval);
}

auto SupportedOperators(const AbstractValue& aval) -> OperatorSet {
  return std::visit(
      [](const auto& a) -> OperatorSet {
        return std::decay_t<decltype(a)>::kOperators;
      },
      aval);
}

auto DTypeOf(const ScalarPayload& value) -> DType {
  return std::visit(
      Overloaded{
          [](bool) { return DType::kBool; },
          [](int64_t) { return DType::kInt64; },
          [](double) { return DType::kFloat64; },
      },
      value);
}

auto Join(const AbstractValue& x, const AbstractValue& y)
    -> Result<AbstractValue> {
  if (std::holds_alternative<Bot>(x)) return y;
  if (std::holds_alternative<Bot>(y)) return x;
  if (std::holds_alternative<AbstractUnit>(x) ||
      std::holds_alternative<AbstractUnit>(y)) {
    if (x == y) return x;
    return std::unexpected(Incompatible(x, y));
  }
  return JoinScalars(x, y);
}

auto LatticeJoin(
    const std::optional<AbstractValue>& x,
    const std::optional<AbstractValue>& y)
    -> Result<std::optional<AbstractValue>> {
  if (!x) return y;
  if (!y) return x;
  auto joined = Join(*x, *y);
  if (!joined) return std::unexpected(std::move(joined.error()));
  return std::optional<AbstractValue>(std::move(*joined));
}

auto AtLeastVspace(const AbstractValue& aval) -> Result<AbstractValue> {
  return std::visit(
      Overloaded{
          [](const Bot&) -> Result<AbstractValue> {
            return std::unexpected(
                Diagnostic::Unimplemented("Bot has no vector space"));
          },
          [](const AbstractUnit& u) -> Result<AbstractValue> { return u; },
          [](const AbstractScalar&) -> Result<AbstractValue> {
            return AbstractScalar{.dtype = DType::kFloat64};
          },
          [](const ConcreteScalar&) -> Result<AbstractValue> {
            return AbstractScalar{.dtype = DType::kFloat64};
          },
      },
      aval);
}

}  // namespace stax::core
