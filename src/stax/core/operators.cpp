#include "stax/core/operators.hpp"

#include <expected>
#include <utility>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/common/logger.hpp"
#include "stax/core/primitive.hpp"
#include "stax/trace/lifting.hpp"
#include "stax/trace/trace_context.hpp"

namespace stax::core {

namespace {

// The operand whose abstract value decides whether an operator applies.
auto Subject(const Values& operands) -> const Value& {
  for (const auto& operand : operands) {
    if (IsTracer(operand)) return operand;
  }
  return operands.front();
}

auto Binary(
    trace::TraceContext& ctx, Operator op, const Value& x, const Value& y)
    -> Result<Value> {
  return ApplyOperator(ctx, op, Values{x, y});
}

}  // namespace

auto ApplyOperator(trace::TraceContext& ctx, Operator op, Values operands)
    -> Result<Value> {
  if (operands.size() != Arity(op)) {
    return std::unexpected(
        Diagnostic::Dispatch(
            fmt::format(
                "operator {} expects {} operands, got {}", ToString(op),
                Arity(op), operands.size())));
  }
  auto checked = trace::CheckOperands(ctx, operands);
  if (!checked) return std::unexpected(std::move(checked.error()));

  auto aval = ctx.types().GetAval(Subject(operands));
  if (!aval) return std::unexpected(std::move(aval.error()));
  if (!SupportedOperators(*aval).Contains(op)) {
    return std::unexpected(
        Diagnostic::Unimplemented(
            fmt::format(
                "{} does not support operator {}", ToString(*aval),
                ToString(op))));
  }

  const Primitive* primitive = ctx.types().OperatorPrimitive(op);
  if (primitive == nullptr) {
    return std::unexpected(
        Diagnostic::Unimplemented(
            fmt::format("no primitive registered for operator {}", ToString(op))));
  }
  ctx.logger().Log(
      common::kLogDispatch, "operator", "{} via '{}'", ToString(op),
      primitive->name());

  auto outs = primitive->Bind(ctx, std::move(operands));
  if (!outs) return std::unexpected(std::move(outs.error()));
  primitive->CheckOutputCount(outs->size());
  return std::move(outs->front());
}

auto Neg(trace::TraceContext& ctx, const Value& x) -> Result<Value> {
  return ApplyOperator(ctx, Operator::kNeg, Values{x});
}

auto Add(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value> {
  return Binary(ctx, Operator::kAdd, x, y);
}

auto Sub(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value> {
  return Binary(ctx, Operator::kSub, x, y);
}

auto Mul(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value> {
  return Binary(ctx, Operator::kMul, x, y);
}

auto Div(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value> {
  return Binary(ctx, Operator::kDiv, x, y);
}

auto Eq(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value> {
  return Binary(ctx, Operator::kEq, x, y);
}

auto Lt(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value> {
  return Binary(ctx, Operator::kLt, x, y);
}

}  // namespace stax::core
