#pragma once

#include "stax/common/diagnostic.hpp"
#include "stax/core/abstract_value.hpp"
#include "stax/core/value.hpp"

namespace stax::trace {
class TraceContext;
}  // namespace stax::trace

namespace stax::core {

// Binds the primitive registered for op to the operands. The first tracer
// operand, or the first operand when none is a tracer, must support op
// through its abstract value; otherwise kUnimplementedRule. An operator
// with no registered primitive is kUnimplementedRule as well.
auto ApplyOperator(trace::TraceContext& ctx, Operator op, Values operands)
    -> Result<Value>;

auto Neg(trace::TraceContext& ctx, const Value& x) -> Result<Value>;
auto Add(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value>;
auto Sub(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value>;
auto Mul(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value>;
auto Div(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value>;
auto Eq(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value>;
auto Lt(trace::TraceContext& ctx, const Value& x, const Value& y)
    -> Result<Value>;

}  // namespace stax::core
