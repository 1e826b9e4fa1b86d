#pragma once

#include <span>

#include "stax/common/diagnostic.hpp"
#include "stax/core/value.hpp"
#include "stax/ir/jaxpr.hpp"

namespace stax::trace {
class TraceContext;
}  // namespace stax::trace

namespace stax::ir {

// Runs a graph by binding each equation's primitive in order. Sub-programs
// are passed to their primitive as wrapped functions closed over the
// resolved bindings.
//
// Runs CheckJaxpr first when the context has enable_checks set. Fails with
// kMalformedProgram when a value count differs from its variable group or
// a read finds no binding; errors from dispatch propagate unchanged.
auto EvalJaxpr(
    trace::TraceContext& ctx, const Jaxpr& jaxpr,
    std::span<const core::Value> consts,
    std::span<const core::Value> freevar_vals,
    std::span<const core::Value> args) -> Result<core::Values>;

// Evaluates a typed graph with its own literals as constants.
auto JaxprAsFun(
    trace::TraceContext& ctx, const TypedJaxpr& typed,
    std::span<const core::Value> args) -> Result<core::Values>;

}  // namespace stax::ir
