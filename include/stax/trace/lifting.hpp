#pragma once

#include <memory>
#include <span>

#include "stax/common/diagnostic.hpp"
#include "stax/core/value.hpp"
#include "stax/trace/trace.hpp"

namespace stax::trace {

class TraceContext;

// Every operand must be a tracer created under ctx or a concrete value of a
// registered type; otherwise kDispatch.
auto CheckOperands(const TraceContext& ctx, std::span<const core::Value> args)
    -> Result<void>;

// A new trace for the highest-level master among the tracer operands, at
// the context's current sublevel. The first operand wins ties. nullptr when
// no operand is a tracer.
auto FindTopTrace(const TraceContext& ctx, std::span<const core::Value> args)
    -> std::shared_ptr<Trace>;

}  // namespace stax::trace
