#include "stax/trace/lifting.hpp"

#include <expected>
#include <memory>
#include <span>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/trace/trace_context.hpp"
#include "stax/trace/tracer.hpp"

namespace stax::trace {

auto CheckOperands(const TraceContext& ctx, std::span<const core::Value> args)
    -> Result<void> {
  for (const auto& arg : args) {
    if (const auto* tracer = core::GetTracer(arg)) {
      if (*tracer == nullptr) {
        return std::unexpected(Diagnostic::Dispatch("null tracer operand"));
      }
      if ((*tracer)->GetTrace()->Master()->Context() != &ctx) {
        return std::unexpected(
            Diagnostic::Dispatch(
                fmt::format(
                    "{} belongs to a different execution context",
                    (*tracer)->ToString())));
      }
      continue;
    }
    const auto& value = std::get<core::Concrete>(arg);
    if (!ctx.types().IsValid(value)) {
      return std::unexpected(
          Diagnostic::Dispatch(
              fmt::format(
                  "{} of type {} is not a valid value for this system",
                  value.ToString(), value.Type().name())));
    }
  }
  return {};
}

auto FindTopTrace(const TraceContext& ctx, std::span<const core::Value> args)
    -> std::shared_ptr<Trace> {
  const Trace* top = nullptr;
  for (const auto& arg : args) {
    const auto* tracer = core::GetTracer(arg);
    if (tracer == nullptr) continue;
    const Trace* trace = (*tracer)->GetTrace().get();
    if (top == nullptr || trace->level() > top->level()) {
      top = trace;
    }
  }
  if (top == nullptr) {
    return nullptr;
  }
  return top->Master()->NewTrace(ctx.CurSublevel());
}

}  // namespace stax::trace
