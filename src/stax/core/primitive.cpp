#include "stax/core/primitive.hpp"

#include <expected>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/common/internal_error.hpp"
#include "stax/trace/lifting.hpp"
#include "stax/trace/trace.hpp"
#include "stax/trace/trace_context.hpp"

namespace stax::core {

Primitive::Primitive(std::string name, bool multiple_results)
    : name_(std::move(name)), multiple_results_(multiple_results) {
}

void Primitive::DefImpl(ImplRule rule) {
  impl_ = std::move(rule);
}

void Primitive::DefKernel(KernelRule rule) {
  impl_ = [name = name_, kernel = std::move(rule)](
              trace::TraceContext&, std::span<const WrappedFun> subfuns,
              std::span<const Value> args,
              const Params& params) -> Result<Values> {
    if (!subfuns.empty()) {
      return std::unexpected(
          Diagnostic::Dispatch(
              fmt::format(
                  "kernel for '{}' does not accept sub-computations", name)));
    }
    std::vector<Concrete> concrete;
    concrete.reserve(args.size());
    for (const auto& arg : args) {
      const auto* value = GetConcrete(arg);
      if (value == nullptr) {
        common::ThrowInternalError(
            "Primitive::DefKernel",
            fmt::format("kernel for '{}' received a tracer", name));
      }
      concrete.push_back(*value);
    }
    auto outs = kernel(concrete, params);
    if (!outs) return std::unexpected(std::move(outs.error()));
    Values result;
    result.reserve(outs->size());
    for (auto& out : *outs) {
      result.emplace_back(std::move(out));
    }
    return result;
  };
}

void Primitive::DefAbstractEval(AbstractEvalRule rule) {
  abstract_eval_ = std::move(rule);
}

void Primitive::DefCustomBind(BindRule rule) {
  custom_bind_ = std::move(rule);
}

auto Primitive::Bind(
    trace::TraceContext& ctx, Values args, const Params& params) const
    -> Result<Values> {
  return Bind(ctx, {}, std::move(args), params);
}

auto Primitive::Bind(
    trace::TraceContext& ctx, std::vector<WrappedFun> subfuns, Values args,
    const Params& params) const -> Result<Values> {
  if (custom_bind_) {
    return custom_bind_(*this, ctx, std::move(subfuns), std::move(args), params);
  }
  return DefaultBind(ctx, subfuns, args, params);
}

auto Primitive::DefaultBind(
    trace::TraceContext& ctx, std::span<const WrappedFun> subfuns,
    std::span<const Value> args, const Params& params) const
    -> Result<Values> {
  if (!subfuns.empty()) {
    return std::unexpected(
        Diagnostic::Dispatch(
            fmt::format(
                "primitive '{}' takes no sub-computations; register a custom "
                "bind rule for call-style primitives",
                name_)));
  }
  auto checked = trace::CheckOperands(ctx, args);
  if (!checked) return std::unexpected(std::move(checked.error()));

  auto top_trace = trace::FindTopTrace(ctx, args);
  if (top_trace == nullptr) {
    auto outs = Impl(ctx, {}, args, params);
    if (!outs) return std::unexpected(std::move(outs.error()));
    CheckOutputCount(outs->size());
    return outs;
  }

  std::vector<TracerPtr> tracers;
  tracers.reserve(args.size());
  for (const auto& arg : args) {
    auto raised = top_trace->FullRaise(arg);
    if (!raised) return std::unexpected(std::move(raised.error()));
    tracers.push_back(std::move(*raised));
  }

  auto outs = top_trace->ProcessPrimitive(ctx, *this, tracers, params);
  if (!outs) return std::unexpected(std::move(outs.error()));
  CheckOutputCount(outs->size());
  Values lowered;
  lowered.reserve(outs->size());
  for (const auto& out : *outs) {
    lowered.push_back(FullLower(out));
  }
  return lowered;
}

auto Primitive::Impl(
    trace::TraceContext& ctx, std::span<const WrappedFun> subfuns,
    std::span<const Value> args, const Params& params) const
    -> Result<Values> {
  if (!impl_) {
    return std::unexpected(
        Diagnostic::Unimplemented(
            fmt::format("Evaluation rule for '{}' not implemented", name_)));
  }
  return impl_(ctx, subfuns, args, params);
}

auto Primitive::AbstractEval(
    std::span<const AbstractValue> avals, const Params& params) const
    -> Result<std::vector<AbstractValue>> {
  if (!abstract_eval_) {
    return std::unexpected(
        Diagnostic::Unimplemented(
            fmt::format("Abstract evaluation for '{}' not implemented", name_)));
  }
  auto outs = abstract_eval_(avals, params);
  if (!outs) return std::unexpected(std::move(outs.error()));
  CheckOutputCount(outs->size());
  return outs;
}

void Primitive::CheckOutputCount(size_t count) const {
  if (!multiple_results_ && count != 1) {
    common::ThrowInternalError(
        "Primitive",
        fmt::format(
            "single-result primitive '{}' produced {} outputs", name_, count));
  }
}

}  // namespace stax::core
