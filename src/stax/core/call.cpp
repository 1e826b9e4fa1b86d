#include "stax/core/call.hpp"

#include <expected>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/common/internal_error.hpp"
#include "stax/common/logger.hpp"
#include "stax/trace/lifting.hpp"
#include "stax/trace/trace.hpp"
#include "stax/trace/trace_context.hpp"
#include "stax/trace/tracer.hpp"

namespace stax::core {

namespace {

// The highest-level tracer among outs whose level exceeds `level`.
auto HighestEscapedTracer(const Values& outs, int level) -> const TracerPtr* {
  const TracerPtr* best = nullptr;
  for (const auto& out : outs) {
    const auto* tracer = GetTracer(out);
    if (tracer == nullptr) continue;
    int out_level = (*tracer)->GetTrace()->level();
    if (out_level <= level) continue;
    if (best == nullptr || out_level > (*best)->GetTrace()->level()) {
      best = tracer;
    }
  }
  return best;
}

auto LowerAll(Values outs) -> Values {
  for (auto& out : outs) {
    out = FullLower(out);
  }
  return outs;
}

}  // namespace

void TodoStore::Store(std::vector<Todo> todos) {
  if (todos_.has_value()) {
    common::ThrowInternalError("TodoStore", "finalizers stored twice");
  }
  todos_ = std::move(todos);
}

auto TodoStore::Take() -> std::vector<Todo> {
  if (!todos_.has_value()) {
    common::ThrowInternalError(
        "TodoStore", "finalizers read before the wrapped function ran");
  }
  auto todos = std::move(*todos_);
  todos_.reset();
  return todos;
}

auto ProcessEnvTraces(
    WrappedFun fun, const Primitive& primitive, int level, Params params)
    -> EnvTraceProcessing {
  auto store = std::make_shared<TodoStore>();
  auto wrapped = fun.Then(
      [store, primitive = &primitive, level, params = std::move(params)](
          trace::TraceContext& ctx, Values outs) -> Result<Values> {
        for (const auto& out : outs) {
          const auto* tracer = GetTracer(out);
          if (tracer == nullptr) continue;
          if ((*tracer)->GetTrace()->Master()->Context() != &ctx) {
            return std::unexpected(
                Diagnostic::Dispatch(
                    fmt::format(
                        "'{}' returned {} from a different execution context",
                        primitive->name(), (*tracer)->ToString())));
          }
        }
        std::vector<Todo> todos;
        while (const TracerPtr* escaped = HighestEscapedTracer(outs, level)) {
          auto trace =
              (*escaped)->GetTrace()->Master()->NewTrace(ctx.CurSublevel());
          ctx.logger().Log(
              common::kLogDispatch, "call", "reconcile '{}' outputs on {}",
              primitive->name(), trace->ToString());
          Values raised;
          raised.reserve(outs.size());
          for (const auto& out : outs) {
            auto tracer = trace->FullRaise(out);
            if (!tracer) return std::unexpected(std::move(tracer.error()));
            raised.emplace_back(std::move(*tracer));
          }
          auto processed =
              trace->PostProcessCall(ctx, *primitive, raised, params);
          if (!processed) return std::unexpected(std::move(processed.error()));
          outs = std::move(processed->outs);
          todos.push_back(std::move(processed->todo));
        }
        store->Store(std::move(todos));
        return outs;
      });
  return EnvTraceProcessing{.fun = std::move(wrapped), .todos = store};
}

auto ApplyTodos(trace::TraceContext& ctx, std::vector<Todo> todos, Values outs)
    -> Result<Values> {
  while (!todos.empty()) {
    Todo todo = std::move(todos.back());
    todos.pop_back();
    auto finalized = todo(ctx, std::move(outs));
    if (!finalized) return std::unexpected(std::move(finalized.error()));
    outs = LowerAll(std::move(*finalized));
  }
  return outs;
}

auto CallBind(
    const Primitive& primitive, trace::TraceContext& ctx, WrappedFun fun,
    Values args, const Params& params) -> Result<Values> {
  auto checked = trace::CheckOperands(ctx, args);
  if (!checked) return std::unexpected(std::move(checked.error()));

  auto top_trace = trace::FindTopTrace(ctx, args);
  int level = top_trace == nullptr ? ctx.stack().NextLevel(true)
                                   : top_trace->level();
  auto env = ProcessEnvTraces(std::move(fun), primitive, level, params);

  Values outs;
  if (top_trace == nullptr) {
    auto sublevel = ctx.NewSublevel();
    auto result = primitive.Impl(ctx, {&env.fun, 1}, args, params);
    if (!result) return std::unexpected(std::move(result.error()));
    outs = std::move(*result);
    auto exited = sublevel.Exit();
    if (!exited) return std::unexpected(std::move(exited.error()));
  } else {
    std::vector<TracerPtr> tracers;
    tracers.reserve(args.size());
    for (const auto& arg : args) {
      auto raised = top_trace->FullRaise(arg);
      if (!raised) return std::unexpected(std::move(raised.error()));
      tracers.push_back(std::move(*raised));
    }
    auto result =
        top_trace->ProcessCall(ctx, primitive, env.fun, tracers, params);
    if (!result) return std::unexpected(std::move(result.error()));
    outs = LowerAll(std::move(*result));
  }
  return ApplyTodos(ctx, env.todos->Take(), std::move(outs));
}

auto CallImpl(
    trace::TraceContext& ctx, std::span<const WrappedFun> subfuns,
    std::span<const Value> args, const Params&) -> Result<Values> {
  if (subfuns.size() != 1) {
    return std::unexpected(
        Diagnostic::Dispatch(
            fmt::format(
                "call expects exactly one sub-computation, got {}",
                subfuns.size())));
  }
  return subfuns.front().CallWrapped(ctx, args);
}

auto MakeCallPrimitive(std::string name) -> Primitive {
  Primitive primitive(std::move(name), /*multiple_results=*/true);
  primitive.DefImpl(CallImpl);
  primitive.DefCustomBind(
      [](const Primitive& self, trace::TraceContext& ctx,
         std::vector<WrappedFun> subfuns, Values args,
         const Params& params) -> Result<Values> {
        if (subfuns.size() != 1) {
          return std::unexpected(
              Diagnostic::Dispatch(
                  fmt::format(
                      "'{}' expects exactly one sub-computation, got {}",
                      self.name(), subfuns.size())));
        }
        return CallBind(
            self, ctx, std::move(subfuns.front()), std::move(args), params);
      });
  return primitive;
}

auto CallPrimitive() -> const Primitive& {
  static const Primitive kCall = MakeCallPrimitive("call");
  return kCall;
}

auto IdentityPrimitive() -> const Primitive& {
  static const Primitive kIdentity = [] {
    Primitive primitive("id");
    auto identity = [](std::span<const Value> args) -> Result<Values> {
      if (args.size() != 1) {
        return std::unexpected(
            Diagnostic::Dispatch(
                fmt::format("id expects one operand, got {}", args.size())));
      }
      return Values{args.front()};
    };
    primitive.DefImpl(
        [identity](
            trace::TraceContext&, std::span<const WrappedFun>,
            std::span<const Value> args,
            const Params&) -> Result<Values> { return identity(args); });
    primitive.DefCustomBind(
        [identity](
            const Primitive&, trace::TraceContext&, std::vector<WrappedFun>,
            Values args, const Params&) -> Result<Values> {
          return identity(args);
        });
    return primitive;
  }();
  return kIdentity;
}

auto Call(
    trace::TraceContext& ctx, WrappedFun fun, Values args,
    const Params& params) -> Result<Values> {
  std::vector<WrappedFun> subfuns;
  subfuns.push_back(std::move(fun));
  return CallPrimitive().Bind(ctx, std::move(subfuns), std::move(args), params);
}

}  // namespace stax::core
