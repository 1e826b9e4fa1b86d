#pragma once

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "stax/common/diagnostic.hpp"
#include "stax/core/params.hpp"
#include "stax/core/primitive.hpp"
#include "stax/core/value.hpp"
#include "stax/core/wrapped_fun.hpp"

namespace stax::trace {
class TraceContext;
}  // namespace stax::trace

namespace stax::core {

// Receives the finalizers collected while a wrapped function ran. Filled
// exactly once, read exactly once.
class TodoStore {
 public:
  void Store(std::vector<Todo> todos);
  [[nodiscard]] auto Take() -> std::vector<Todo>;

  [[nodiscard]] auto Filled() const -> bool {
    return todos_.has_value();
  }

 private:
  std::optional<std::vector<Todo>> todos_;
};

struct EnvTraceProcessing {
  WrappedFun fun;
  std::shared_ptr<TodoStore> todos;
};

// Wraps fun so that, after it runs, any output owned by a trace above
// `level` is raised onto that trace and passed through its
// PostProcessCall, highest level first. The finalizers land in `todos`.
auto ProcessEnvTraces(
    WrappedFun fun, const Primitive& primitive, int level, Params params)
    -> EnvTraceProcessing;

// Applies finalizers last-collected first, fully lowering after each.
auto ApplyTodos(trace::TraceContext& ctx, std::vector<Todo> todos, Values outs)
    -> Result<Values>;

// Dispatch for call-style primitives whose leading operand is fun.
auto CallBind(
    const Primitive& primitive, trace::TraceContext& ctx, WrappedFun fun,
    Values args, const Params& params) -> Result<Values>;

// Evaluation rule of call-style primitives: runs the sub-computation.
auto CallImpl(
    trace::TraceContext& ctx, std::span<const WrappedFun> subfuns,
    std::span<const Value> args, const Params& params) -> Result<Values>;

// A multi-result primitive dispatched through CallBind and evaluated with
// CallImpl.
auto MakeCallPrimitive(std::string name) -> Primitive;

// The built-in `call` primitive.
auto CallPrimitive() -> const Primitive&;

// The built-in `id` primitive: returns its operand untouched, without
// consulting any trace.
auto IdentityPrimitive() -> const Primitive&;

// CallPrimitive().Bind with fun as the sub-computation.
auto Call(
    trace::TraceContext& ctx, WrappedFun fun, Values args,
    const Params& params = {}) -> Result<Values>;

}  // namespace stax::core
