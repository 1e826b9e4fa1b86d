#pragma once

#include <functional>
#include <span>
#include <string>
#include <utility>

#include "stax/common/diagnostic.hpp"
#include "stax/core/value.hpp"

namespace stax::trace {
class TraceContext;
}  // namespace stax::trace

namespace stax::core {

// Deferred finalizer produced when call outputs are reconciled through a
// trace's PostProcessCall.
using Todo = std::function<Result<Values>(trace::TraceContext& ctx, Values)>;

// A suspended sub-computation passed as the leading operand of a call-style
// primitive. Bodies receive the execution context at call time.
class WrappedFun {
 public:
  using Body = std::function<Result<Values>(
      trace::TraceContext& ctx, std::span<const Value> args)>;
  using Transform =
      std::function<Result<Values>(trace::TraceContext& ctx, Values outs)>;

  WrappedFun(std::string name, Body body)
      : name_(std::move(name)), body_(std::move(body)) {
  }

  [[nodiscard]] auto name() const -> const std::string& {
    return name_;
  }

  auto CallWrapped(trace::TraceContext& ctx, std::span<const Value> args) const
      -> Result<Values> {
    return body_(ctx, args);
  }

  // A function that runs this one and then feeds its outputs to transform.
  [[nodiscard]] auto Then(Transform transform) const -> WrappedFun;

 private:
  std::string name_;
  Body body_;
};

}  // namespace stax::core
