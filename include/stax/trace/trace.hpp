#pragma once

#include <memory>
#include <span>
#include <string>

#include "stax/common/diagnostic.hpp"
#include "stax/core/concrete.hpp"
#include "stax/core/params.hpp"
#include "stax/core/value.hpp"
#include "stax/core/wrapped_fun.hpp"
#include "stax/trace/master_trace.hpp"
#include "stax/trace/sublevel.hpp"

namespace stax::core {
class Primitive;
}  // namespace stax::core

namespace stax::trace {

class TraceContext;

// Outputs of a call after one trace reconciled them, plus the finalizer
// that restores them once the call has returned.
struct PostProcessedCall {
  core::Values outs;
  core::Todo todo;
};

// An interpreter for one transformation at a (level, sublevel) position.
// Subclasses define how values enter the trace and how primitives run
// under it, and must declare `static constexpr std::string_view kName`.
class Trace : public std::enable_shared_from_this<Trace> {
 public:
  Trace(std::shared_ptr<MasterTrace> master, Sublevel sublevel);
  virtual ~Trace() = default;

  Trace(const Trace&) = delete;
  auto operator=(const Trace&) -> Trace& = delete;

  [[nodiscard]] auto Master() const -> const std::shared_ptr<MasterTrace>& {
    return master_;
  }
  [[nodiscard]] auto level() const -> int {
    return master_->level();
  }
  [[nodiscard]] auto sublevel() const -> const Sublevel& {
    return sublevel_;
  }

  // Reconciles val onto this trace: wraps concrete values with Pure, lifts
  // tracers from lower levels, sublifts tracers from older sublevels of the
  // same master. Everything else is a kLifting error.
  auto FullRaise(const core::Value& val) -> Result<core::TracerPtr>;

  // Wraps a concrete value.
  virtual auto Pure(const core::Concrete& val) -> Result<core::TracerPtr> = 0;
  // Adopts a tracer from a lower level.
  virtual auto Lift(const core::TracerPtr& tracer)
      -> Result<core::TracerPtr> = 0;
  // Adopts a tracer of the same master at an older sublevel.
  virtual auto Sublift(const core::TracerPtr& tracer)
      -> Result<core::TracerPtr> = 0;

  virtual auto ProcessPrimitive(
      TraceContext& ctx, const core::Primitive& primitive,
      std::span<const core::TracerPtr> tracers, const core::Params& params)
      -> Result<core::Values> = 0;

  virtual auto ProcessCall(
      TraceContext& ctx, const core::Primitive& primitive,
      const core::WrappedFun& fun, std::span<const core::TracerPtr> tracers,
      const core::Params& params) -> Result<core::Values> = 0;

  // Reconciles call outputs that escaped to this trace from inside the
  // callee. Not every transformation supports it.
  virtual auto PostProcessCall(
      TraceContext& ctx, const core::Primitive& primitive,
      std::span<const core::Value> outs, const core::Params& params)
      -> Result<PostProcessedCall>;

  // "Name(level=L/S)"
  [[nodiscard]] auto ToString() const -> std::string;

 private:
  std::shared_ptr<MasterTrace> master_;
  Sublevel sublevel_;
};

}  // namespace stax::trace
