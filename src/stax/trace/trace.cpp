#include "stax/trace/trace.hpp"

#include <expected>
#include <memory>
#include <span>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/common/internal_error.hpp"
#include "stax/core/primitive.hpp"
#include "stax/trace/tracer.hpp"

namespace stax::trace {

auto MasterTrace::NewTrace(Sublevel sublevel) -> std::shared_ptr<Trace> {
  return factory_(shared_from_this(), std::move(sublevel));
}

auto MasterTrace::ToString() const -> std::string {
  return fmt::format("MasterTrace({},{})", level_, trace_name_);
}

Trace::Trace(std::shared_ptr<MasterTrace> master, Sublevel sublevel)
    : master_(std::move(master)), sublevel_(std::move(sublevel)) {
  if (master_ == nullptr) {
    common::ThrowInternalError("Trace", "trace constructed without a master");
  }
}

auto Trace::FullRaise(const core::Value& val) -> Result<core::TracerPtr> {
  const auto* tracer = core::GetTracer(val);
  if (tracer == nullptr) {
    return Pure(std::get<core::Concrete>(val));
  }
  const Trace& other = *(*tracer)->GetTrace();

  if (other.Master() == master_) {
    if (other.sublevel() == sublevel_) {
      return *tracer;
    }
    if (other.sublevel() < sublevel_) {
      return Sublift(*tracer);
    }
    return std::unexpected(
        Diagnostic::Lifting(
            fmt::format(
                "Can't lift sublevels {} to {}", other.sublevel().value(),
                sublevel_.value())));
  }

  if (other.level() < level()) {
    if (other.sublevel() > sublevel_) {
      return std::unexpected(
          Diagnostic::Lifting(
              fmt::format(
                  "Incompatible sublevel: {}, ({}, {})", other.ToString(),
                  level(), sublevel_.value())));
    }
    return Lift(*tracer);
  }

  if (other.level() > level()) {
    return std::unexpected(
        Diagnostic::Lifting(
            fmt::format(
                "Can't lift {} to {}", (*tracer)->ToString(), ToString())));
  }

  return std::unexpected(
      Diagnostic::Lifting(
          fmt::format(
              "Different traces at same level: {}, {}", (*tracer)->ToString(),
              ToString())));
}

auto Trace::PostProcessCall(
    TraceContext&, const core::Primitive& primitive,
    std::span<const core::Value>, const core::Params&)
    -> Result<PostProcessedCall> {
  return std::unexpected(
      Diagnostic::Unimplemented(
          fmt::format(
              "{} does not implement post-processing for call '{}'",
              ToString(), primitive.name())));
}

auto Trace::ToString() const -> std::string {
  return fmt::format(
      "{}(level={}/{})", master_->TraceName(), level(), sublevel_.value());
}

Tracer::Tracer(std::shared_ptr<Trace> trace) : trace_(std::move(trace)) {
  if (trace_ == nullptr) {
    common::ThrowInternalError("Tracer", "tracer constructed without a trace");
  }
}

auto Tracer::FullLower() -> core::Value {
  return core::TracerPtr(shared_from_this());
}

auto Tracer::ToString() const -> std::string {
  return fmt::format(
      "Traced<{}>with<{}>", core::ToString(Aval()), trace_->ToString());
}

}  // namespace stax::trace
