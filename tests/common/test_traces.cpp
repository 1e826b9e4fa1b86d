#include "common/test_traces.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "stax/common/internal_error.hpp"
#include "stax/trace/trace_context.hpp"

namespace stax::test {

namespace {

auto WrapAll(RecordingTrace& trace, core::Values values) -> core::Values {
  core::Values wrapped;
  wrapped.reserve(values.size());
  for (auto& value : values) {
    wrapped.emplace_back(trace.Wrap(std::move(value)));
  }
  return wrapped;
}

auto AsRecordingTrace(const std::shared_ptr<trace::Trace>& trace)
    -> RecordingTrace& {
  auto* recording = dynamic_cast<RecordingTrace*>(trace.get());
  if (recording == nullptr) {
    common::ThrowInternalError(
        "AsRecordingTrace", fmt::format("{} is foreign", trace->ToString()));
  }
  return *recording;
}

}  // namespace

auto TraceEvents() -> std::vector<std::string>& {
  static std::vector<std::string> events;
  return events;
}

auto InnerOf(const core::TracerPtr& tracer) -> const core::Value& {
  const auto* recording = dynamic_cast<const RecordingTracer*>(tracer.get());
  if (recording == nullptr) {
    common::ThrowInternalError(
        "InnerOf", fmt::format("{} is foreign", tracer->ToString()));
  }
  return recording->inner();
}

auto RecordingTracer::Aval() const -> core::AbstractValue {
  if (const auto* tracer = core::GetTracer(inner_)) {
    return (*tracer)->Aval();
  }
  const auto& value = std::get<core::Concrete>(inner_);
  if (value.Is<core::Unit>()) {
    return core::AbstractUnit{};
  }
  if (value.Is<bool>()) {
    return core::AbstractScalar{.dtype = core::DType::kBool};
  }
  if (value.Is<int64_t>()) {
    return core::AbstractScalar{.dtype = core::DType::kInt64};
  }
  return core::AbstractScalar{.dtype = core::DType::kFloat64};
}

auto TaggingTracer::FullLower() -> core::Value {
  return core::FullLower(inner());
}

void RecordingTrace::Record(std::string_view event, std::string_view what)
    const {
  TraceEvents().push_back(
      fmt::format("{}@{} {} {}", Master()->TraceName(), level(), event, what));
}

auto RecordingTrace::Wrap(core::Value inner) -> core::TracerPtr {
  return std::make_shared<RecordingTracer>(shared_from_this(), std::move(inner));
}

auto RecordingTrace::Pure(const core::Concrete& val)
    -> Result<core::TracerPtr> {
  Record("pure", val.ToString());
  return Wrap(val);
}

auto RecordingTrace::Lift(const core::TracerPtr& tracer)
    -> Result<core::TracerPtr> {
  Record("lift", tracer->GetTrace()->ToString());
  return Wrap(tracer);
}

auto RecordingTrace::Sublift(const core::TracerPtr& tracer)
    -> Result<core::TracerPtr> {
  Record("sublift", tracer->GetTrace()->ToString());
  return Wrap(InnerOf(tracer));
}

auto RecordingTrace::ProcessPrimitive(
    trace::TraceContext& ctx, const core::Primitive& primitive,
    std::span<const core::TracerPtr> tracers, const core::Params& params)
    -> Result<core::Values> {
  Record("process_primitive", primitive.name());
  core::Values inners;
  inners.reserve(tracers.size());
  for (const auto& tracer : tracers) {
    inners.push_back(InnerOf(tracer));
  }
  auto outs = primitive.Bind(ctx, std::move(inners), params);
  if (!outs) return std::unexpected(std::move(outs.error()));
  return WrapAll(*this, std::move(*outs));
}

auto RecordingTrace::ProcessCall(
    trace::TraceContext& ctx, const core::Primitive& primitive,
    const core::WrappedFun& fun, std::span<const core::TracerPtr> tracers,
    const core::Params& params) -> Result<core::Values> {
  Record("process_call", primitive.name());
  core::Values inners;
  inners.reserve(tracers.size());
  for (const auto& tracer : tracers) {
    inners.push_back(InnerOf(tracer));
  }

  core::WrappedFun subtrace(
      fun.name(),
      [master = Master(), fun](
          trace::TraceContext& call_ctx,
          std::span<const core::Value> args) -> Result<core::Values> {
        auto trace = master->NewTrace(call_ctx.CurSublevel());
        auto& recording = AsRecordingTrace(trace);
        auto outs = fun.CallWrapped(
            call_ctx, WrapAll(recording, core::Values(args.begin(), args.end())));
        if (!outs) return std::unexpected(std::move(outs.error()));
        core::Values unwrapped;
        unwrapped.reserve(outs->size());
        for (const auto& out : *outs) {
          auto raised = trace->FullRaise(out);
          if (!raised) return std::unexpected(std::move(raised.error()));
          unwrapped.push_back(InnerOf(*raised));
        }
        return unwrapped;
      });

  std::vector<core::WrappedFun> subfuns;
  subfuns.push_back(std::move(subtrace));
  auto outs =
      primitive.Bind(ctx, std::move(subfuns), std::move(inners), params);
  if (!outs) return std::unexpected(std::move(outs.error()));
  return WrapAll(*this, std::move(*outs));
}

auto TaggingTrace::Wrap(core::Value inner) -> core::TracerPtr {
  return std::make_shared<TaggingTracer>(shared_from_this(), std::move(inner));
}

auto PostProcessTrace::PostProcessCall(
    trace::TraceContext&, const core::Primitive& primitive,
    std::span<const core::Value> outs, const core::Params&)
    -> Result<trace::PostProcessedCall> {
  Record("post_process_call", primitive.name());
  core::Values inners;
  inners.reserve(outs.size());
  for (const auto& out : outs) {
    inners.push_back(InnerOf(*core::GetTracer(out)));
  }
  auto todo = [master = Master()](
                  trace::TraceContext& ctx,
                  core::Values values) -> Result<core::Values> {
    auto trace = master->NewTrace(ctx.CurSublevel());
    return WrapAll(AsRecordingTrace(trace), std::move(values));
  };
  return trace::PostProcessedCall{.outs = std::move(inners), .todo = todo};
}

}  // namespace stax::test
