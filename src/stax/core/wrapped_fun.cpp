#include "stax/core/wrapped_fun.hpp"

#include <expected>
#include <span>
#include <utility>

namespace stax::core {

auto WrappedFun::Then(Transform transform) const -> WrappedFun {
  return WrappedFun(
      name_, [body = body_, transform = std::move(transform)](
                 trace::TraceContext& ctx,
                 std::span<const Value> args) -> Result<Values> {
        auto outs = body(ctx, args);
        if (!outs) return std::unexpected(std::move(outs.error()));
        return transform(ctx, std::move(*outs));
      });
}

}  // namespace stax::core
