#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "stax/core/concrete.hpp"

namespace stax::trace {
class Tracer;
}  // namespace stax::trace

namespace stax::core {

using TracerPtr = std::shared_ptr<trace::Tracer>;

// Anything that can flow through a primitive: a concrete value or a tracer
// owned by some active trace.
using Value = std::variant<Concrete, TracerPtr>;

using Values = std::vector<Value>;

[[nodiscard]] inline auto IsTracer(const Value& value) -> bool {
  return std::holds_alternative<TracerPtr>(value);
}

[[nodiscard]] inline auto GetTracer(const Value& value) -> const TracerPtr* {
  return std::get_if<TracerPtr>(&value);
}

[[nodiscard]] inline auto GetConcrete(const Value& value) -> const Concrete* {
  return std::get_if<Concrete>(&value);
}

// Drops tracer wrappers that carry no information; concrete values are
// returned unchanged. Idempotent.
auto FullLower(const Value& value) -> Value;

auto ToString(const Value& value) -> std::string;

}  // namespace stax::core
