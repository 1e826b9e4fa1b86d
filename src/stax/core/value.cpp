#include "stax/core/value.hpp"

#include <string>

#include "stax/trace/tracer.hpp"

namespace stax::core {

auto FullLower(const Value& value) -> Value {
  if (const auto* tracer = GetTracer(value)) {
    return (*tracer)->FullLower();
  }
  return value;
}

auto ToString(const Value& value) -> std::string {
  if (const auto* tracer = GetTracer(value)) {
    return (*tracer)->ToString();
  }
  return std::get<Concrete>(value).ToString();
}

}  // namespace stax::core
