#pragma once

#include <memory>
#include <string>

#include "stax/core/abstract_value.hpp"
#include "stax/core/value.hpp"
#include "stax/trace/trace.hpp"

namespace stax::trace {

// A value owned by exactly one trace. All static introspection goes through
// its abstract value. Tracers must be held by shared_ptr.
class Tracer : public std::enable_shared_from_this<Tracer> {
 public:
  explicit Tracer(std::shared_ptr<Trace> trace);
  virtual ~Tracer() = default;

  Tracer(const Tracer&) = delete;
  auto operator=(const Tracer&) -> Tracer& = delete;

  [[nodiscard]] auto GetTrace() const -> const std::shared_ptr<Trace>& {
    return trace_;
  }

  [[nodiscard]] virtual auto Aval() const -> core::AbstractValue = 0;

  // Operators this tracer can take part in, as declared by its aval.
  [[nodiscard]] auto SupportedOperators() const -> core::OperatorSet {
    return core::SupportedOperators(Aval());
  }

  // Strips this wrapper when it carries no information for this value.
  // The default keeps the tracer.
  [[nodiscard]] virtual auto FullLower() -> core::Value;

  // "Traced<aval>with<trace>"
  [[nodiscard]] auto ToString() const -> std::string;

 private:
  std::shared_ptr<Trace> trace_;
};

}  // namespace stax::trace
