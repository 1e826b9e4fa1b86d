#pragma once

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>

#include "stax/trace/sublevel.hpp"

namespace stax::trace {

class Trace;
class TraceContext;

// One activation of a transformation on a context's trace stack. Its level
// is fixed at creation. Every Trace instance created for it shares it.
class MasterTrace : public std::enable_shared_from_this<MasterTrace> {
 public:
  using TraceFactory = std::function<std::shared_ptr<Trace>(
      std::shared_ptr<MasterTrace> master, Sublevel sublevel)>;

  MasterTrace(
      const TraceContext* context, int level, std::type_index trace_type,
      std::string trace_name, TraceFactory factory)
      : context_(context),
        level_(level),
        trace_type_(trace_type),
        trace_name_(std::move(trace_name)),
        factory_(std::move(factory)) {
  }

  MasterTrace(const MasterTrace&) = delete;
  auto operator=(const MasterTrace&) -> MasterTrace& = delete;

  [[nodiscard]] auto level() const -> int {
    return level_;
  }
  [[nodiscard]] auto TraceType() const -> std::type_index {
    return trace_type_;
  }
  [[nodiscard]] auto TraceName() const -> const std::string& {
    return trace_name_;
  }
  // The context whose stack this master was pushed on. Used for identity
  // comparison only.
  [[nodiscard]] auto Context() const -> const TraceContext* {
    return context_;
  }

  // A fresh trace of this master's transformation at the given sublevel.
  auto NewTrace(Sublevel sublevel) -> std::shared_ptr<Trace>;

  [[nodiscard]] auto ToString() const -> std::string;

  // Same level and same transformation type.
  auto operator==(const MasterTrace& other) const -> bool {
    return level_ == other.level_ && trace_type_ == other.trace_type_;
  }

  template <typename H>
  friend auto AbslHashValue(H h, const MasterTrace& master) -> H {
    return H::combine(std::move(h), master.level_, master.trace_type_);
  }

 private:
  const TraceContext* context_;
  int level_;
  std::type_index trace_type_;
  std::string trace_name_;
  TraceFactory factory_;
};

}  // namespace stax::trace
