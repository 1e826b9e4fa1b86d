#pragma once

#include <functional>
#include <span>
#include <string>
#include <vector>

#include "stax/common/diagnostic.hpp"
#include "stax/core/abstract_value.hpp"
#include "stax/core/concrete.hpp"
#include "stax/core/params.hpp"
#include "stax/core/value.hpp"
#include "stax/core/wrapped_fun.hpp"

namespace stax::trace {
class TraceContext;
}  // namespace stax::trace

namespace stax::core {

// A named operation with pluggable evaluation rules. Rules are filled in
// during registration; afterwards a primitive is shared read-only.
//
// Every rule returns a sequence of outputs. Single-result primitives must
// produce exactly one.
class Primitive {
 public:
  // General evaluation rule. Receives concrete operands only, plus any
  // sub-computations for call-style primitives.
  using ImplRule = std::function<Result<Values>(
      trace::TraceContext& ctx, std::span<const WrappedFun> subfuns,
      std::span<const Value> args, const Params& params)>;

  // Kernel-provider form of ImplRule: concrete operands to concrete results.
  using KernelRule = std::function<Result<std::vector<Concrete>>(
      std::span<const Concrete> args, const Params& params)>;

  using AbstractEvalRule = std::function<Result<std::vector<AbstractValue>>(
      std::span<const AbstractValue> avals, const Params& params)>;

  // Replaces the default dispatch entirely.
  using BindRule = std::function<Result<Values>(
      const Primitive& self, trace::TraceContext& ctx,
      std::vector<WrappedFun> subfuns, Values args, const Params& params)>;

  explicit Primitive(std::string name, bool multiple_results = false);

  Primitive(const Primitive&) = delete;
  auto operator=(const Primitive&) -> Primitive& = delete;
  Primitive(Primitive&&) = default;
  auto operator=(Primitive&&) -> Primitive& = default;
  ~Primitive() = default;

  [[nodiscard]] auto name() const -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto MultipleResults() const -> bool {
    return multiple_results_;
  }
  [[nodiscard]] auto HasImpl() const -> bool {
    return static_cast<bool>(impl_);
  }
  [[nodiscard]] auto HasAbstractEval() const -> bool {
    return static_cast<bool>(abstract_eval_);
  }
  [[nodiscard]] auto HasCustomBind() const -> bool {
    return static_cast<bool>(custom_bind_);
  }

  void DefImpl(ImplRule rule);
  void DefKernel(KernelRule rule);
  void DefAbstractEval(AbstractEvalRule rule);
  void DefCustomBind(BindRule rule);

  // Dispatches through the topmost trace among the operands, or evaluates
  // directly when no operand is a tracer. Outputs are fully lowered.
  auto Bind(trace::TraceContext& ctx, Values args, const Params& params = {})
      const -> Result<Values>;
  auto Bind(
      trace::TraceContext& ctx, std::vector<WrappedFun> subfuns, Values args,
      const Params& params) const -> Result<Values>;

  // Runs the evaluation rule; kUnimplementedRule when none is registered.
  auto Impl(
      trace::TraceContext& ctx, std::span<const WrappedFun> subfuns,
      std::span<const Value> args, const Params& params) const
      -> Result<Values>;

  // Runs the abstract evaluation rule; kUnimplementedRule when none is
  // registered.
  auto AbstractEval(
      std::span<const AbstractValue> avals, const Params& params) const
      -> Result<std::vector<AbstractValue>>;

  // Throws InternalError when a rule returned the wrong number of outputs
  // for a single-result primitive.
  void CheckOutputCount(size_t count) const;

 private:
  auto DefaultBind(
      trace::TraceContext& ctx, std::span<const WrappedFun> subfuns,
      std::span<const Value> args, const Params& params) const
      -> Result<Values>;

  std::string name_;
  bool multiple_results_;
  ImplRule impl_;
  AbstractEvalRule abstract_eval_;
  BindRule custom_bind_;
};

}  // namespace stax::core
