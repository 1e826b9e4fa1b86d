#include "stax/ir/eval.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "absl/container/flat_hash_map.h"
#include "stax/common/diagnostic.hpp"
#include "stax/common/logger.hpp"
#include "stax/common/overloaded.hpp"
#include "stax/core/concrete.hpp"
#include "stax/core/primitive.hpp"
#include "stax/core/value.hpp"
#include "stax/core/wrapped_fun.hpp"
#include "stax/ir/dumper.hpp"
#include "stax/ir/handle.hpp"
#include "stax/ir/literal.hpp"
#include "stax/ir/verify.hpp"
#include "stax/trace/trace_context.hpp"

namespace stax::ir {

namespace {

class Environment {
 public:
  explicit Environment(const Jaxpr& jaxpr) : jaxpr_(jaxpr) {
    env_.insert_or_assign(kUnitVar, core::Value(core::Concrete::Of(core::kUnit)));
  }

  void Write(Var var, core::Value value) {
    env_.insert_or_assign(var, std::move(value));
  }

  auto WriteAll(
      const std::vector<Var>& vars, std::span<const core::Value> values,
      const char* what) -> Result<void> {
    if (vars.size() != values.size()) {
      return std::unexpected(
          Diagnostic::MalformedProgram(
              fmt::format(
                  "jaxpr has {} {} but {} values were supplied", vars.size(),
                  what, values.size()))
              .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr_))));
    }
    for (size_t i = 0; i < vars.size(); ++i) {
      Write(vars[i], values[i]);
    }
    return {};
  }

  auto Read(Var var) const -> Result<core::Value> {
    auto it = env_.find(var);
    if (it == env_.end()) {
      return std::unexpected(
          Diagnostic::MalformedProgram(
              fmt::format("Variable '{}' not defined", ToString(var)))
              .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr_))));
    }
    return it->second;
  }

  auto Read(const Atom& atom) const -> Result<core::Value> {
    return std::visit(
        Overloaded{
            [&](Var var) -> Result<core::Value> { return Read(var); },
            [](const Literal& literal) -> Result<core::Value> {
              return core::Value(literal.val());
            },
        },
        atom);
  }

  template <typename Range>
  auto ReadAll(const Range& range) const -> Result<core::Values> {
    core::Values values;
    values.reserve(range.size());
    for (const auto& item : range) {
      auto value = Read(item);
      if (!value) {
        return std::unexpected(std::move(value.error()));
      }
      values.push_back(std::move(*value));
    }
    return values;
  }

 private:
  const Jaxpr& jaxpr_;
  absl::flat_hash_map<Var, core::Value> env_;
};

auto MakeSubfun(
    std::shared_ptr<const Jaxpr> jaxpr, core::Values consts,
    core::Values freevar_vals) -> core::WrappedFun {
  return core::WrappedFun(
      "eval_jaxpr",
      [jaxpr = std::move(jaxpr), consts = std::move(consts),
       freevar_vals = std::move(freevar_vals)](
          trace::TraceContext& ctx,
          std::span<const core::Value> args) -> Result<core::Values> {
        return EvalJaxpr(ctx, *jaxpr, consts, freevar_vals, args);
      });
}

}  // namespace

auto EvalJaxpr(
    trace::TraceContext& ctx, const Jaxpr& jaxpr,
    std::span<const core::Value> consts,
    std::span<const core::Value> freevar_vals,
    std::span<const core::Value> args) -> Result<core::Values> {
  if (ctx.config().enable_checks) {
    auto checked = CheckJaxpr(jaxpr);
    if (!checked) {
      return std::unexpected(std::move(checked.error()));
    }
  }

  Environment env(jaxpr);
  for (auto r :
       {env.WriteAll(jaxpr.constvars, consts, "constvars"),
        env.WriteAll(jaxpr.invars, args, "invars"),
        env.WriteAll(jaxpr.freevars, freevar_vals, "freevars")}) {
    if (!r) {
      return std::unexpected(std::move(r.error()));
    }
  }

  const auto& log = ctx.logger();
  for (const auto& eqn : jaxpr.eqns) {
    if (eqn.primitive == nullptr) {
      return std::unexpected(
          Diagnostic::MalformedProgram(
              fmt::format("equation {} has no primitive", eqn.eqn_id.value))
              .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr))));
    }
    auto in_vals = env.ReadAll(eqn.invars);
    if (!in_vals) {
      return std::unexpected(std::move(in_vals.error()));
    }

    std::vector<core::WrappedFun> subfuns;
    subfuns.reserve(eqn.bound_subjaxprs.size());
    for (const auto& bound : eqn.bound_subjaxprs) {
      if (bound.jaxpr == nullptr) {
        return std::unexpected(
            Diagnostic::MalformedProgram(
                fmt::format(
                    "equation {} has a null sub-jaxpr", eqn.eqn_id.value))
                .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr))));
      }
      auto bound_consts = env.ReadAll(bound.const_bindings);
      if (!bound_consts) {
        return std::unexpected(std::move(bound_consts.error()));
      }
      auto bound_frees = env.ReadAll(bound.freevar_bindings);
      if (!bound_frees) {
        return std::unexpected(std::move(bound_frees.error()));
      }
      subfuns.push_back(
          MakeSubfun(
              bound.jaxpr, std::move(*bound_consts), std::move(*bound_frees)));
    }

    log.Log(
        common::kLogDispatch, "eval", "eqn {}: {} with {} operands",
        eqn.eqn_id.value, eqn.primitive->name(), in_vals->size());

    auto ans = eqn.primitive->Bind(
        ctx, std::move(subfuns), std::move(*in_vals), eqn.params);
    if (!ans) {
      log.Log(
          common::kLogErrors, "eval", "eqn {} ({}) failed: {}",
          eqn.eqn_id.value, eqn.primitive->name(), ans.error().message);
      return std::unexpected(std::move(ans.error()));
    }

    if (eqn.primitive->MultipleResults()) {
      auto written = env.WriteAll(eqn.outvars, *ans, "outputs on an equation");
      if (!written) {
        return std::unexpected(std::move(written.error()));
      }
    } else {
      if (eqn.outvars.size() != 1 || ans->size() != 1) {
        return std::unexpected(
            Diagnostic::MalformedProgram(
                fmt::format(
                    "single-result equation {} ({}) has {} outvars and {} "
                    "results",
                    eqn.eqn_id.value, eqn.primitive->name(),
                    eqn.outvars.size(), ans->size()))
                .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr))));
      }
      env.Write(eqn.outvars[0], std::move(ans->front()));
    }
  }

  return env.ReadAll(jaxpr.outvars);
}

auto JaxprAsFun(
    trace::TraceContext& ctx, const TypedJaxpr& typed,
    std::span<const core::Value> args) -> Result<core::Values> {
  core::Values consts(typed.literals().begin(), typed.literals().end());
  return EvalJaxpr(ctx, typed.jaxpr(), consts, {}, args);
}

}  // namespace stax::ir
