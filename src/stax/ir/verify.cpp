#include "stax/ir/verify.hpp"

#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "absl/container/flat_hash_set.h"
#include "stax/common/diagnostic.hpp"
#include "stax/ir/dumper.hpp"
#include "stax/ir/handle.hpp"
#include "stax/ir/jaxpr.hpp"
#include "stax/ir/literal.hpp"

namespace stax::ir {

namespace {

class ScopeChecker {
 public:
  explicit ScopeChecker(const Jaxpr& jaxpr) : jaxpr_(jaxpr) {
    defined_.insert(kUnitVar);
  }

  auto Read(Var var) const -> Result<void> {
    if (!defined_.contains(var)) {
      return Fail(fmt::format("Variable '{}' not defined", ToString(var)));
    }
    return {};
  }

  auto Read(const Atom& atom) const -> Result<void> {
    if (const auto* var = std::get_if<Var>(&atom)) {
      return Read(*var);
    }
    return {};
  }

  auto Write(Var var) -> Result<void> {
    if (!defined_.insert(var).second) {
      return Fail(fmt::format("Variable '{}' already bound", ToString(var)));
    }
    return {};
  }

  template <typename Range>
  auto ReadAll(const Range& range) const -> Result<void> {
    for (const auto& item : range) {
      auto r = Read(item);
      if (!r) {
        return r;
      }
    }
    return {};
  }

  auto WriteAll(const std::vector<Var>& vars) -> Result<void> {
    for (Var var : vars) {
      auto r = Write(var);
      if (!r) {
        return r;
      }
    }
    return {};
  }

  [[nodiscard]] auto Fail(std::string message) const
      -> std::unexpected<Diagnostic> {
    return std::unexpected(
        Diagnostic::MalformedProgram(std::move(message))
            .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr_))));
  }

 private:
  const Jaxpr& jaxpr_;
  absl::flat_hash_set<Var> defined_;
};

}  // namespace

auto CheckJaxpr(const Jaxpr& jaxpr) -> Result<void> {
  ScopeChecker scope(jaxpr);

  for (const auto* group : {&jaxpr.constvars, &jaxpr.freevars, &jaxpr.invars}) {
    auto r = scope.WriteAll(*group);
    if (!r) {
      return r;
    }
  }

  for (const auto& eqn : jaxpr.eqns) {
    if (eqn.primitive == nullptr) {
      return scope.Fail(
          fmt::format("equation {} has no primitive", eqn.eqn_id.value));
    }
    auto in = scope.ReadAll(eqn.invars);
    if (!in) {
      return in;
    }

    for (const auto& bound : eqn.bound_subjaxprs) {
      if (bound.jaxpr == nullptr) {
        return scope.Fail(
            fmt::format("equation {} has a null sub-jaxpr", eqn.eqn_id.value));
      }
      auto frees = scope.ReadAll(bound.freevar_bindings);
      if (!frees) {
        return frees;
      }
      auto consts = scope.ReadAll(bound.const_bindings);
      if (!consts) {
        return consts;
      }
      if (bound.const_bindings.size() != bound.jaxpr->constvars.size() ||
          bound.freevar_bindings.size() != bound.jaxpr->freevars.size()) {
        return scope.Fail(
            fmt::format(
                "equation {} binds {} consts and {} freevars to a sub-jaxpr "
                "with {} constvars and {} freevars",
                eqn.eqn_id.value, bound.const_bindings.size(),
                bound.freevar_bindings.size(), bound.jaxpr->constvars.size(),
                bound.jaxpr->freevars.size()));
      }
      auto sub = CheckJaxpr(*bound.jaxpr);
      if (!sub) {
        return sub;
      }
    }

    auto out = scope.WriteAll(eqn.outvars);
    if (!out) {
      return out;
    }
  }

  return scope.ReadAll(jaxpr.outvars);
}

}  // namespace stax::ir
