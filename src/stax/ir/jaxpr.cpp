#include "stax/ir/jaxpr.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/ir/dumper.hpp"

namespace stax::ir {

auto Jaxpr::ToString() const -> std::string {
  return PrintJaxpr(*this);
}

auto JaxprBuilder::NewVars(size_t count) -> std::vector<Var> {
  std::vector<Var> vars;
  vars.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    vars.push_back(NewVar());
  }
  return vars;
}

auto JaxprBuilder::AddEqn(
    const core::Primitive& primitive, std::vector<Atom> invars,
    std::vector<Var> outvars, core::Params params,
    std::vector<BoundSubjaxpr> bound_subjaxprs) -> EqnId {
  EqnId id{static_cast<uint32_t>(eqns_.size())};
  eqns_.push_back(
      JaxprEqn{
          .eqn_id = id,
          .invars = std::move(invars),
          .outvars = std::move(outvars),
          .primitive = &primitive,
          .bound_subjaxprs = std::move(bound_subjaxprs),
          .params = std::move(params),
      });
  return id;
}

auto JaxprBuilder::Build(
    std::vector<Var> constvars, std::vector<Var> freevars,
    std::vector<Var> invars, std::vector<Atom> outvars) -> Jaxpr {
  Jaxpr jaxpr{
      .constvars = std::move(constvars),
      .freevars = std::move(freevars),
      .invars = std::move(invars),
      .outvars = std::move(outvars),
      .eqns = std::move(eqns_),
  };
  eqns_.clear();
  return jaxpr;
}

TypedJaxpr::TypedJaxpr(
    std::shared_ptr<const Jaxpr> jaxpr, std::vector<core::Concrete> literals,
    std::vector<core::AbstractValue> in_avals,
    std::vector<core::AbstractValue> out_avals)
    : jaxpr_(std::move(jaxpr)),
      literals_(std::move(literals)),
      in_avals_(std::move(in_avals)),
      out_avals_(std::move(out_avals)) {
}

auto TypedJaxpr::Create(
    Jaxpr jaxpr, std::vector<core::Concrete> literals,
    std::vector<core::AbstractValue> in_avals,
    std::vector<core::AbstractValue> out_avals) -> Result<TypedJaxpr> {
  auto mismatch = [&](std::string what, size_t expected, size_t actual) {
    return std::unexpected(
        Diagnostic::MalformedProgram(
            fmt::format(
                "typed jaxpr has {} {} for {} variables", actual, what,
                expected))
            .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr))));
  };

  if (!jaxpr.freevars.empty()) {
    return std::unexpected(
        Diagnostic::MalformedProgram(
            fmt::format(
                "typed jaxpr must be closed, found {} freevars",
                jaxpr.freevars.size()))
            .WithNote(fmt::format("jaxpr:\n{}", PrintJaxpr(jaxpr))));
  }
  if (literals.size() != jaxpr.constvars.size()) {
    return mismatch("literals", jaxpr.constvars.size(), literals.size());
  }
  if (in_avals.size() != jaxpr.invars.size()) {
    return mismatch("input avals", jaxpr.invars.size(), in_avals.size());
  }
  if (out_avals.size() != jaxpr.outvars.size()) {
    return mismatch("output avals", jaxpr.outvars.size(), out_avals.size());
  }

  return TypedJaxpr(
      std::make_shared<const Jaxpr>(std::move(jaxpr)), std::move(literals),
      std::move(in_avals), std::move(out_avals));
}

auto TypedJaxpr::ToString() const -> std::string {
  return PrintJaxpr(*jaxpr_);
}

}  // namespace stax::ir
