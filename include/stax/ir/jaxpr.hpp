#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stax/common/diagnostic.hpp"
#include "stax/core/abstract_value.hpp"
#include "stax/core/concrete.hpp"
#include "stax/core/params.hpp"
#include "stax/ir/handle.hpp"
#include "stax/ir/literal.hpp"

namespace stax::core {
class Primitive;
}  // namespace stax::core

namespace stax::ir {

struct Jaxpr;

// A sub-program attached to an equation, with the enclosing-scope variables
// bound to its constvars and freevars.
struct BoundSubjaxpr {
  std::shared_ptr<const Jaxpr> jaxpr;
  std::vector<Var> const_bindings;
  std::vector<Var> freevar_bindings;
};

// One node of the graph. Outvars are written only here.
struct JaxprEqn {
  EqnId eqn_id;
  std::vector<Atom> invars;
  std::vector<Var> outvars;
  const core::Primitive* primitive = nullptr;
  std::vector<BoundSubjaxpr> bound_subjaxprs;
  core::Params params;
};

// A traced program in SSA form. Constvars, freevars and invars are bound
// before the equations run; outvars are read after they all ran.
struct Jaxpr {
  std::vector<Var> constvars;
  std::vector<Var> freevars;
  std::vector<Var> invars;
  std::vector<Atom> outvars;
  std::vector<JaxprEqn> eqns;

  [[nodiscard]] auto ToString() const -> std::string;
};

// Allocates variables and sequential equation ids for one graph. It does
// not validate what it assembles; see CheckJaxpr.
class JaxprBuilder {
 public:
  auto NewVar() -> Var {
    return Var{next_var_++};
  }

  auto NewVars(size_t count) -> std::vector<Var>;

  auto AddEqn(
      const core::Primitive& primitive, std::vector<Atom> invars,
      std::vector<Var> outvars, core::Params params = {},
      std::vector<BoundSubjaxpr> bound_subjaxprs = {}) -> EqnId;

  [[nodiscard]] auto EqnCount() const -> size_t {
    return eqns_.size();
  }

  // Moves the equations added so far into a graph.
  auto Build(
      std::vector<Var> constvars, std::vector<Var> freevars,
      std::vector<Var> invars, std::vector<Atom> outvars) -> Jaxpr;

 private:
  uint32_t next_var_ = 0;
  std::vector<JaxprEqn> eqns_;
};

// A closed graph with its constant values and one abstract value per input
// and output.
class TypedJaxpr {
 public:
  // kMalformedProgram when the graph has freevars or when a count differs
  // from its variable group.
  static auto Create(
      Jaxpr jaxpr, std::vector<core::Concrete> literals,
      std::vector<core::AbstractValue> in_avals,
      std::vector<core::AbstractValue> out_avals) -> Result<TypedJaxpr>;

  [[nodiscard]] auto jaxpr() const -> const Jaxpr& {
    return *jaxpr_;
  }
  [[nodiscard]] auto literals() const -> const std::vector<core::Concrete>& {
    return literals_;
  }
  [[nodiscard]] auto in_avals() const
      -> const std::vector<core::AbstractValue>& {
    return in_avals_;
  }
  [[nodiscard]] auto out_avals() const
      -> const std::vector<core::AbstractValue>& {
    return out_avals_;
  }

  [[nodiscard]] auto ToString() const -> std::string;

 private:
  TypedJaxpr(
      std::shared_ptr<const Jaxpr> jaxpr, std::vector<core::Concrete> literals,
      std::vector<core::AbstractValue> in_avals,
      std::vector<core::AbstractValue> out_avals);

  std::shared_ptr<const Jaxpr> jaxpr_;
  std::vector<core::Concrete> literals_;
  std::vector<core::AbstractValue> in_avals_;
  std::vector<core::AbstractValue> out_avals_;
};

}  // namespace stax::ir
