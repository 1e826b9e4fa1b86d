#pragma once

#include "stax/common/diagnostic.hpp"
#include "stax/ir/jaxpr.hpp"

namespace stax::ir {

// Checks that a graph is well-scoped. Each sub-program is checked on its
// own, in a fresh scope.
//
// Invariants checked:
// - Every variable read (equation input, binding, output) is defined
//   earlier in the same graph; literals always pass
// - No variable is defined twice, counting constvars, freevars, invars
//   and equation outputs; kUnitVar is predefined
// - A bound sub-program has as many const and free bindings as it has
//   constvars and freevars
//
// Failures are kMalformedProgram with the printed graph as a note.
auto CheckJaxpr(const Jaxpr& jaxpr) -> Result<void>;

}  // namespace stax::ir
