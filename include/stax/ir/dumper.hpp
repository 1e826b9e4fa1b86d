#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "stax/ir/jaxpr.hpp"

namespace stax::ir {

// Writes a graph in the textual form
//
//   { lambda c ; f ; a b.
//     let d = add a b
//         e = mul d c
//     in [e] }
//
// Sub-programs are printed under their equation, followed by
// "[ const bindings ; free bindings ]". A missing primitive or sub-jaxpr
// prints as "<missing>", so malformed graphs can still be reported.
class Dumper {
 public:
  explicit Dumper(std::ostream* out);

  void Dump(const Jaxpr& jaxpr);

 private:
  void DumpJaxpr(const Jaxpr& jaxpr, std::string_view suffix);
  void DumpEqn(const JaxprEqn& eqn, std::string_view lead);
  void PrintLine(std::string_view text);

  std::ostream* out_;
  int indent_ = 0;
};

auto PrintJaxpr(const Jaxpr& jaxpr) -> std::string;

}  // namespace stax::ir
