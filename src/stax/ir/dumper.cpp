#include "stax/ir/dumper.hpp"

#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "stax/core/params.hpp"
#include "stax/core/primitive.hpp"
#include "stax/ir/handle.hpp"
#include "stax/ir/jaxpr.hpp"
#include "stax/ir/literal.hpp"

namespace stax::ir {

namespace {

constexpr int kBodyIndent = 2;
constexpr std::string_view kLet = "let ";
constexpr std::string_view kLetPad = "    ";
// Stands in for a missing primitive or sub-jaxpr in malformed graphs.
constexpr std::string_view kMissing = "<missing>";

auto FormatVars(const std::vector<Var>& vars) -> std::string {
  std::string result;
  for (size_t i = 0; i < vars.size(); ++i) {
    if (i > 0) {
      result += ' ';
    }
    result += ToString(vars[i]);
  }
  return result;
}

auto FormatAtoms(const std::vector<Atom>& atoms) -> std::string {
  std::string result;
  for (size_t i = 0; i < atoms.size(); ++i) {
    if (i > 0) {
      result += ' ';
    }
    result += ToString(atoms[i]);
  }
  return result;
}

auto FormatOutvars(const std::vector<Atom>& atoms) -> std::string {
  std::string result = "[";
  for (size_t i = 0; i < atoms.size(); ++i) {
    if (i > 0) {
      result += ", ";
    }
    result += ToString(atoms[i]);
  }
  result += "]";
  return result;
}

}  // namespace

Dumper::Dumper(std::ostream* out) : out_(out) {
}

void Dumper::Dump(const Jaxpr& jaxpr) {
  DumpJaxpr(jaxpr, "");
}

void Dumper::PrintLine(std::string_view text) {
  for (int i = 0; i < indent_; ++i) {
    *out_ << ' ';
  }
  *out_ << text << '\n';
}

void Dumper::DumpJaxpr(const Jaxpr& jaxpr, std::string_view suffix) {
  PrintLine(
      fmt::format(
          "{{ lambda {} ; {} ; {}.", FormatVars(jaxpr.constvars),
          FormatVars(jaxpr.freevars), FormatVars(jaxpr.invars)));

  indent_ += kBodyIndent;
  if (jaxpr.eqns.empty()) {
    PrintLine("let");
  }
  for (size_t i = 0; i < jaxpr.eqns.size(); ++i) {
    DumpEqn(jaxpr.eqns[i], i == 0 ? kLet : kLetPad);
  }
  PrintLine(fmt::format("in {} }}{}", FormatOutvars(jaxpr.outvars), suffix));
  indent_ -= kBodyIndent;
}

void Dumper::DumpEqn(const JaxprEqn& eqn, std::string_view lead) {
  std::string line = fmt::format(
      "{}{} = {}{}", lead, FormatVars(eqn.outvars),
      eqn.primitive == nullptr ? kMissing : eqn.primitive->name(),
      core::FormatParams(eqn.params));
  if (!eqn.invars.empty()) {
    line += ' ';
    line += FormatAtoms(eqn.invars);
  }
  PrintLine(line);

  const int saved = indent_;
  indent_ += static_cast<int>(kLetPad.size()) + kBodyIndent;
  for (const auto& bound : eqn.bound_subjaxprs) {
    auto suffix = fmt::format(
        " [ {} ; {} ]", FormatVars(bound.const_bindings),
        FormatVars(bound.freevar_bindings));
    if (bound.jaxpr == nullptr) {
      PrintLine(fmt::format("{{ {} }}{}", kMissing, suffix));
      continue;
    }
    DumpJaxpr(*bound.jaxpr, suffix);
  }
  indent_ = saved;
}

auto PrintJaxpr(const Jaxpr& jaxpr) -> std::string {
  std::ostringstream out;
  Dumper dumper(&out);
  dumper.Dump(jaxpr);
  std::string text = out.str();
  if (!text.empty() && text.back() == '\n') {
    text.pop_back();
  }
  return text;
}

}  // namespace stax::ir
