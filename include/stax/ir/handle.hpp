#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace stax::ir {

// A graph variable. Identity only; names are derived from the id when
// printing.
struct Var {
  uint32_t id = 0;

  auto operator==(const Var&) const -> bool = default;
  auto operator<=>(const Var&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, Var var) -> H {
    return H::combine(std::move(h), var.id);
  }
};

// Always bound to the unit value.
inline constexpr Var kUnitVar{UINT32_MAX};

// Index of an equation within the graph that owns it.
struct EqnId {
  uint32_t value = 0;

  auto operator==(const EqnId&) const -> bool = default;
  auto operator<=>(const EqnId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, EqnId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// "a", "b", ..., "z", "ba", "bb", ...; "*" for kUnitVar.
auto ToString(Var var) -> std::string;

}  // namespace stax::ir
