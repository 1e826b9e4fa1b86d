#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "stax/core/concrete.hpp"
#include "stax/ir/handle.hpp"

namespace stax::ir {

// A constant embedded directly in an equation's inputs.
//
// Values hashable by value compare and hash by value. Literal-able values
// compare and hash through their LiteralKey. Anything else compares and
// hashes by identity, so two distinct such literals are never equal.
class Literal {
 public:
  enum class Equality : uint8_t {
    kValue,
    kSurrogate,
    kIdentity,
  };

  explicit Literal(core::Concrete val);

  [[nodiscard]] auto val() const -> const core::Concrete& {
    return val_;
  }
  [[nodiscard]] auto equality() const -> Equality {
    return equality_;
  }
  [[nodiscard]] auto Hash() const -> size_t {
    return hash_;
  }

  friend auto operator==(const Literal& a, const Literal& b) -> bool;

  template <typename H>
  friend auto AbslHashValue(H h, const Literal& literal) -> H {
    return H::combine(std::move(h), literal.hash_);
  }

  [[nodiscard]] auto ToString() const -> std::string;

 private:
  core::Concrete val_;
  Equality equality_;
  size_t hash_;
};

// An equation input: a variable read from the environment or a literal.
using Atom = std::variant<Var, Literal>;

auto ToString(const Atom& atom) -> std::string;

}  // namespace stax::ir
