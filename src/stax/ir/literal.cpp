#include "stax/ir/literal.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "absl/hash/hash.h"
#include "stax/common/overloaded.hpp"

namespace stax::ir {

Literal::Literal(core::Concrete val) : val_(std::move(val)) {
  if (auto hash = val_.Hash()) {
    equality_ = Equality::kValue;
    hash_ = *hash;
  } else if (auto key = val_.GetLiteralKey()) {
    equality_ = Equality::kSurrogate;
    hash_ = absl::HashOf(*key);
  } else {
    equality_ = Equality::kIdentity;
    hash_ = absl::HashOf(std::bit_cast<uintptr_t>(val_.Identity()));
  }
}

auto operator==(const Literal& a, const Literal& b) -> bool {
  if (a.equality_ != b.equality_ || a.val_.Type() != b.val_.Type()) {
    return false;
  }
  switch (a.equality_) {
    case Literal::Equality::kValue:
      return a.val_.ValueEquals(b.val_);
    case Literal::Equality::kSurrogate:
      return a.val_.GetLiteralKey() == b.val_.GetLiteralKey();
    case Literal::Equality::kIdentity:
      return a.val_.Identity() == b.val_.Identity();
  }
  return false;
}

auto Literal::ToString() const -> std::string {
  if (equality_ == Equality::kIdentity) {
    return fmt::format("Literal(val={})", val_.ToString());
  }
  return val_.ToString();
}

auto ToString(const Atom& atom) -> std::string {
  return std::visit(
      Overloaded{
          [](Var var) { return ToString(var); },
          [](const Literal& literal) { return literal.ToString(); },
      },
      atom);
}

}  // namespace stax::ir
