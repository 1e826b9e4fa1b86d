#include "stax/ir/handle.hpp"

#include <cstdint>
#include <string>

namespace stax::ir {

auto ToString(Var var) -> std::string {
  if (var == kUnitVar) return "*";
  std::string name;
  uint32_t n = var.id;
  do {
    name.insert(name.begin(), static_cast<char>('a' + n % 26));
    n /= 26;
  } while (n > 0);
  return name;
}

}  // namespace stax::ir
