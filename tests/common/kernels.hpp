#pragma once

#include <cstdint>
#include <optional>

#include "stax/core/primitive.hpp"
#include "stax/core/type_registry.hpp"
#include "stax/core/value.hpp"

namespace stax::test {

// Registry with Unit and the scalar types registered, and add, mul and neg
// backing their operators.
auto ScalarRegistry() -> const core::TypeRegistry&;

// Arithmetic over int64_t or double; both operands must share a type.
auto AddPrimitive() -> const core::Primitive&;
auto MulPrimitive() -> const core::Primitive&;
auto NegPrimitive() -> const core::Primitive&;

// Two results: quotient and remainder. int64_t only.
auto DivmodPrimitive() -> const core::Primitive&;

auto Int(int64_t value) -> core::Value;
auto Real(double value) -> core::Value;

// The int64_t payload of a concrete value, if it is one.
auto AsInt(const core::Value& value) -> std::optional<int64_t>;

}  // namespace stax::test
