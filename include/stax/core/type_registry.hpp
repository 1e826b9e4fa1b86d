#pragma once

#include <functional>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "stax/common/diagnostic.hpp"
#include "stax/core/abstract_value.hpp"
#include "stax/core/concrete.hpp"
#include "stax/core/value.hpp"

namespace stax::core {

class Primitive;

// Maps concrete payload types to their abstraction function. Types without
// an entry are not valid operands anywhere in the core. Filled during a
// registration phase and read-only afterwards.
class TypeRegistry {
 public:
  using AbstractifyFn = std::function<AbstractValue(const Concrete&)>;

  // Registers Unit -> AbstractUnit.
  TypeRegistry();

  template <typename T>
  void Register(std::function<AbstractValue(const T&)> abstractify) {
    mappings_[std::type_index(typeid(T))] =
        [fn = std::move(abstractify)](const Concrete& value) {
          return fn(*value.Get<T>());
        };
  }

  [[nodiscard]] auto Contains(std::type_index type) const -> bool {
    return mappings_.contains(type);
  }

  [[nodiscard]] auto IsValid(const Concrete& value) const -> bool {
    return Contains(value.Type());
  }

  // Abstraction of a concrete value; kDispatch for unregistered types.
  [[nodiscard]] auto ConcreteAval(const Concrete& value) const
      -> Result<AbstractValue>;

  // Tracers report their own aval; concrete values go through
  // ConcreteAval.
  [[nodiscard]] auto GetAval(const Value& value) const -> Result<AbstractValue>;

  // Names the primitive that carries out op. It must be single-result and
  // outlive the registry; a multi-result primitive throws InternalError.
  void DefOperator(Operator op, const Primitive& primitive);

  // nullptr when nothing is registered for op.
  [[nodiscard]] auto OperatorPrimitive(Operator op) const -> const Primitive*;

 private:
  absl::flat_hash_map<std::type_index, AbstractifyFn> mappings_;
  absl::flat_hash_map<Operator, const Primitive*> operators_;
};

// Registers bool, int64_t and double as ConcreteScalar.
void RegisterScalarTypes(TypeRegistry& registry);

}  // namespace stax::core
