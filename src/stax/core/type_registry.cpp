#include "stax/core/type_registry.hpp"

#include <cstdint>
#include <expected>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/common/internal_error.hpp"
#include "stax/core/primitive.hpp"
#include "stax/trace/tracer.hpp"

namespace stax::core {

TypeRegistry::TypeRegistry() {
  Register<Unit>([](const Unit&) -> AbstractValue { return AbstractUnit{}; });
}

auto TypeRegistry::ConcreteAval(const Concrete& value) const
    -> Result<AbstractValue> {
  auto it = mappings_.find(value.Type());
  if (it == mappings_.end()) {
    return std::unexpected(
        Diagnostic::Dispatch(
            fmt::format(
                "{} of type {} is not a valid value for this system",
                value.ToString(), value.Type().name())));
  }
  return it->second(value);
}

auto TypeRegistry::GetAval(const Value& value) const -> Result<AbstractValue> {
  if (const auto* tracer = GetTracer(value)) {
    return (*tracer)->Aval();
  }
  return ConcreteAval(std::get<Concrete>(value));
}

void TypeRegistry::DefOperator(Operator op, const Primitive& primitive) {
  if (primitive.MultipleResults()) {
    common::ThrowInternalError(
        "TypeRegistry::DefOperator",
        fmt::format(
            "operator {} needs a single-result primitive, got '{}'",
            ToString(op), primitive.name()));
  }
  operators_[op] = &primitive;
}

auto TypeRegistry::OperatorPrimitive(Operator op) const -> const Primitive* {
  auto it = operators_.find(op);
  return it == operators_.end() ? nullptr : it->second;
}

void RegisterScalarTypes(TypeRegistry& registry) {
  registry.Register<bool>([](const bool& v) -> AbstractValue {
    return ConcreteScalar{.dtype = DType::kBool, .value = v};
  });
  registry.Register<int64_t>([](const int64_t& v) -> AbstractValue {
    return ConcreteScalar{.dtype = DType::kInt64, .value = v};
  });
  registry.Register<double>([](const double& v) -> AbstractValue {
    return ConcreteScalar{.dtype = DType::kFloat64, .value = v};
  });
}

}  // namespace stax::core
