#include "stax/core/concrete.hpp"

namespace stax::core {

auto Concrete::ValueEquals(const Concrete& other) const -> bool {
  if (ops_->type != other.ops_->type) return false;
  if (ops_->equal == nullptr) return Identity() == other.Identity();
  return ops_->equal(data_.get(), other.data_.get());
}

}  // namespace stax::core
