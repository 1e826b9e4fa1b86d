#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "absl/hash/hash.h"

namespace stax::core {

// The unit value, used where an equation has no meaningful output.
struct Unit {
  auto operator==(const Unit&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const Unit&) -> H {
    return h;
  }
};

inline constexpr Unit kUnit{};

using ScalarPayload = std::variant<bool, int64_t, double>;

// Stable surrogate for a literal-able value that cannot be hashed directly.
struct LiteralKey {
  ScalarPayload payload;
  std::string tag;

  auto operator==(const LiteralKey&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const LiteralKey& key) -> H {
    return H::combine(std::move(h), key.payload, key.tag);
  }
};

// Specialize with `static auto Key(const T&) -> LiteralKey` to register T as
// literal-able.
template <typename T>
struct LiteralTraits {};

template <typename T>
concept HashableByValue = std::equality_comparable<T> &&
                          std::is_default_constructible_v<absl::Hash<T>>;

template <typename T>
concept Literalable = requires(const T& value) {
  { LiteralTraits<T>::Key(value) } -> std::same_as<LiteralKey>;
};

// Immutable, shared, type-erased concrete value. Copies share the payload,
// so Identity() is preserved across copies.
class Concrete {
 public:
  template <typename T>
  static auto Of(T value) -> Concrete {
    using U = std::decay_t<T>;
    return Concrete(
        &OpsFor<U>(), std::make_shared<const U>(std::move(value)));
  }

  [[nodiscard]] auto Type() const -> std::type_index {
    return ops_->type;
  }

  template <typename T>
  [[nodiscard]] auto Is() const -> bool {
    return ops_->type == std::type_index(typeid(T));
  }

  // Payload as T, or nullptr when the payload has a different type.
  template <typename T>
  [[nodiscard]] auto Get() const -> const T* {
    if (!Is<T>()) return nullptr;
    return static_cast<const T*>(data_.get());
  }

  [[nodiscard]] auto Identity() const -> const void* {
    return data_.get();
  }

  [[nodiscard]] auto IsHashable() const -> bool {
    return ops_->hash != nullptr;
  }

  // Value hash; nullopt for types that are not hashable by value.
  [[nodiscard]] auto Hash() const -> std::optional<size_t> {
    if (ops_->hash == nullptr) return std::nullopt;
    return ops_->hash(data_.get());
  }

  // Value equality; only meaningful when both sides are hashable and share
  // a type. Otherwise falls back to identity.
  [[nodiscard]] auto ValueEquals(const Concrete& other) const -> bool;

  [[nodiscard]] auto GetLiteralKey() const -> std::optional<LiteralKey> {
    if (ops_->literal_key == nullptr) return std::nullopt;
    return ops_->literal_key(data_.get());
  }

  [[nodiscard]] auto ToString() const -> std::string {
    return ops_->to_string(data_.get());
  }

 private:
  struct TypeOps {
    std::type_index type;
    size_t (*hash)(const void*) = nullptr;
    bool (*equal)(const void*, const void*) = nullptr;
    LiteralKey (*literal_key)(const void*) = nullptr;
    std::string (*to_string)(const void*) = nullptr;
  };

  Concrete(const TypeOps* ops, std::shared_ptr<const void> data)
      : ops_(ops), data_(std::move(data)) {
  }

  template <typename T>
  static auto OpsFor() -> const TypeOps&;

  const TypeOps* ops_;
  std::shared_ptr<const void> data_;
};

template <typename T>
auto Concrete::OpsFor() -> const TypeOps& {
  static const TypeOps kOps = [] {
    TypeOps ops{.type = std::type_index(typeid(T))};
    if constexpr (HashableByValue<T>) {
      ops.hash = [](const void* p) -> size_t {
        return absl::HashOf(*static_cast<const T*>(p));
      };
      ops.equal = [](const void* a, const void* b) -> bool {
        return *static_cast<const T*>(a) == *static_cast<const T*>(b);
      };
    }
    if constexpr (Literalable<T>) {
      ops.literal_key = [](const void* p) -> LiteralKey {
        return LiteralTraits<T>::Key(*static_cast<const T*>(p));
      };
    }
    ops.to_string = [](const void* p) -> std::string {
      if constexpr (std::is_same_v<T, Unit>) {
        return "*";
      } else if constexpr (fmt::is_formattable<T>::value) {
        return fmt::format("{}", *static_cast<const T*>(p));
      } else {
        return fmt::format("<{} at {}>", typeid(T).name(), p);
      }
    };
    return ops;
  }();
  return kOps;
}

}  // namespace stax::core
