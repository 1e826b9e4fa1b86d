#pragma once

#include <compare>
#include <memory>

namespace stax::trace {

// Distinguishes independent traces of the same transformation within one
// level. Copies share a token, so the number of live copies is observable
// for leak checking.
class Sublevel {
 public:
  explicit Sublevel(int value) : token_(std::make_shared<const int>(value)) {
  }

  [[nodiscard]] auto value() const -> int {
    return *token_;
  }

  // Number of live copies of this sublevel.
  [[nodiscard]] auto UseCount() const -> long {
    return token_.use_count();
  }

  auto operator==(const Sublevel& other) const -> bool {
    return value() == other.value();
  }
  auto operator<=>(const Sublevel& other) const -> std::strong_ordering {
    return value() <=> other.value();
  }

 private:
  std::shared_ptr<const int> token_;
};

}  // namespace stax::trace
