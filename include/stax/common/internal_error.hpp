#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace stax::common {

// Broken invariant inside the core or inside a registered rule. Errors a
// caller is expected to handle travel through Result instead.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace stax::common
