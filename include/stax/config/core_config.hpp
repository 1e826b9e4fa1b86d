#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "stax/common/diagnostic.hpp"

namespace stax::config {

struct CoreConfig {
  // Verify that popped masters and sublevels are no longer referenced.
  bool check_leaks = false;
  // Run CheckJaxpr before every EvalJaxpr.
  bool enable_checks = false;
  // Logger verbosity; 0 disables logging.
  int log_level = 0;
};

// Returns the value of a named setting, or nullopt when it is unset.
using SettingLookup =
    std::function<std::optional<std::string>(std::string_view name)>;

// Reads STAX_CHECK_LEAKS, STAX_ENABLE_CHECKS and STAX_LOG_LEVEL through
// lookup. Unset settings keep their defaults; malformed values fail with
// kHostError.
auto LoadConfig(const SettingLookup& lookup) -> Result<CoreConfig>;

// LoadConfig bound to the process environment.
auto LoadConfigFromEnv() -> Result<CoreConfig>;

}  // namespace stax::config
