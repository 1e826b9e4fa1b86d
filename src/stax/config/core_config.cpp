#include "stax/config/core_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"

namespace stax::config {

namespace {

constexpr std::string_view kCheckLeaksVar = "STAX_CHECK_LEAKS";
constexpr std::string_view kEnableChecksVar = "STAX_ENABLE_CHECKS";
constexpr std::string_view kLogLevelVar = "STAX_LOG_LEVEL";

auto ToLower(std::string text) -> std::string {
  std::ranges::transform(text, text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

auto ParseFlag(std::string_view name, const std::string& raw)
    -> Result<bool> {
  std::string value = ToLower(raw);
  if (value == "1" || value == "true" || value == "on" || value == "yes") {
    return true;
  }
  if (value == "0" || value == "false" || value == "off" || value == "no" ||
      value.empty()) {
    return false;
  }
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format("{}: expected a boolean, got '{}'", name, raw)));
}

auto ParseLevel(std::string_view name, const std::string& raw)
    -> Result<int> {
  int level = 0;
  const char* first = raw.data();
  const char* last = raw.data() + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, level);
  if (ec != std::errc{} || ptr != last || level < 0) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: expected a non-negative integer, got '{}'", name, raw)));
  }
  return level;
}

}  // namespace

auto LoadConfig(const SettingLookup& lookup) -> Result<CoreConfig> {
  CoreConfig config;

  if (auto raw = lookup(kCheckLeaksVar)) {
    auto flag = ParseFlag(kCheckLeaksVar, *raw);
    if (!flag) return std::unexpected(std::move(flag.error()));
    config.check_leaks = *flag;
  }

  if (auto raw = lookup(kEnableChecksVar)) {
    auto flag = ParseFlag(kEnableChecksVar, *raw);
    if (!flag) return std::unexpected(std::move(flag.error()));
    config.enable_checks = *flag;
  }

  if (auto raw = lookup(kLogLevelVar)) {
    auto level = ParseLevel(kLogLevelVar, *raw);
    if (!level) return std::unexpected(std::move(level.error()));
    config.log_level = *level;
  }

  return config;
}

auto LoadConfigFromEnv() -> Result<CoreConfig> {
  return LoadConfig([](std::string_view name) -> std::optional<std::string> {
    if (const char* value = std::getenv(std::string(name).c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  });
}

}  // namespace stax::config
