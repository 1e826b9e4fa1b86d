#pragma once

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace stax::common {

// Verbosity levels used by the core.
inline constexpr int kLogErrors = 1;  // leak reports, failed evaluations
inline constexpr int kLogStack = 2;   // master/sublevel push and pop
inline constexpr int kLogDispatch = 3;  // per-equation and per-call detail

// Levelled diagnostic output. Lines go to the sink (stderr by default) so
// that stdout stays free for program results.
class Logger {
 public:
  explicit Logger(int level = 0, FILE* sink = stderr)
      : level_(level), sink_(sink) {
  }

  auto Enabled(int required_level) const -> bool {
    return level_ >= required_level;
  }

  auto level() const -> int {
    return level_;
  }

  // Emits "[stax][HH:MM:SS][category] message" when level is enabled.
  template <typename... Args>
  void Log(
      int required_level, std::string_view category,
      fmt::format_string<Args...> format, Args&&... args) const {
    if (!Enabled(required_level)) return;
    Write(category, fmt::format(format, std::forward<Args>(args)...));
  }

 private:
  void Write(std::string_view category, const std::string& message) const;

  int level_;
  FILE* sink_;
};

}  // namespace stax::common
