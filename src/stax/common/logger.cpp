#include "stax/common/logger.hpp"

#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace stax::common {

void Logger::Write(
    std::string_view category, const std::string& message) const {
  if (sink_ == nullptr) return;
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  fmt::print(sink_, "[stax][{:%H:%M:%S}][{}] {}\n", local, category, message);
  std::fflush(sink_);
}

}  // namespace stax::common
