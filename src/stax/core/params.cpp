#include "stax/core/params.hpp"

#include <string>
#include <variant>

#include <fmt/core.h>

#include "stax/common/overloaded.hpp"

namespace stax::core {

auto ToString(const ParamValue& value) -> std::string {
  return std::visit(
      Overloaded{
          [](const std::string& s) { return fmt::format("'{}'", s); },
          [](const auto& v) { return fmt::format("{}", v); },
      },
      value);
}

auto FormatParams(const Params& params) -> std::string {
  if (params.empty()) return "";
  std::string result = "[";
  bool first = true;
  for (const auto& [name, value] : params) {
    if (!first) result += ", ";
    first = false;
    result += fmt::format("{}={}", name, ToString(value));
  }
  result += "]";
  return result;
}

}  // namespace stax::core
