#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace stax::core {

using ParamValue = std::variant<bool, int64_t, double, std::string>;

// Static parameters of an equation, ordered by name.
using Params = std::map<std::string, ParamValue>;

auto ToString(const ParamValue& value) -> std::string;

// "[k1=v1, k2=v2]", or "" when empty.
auto FormatParams(const Params& params) -> std::string;

}  // namespace stax::core
