#include "stax/common/diagnostic.hpp"

#include <string>

namespace stax {

auto ToString(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kMalformedProgram:
      return "malformed program";
    case ErrorKind::kDispatch:
      return "dispatch error";
    case ErrorKind::kLifting:
      return "lifting error";
    case ErrorKind::kUnimplementedRule:
      return "unimplemented rule";
    case ErrorKind::kLeak:
      return "leaked trace";
    case ErrorKind::kTypeMismatch:
      return "type mismatch";
    case ErrorKind::kHostError:
      return "host error";
  }
  return "unknown";
}

auto Diagnostic::Render() const -> std::string {
  std::string out = message;
  for (const auto& note : notes) {
    out += '\n';
    out += note;
  }
  return out;
}

}  // namespace stax
