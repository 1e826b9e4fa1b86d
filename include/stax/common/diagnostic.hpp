#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace stax {

// Category of a reported failure. Every kind is a defect signal: none of
// them is retried or recovered locally.
enum class ErrorKind : uint8_t {
  kMalformedProgram,   // use-before-def, redefinition, unresolved closure
  kDispatch,           // operand is neither a tracer nor a registered type
  kLifting,            // tracer cannot be reconciled onto the target trace
  kUnimplementedRule,  // primitive or trace rule was never registered
  kLeak,               // popped master or sublevel still referenced
  kTypeMismatch,       // incompatible abstract values
  kHostError,          // malformed external input (configuration)
};

auto ToString(ErrorKind kind) -> const char*;

// Primary message plus auxiliary notes (e.g. the rendered graph).
struct Diagnostic {
  ErrorKind kind;
  std::string message;
  std::vector<std::string> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto MalformedProgram(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kMalformedProgram,
        .message = std::move(msg),
        .notes = {},
    };
  }

  static auto Dispatch(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kDispatch,
        .message = std::move(msg),
        .notes = {},
    };
  }

  static auto Lifting(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kLifting,
        .message = std::move(msg),
        .notes = {},
    };
  }

  static auto Unimplemented(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kUnimplementedRule,
        .message = std::move(msg),
        .notes = {},
    };
  }

  static auto Leak(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kLeak,
        .message = std::move(msg),
        .notes = {},
    };
  }

  static auto TypeMismatch(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kTypeMismatch,
        .message = std::move(msg),
        .notes = {},
    };
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kHostError,
        .message = std::move(msg),
        .notes = {},
    };
  }

  auto WithNote(std::string note) && -> Diagnostic {
    notes.push_back(std::move(note));
    return std::move(*this);
  }

  // Message followed by each note on its own line.
  [[nodiscard]] auto Render() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace stax
