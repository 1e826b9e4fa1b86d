#pragma once

#include <cstdio>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "stax/common/diagnostic.hpp"
#include "stax/common/logger.hpp"
#include "stax/config/core_config.hpp"
#include "stax/core/type_registry.hpp"
#include "stax/trace/master_trace.hpp"
#include "stax/trace/sublevel.hpp"
#include "stax/trace/trace.hpp"
#include "stax/trace/trace_stack.hpp"

namespace stax::trace {

class TraceContext;

// Keeps a master on its context's stack for the lifetime of the scope.
// Exit() pops it and returns the leak check result. A scope destroyed
// without Exit() pops in its destructor and runs the same check, recording
// a leak on the context (see TraceContext::TakeLeaks). The check is skipped
// while an exception unwinds the scope.
class MasterScope {
 public:
  ~MasterScope();

  MasterScope(const MasterScope&) = delete;
  auto operator=(const MasterScope&) -> MasterScope& = delete;
  MasterScope(MasterScope&&) = delete;
  auto operator=(MasterScope&&) -> MasterScope& = delete;

  [[nodiscard]] auto Master() const -> const std::shared_ptr<MasterTrace>& {
    return master_;
  }

  // A trace of this master at the context's current sublevel.
  [[nodiscard]] auto NewTrace() const -> std::shared_ptr<Trace>;

  // With check_leaks enabled, fails with kLeak when anything besides this
  // scope still references the master after it is popped.
  auto Exit() -> Result<void>;

 private:
  friend class TraceContext;

  MasterScope(
      TraceContext& ctx, std::shared_ptr<MasterTrace> master, bool bottom);

  void Pop();
  [[nodiscard]] auto CheckLeak() const -> Result<void>;

  TraceContext& ctx_;
  std::shared_ptr<MasterTrace> master_;
  bool bottom_;
  bool active_ = true;
  int uncaught_on_entry_;
};

// Keeps a fresh sublevel current for the lifetime of the scope. Leak
// checking on Exit() and on destruction follows MasterScope.
class SublevelScope {
 public:
  ~SublevelScope();

  SublevelScope(const SublevelScope&) = delete;
  auto operator=(const SublevelScope&) -> SublevelScope& = delete;
  SublevelScope(SublevelScope&&) = delete;
  auto operator=(SublevelScope&&) -> SublevelScope& = delete;

  [[nodiscard]] auto sublevel() const -> const Sublevel& {
    return sublevel_;
  }

  // With check_leaks enabled, fails with kLeak when anything besides this
  // scope still holds the sublevel after it is popped.
  auto Exit() -> Result<void>;

 private:
  friend class TraceContext;

  SublevelScope(TraceContext& ctx, Sublevel sublevel);

  void Pop();
  [[nodiscard]] auto CheckLeak() const -> Result<void>;

  TraceContext& ctx_;
  Sublevel sublevel_;
  bool active_ = true;
  int uncaught_on_entry_;
};

// Tracing state of one thread of control: the trace stack, the sublevel
// stack, configuration and logging. It is passed explicitly to every
// tracing call and is neither copyable nor movable, so tracers created
// under it can be recognised by identity.
class TraceContext {
 public:
  explicit TraceContext(
      const core::TypeRegistry& types, config::CoreConfig config = {},
      FILE* log_sink = stderr);
  // The registry is held by reference and must outlive the context.
  TraceContext(
      const core::TypeRegistry&& types, config::CoreConfig config = {},
      FILE* log_sink = stderr) = delete;

  TraceContext(const TraceContext&) = delete;
  auto operator=(const TraceContext&) -> TraceContext& = delete;
  TraceContext(TraceContext&&) = delete;
  auto operator=(TraceContext&&) -> TraceContext& = delete;
  ~TraceContext() = default;

  [[nodiscard]] auto types() const -> const core::TypeRegistry& {
    return types_;
  }
  [[nodiscard]] auto config() const -> const config::CoreConfig& {
    return config_;
  }
  [[nodiscard]] auto logger() const -> const common::Logger& {
    return logger_;
  }
  [[nodiscard]] auto stack() const -> const TraceStack& {
    return stack_;
  }

  [[nodiscard]] auto CurSublevel() const -> Sublevel {
    return substack_.back();
  }
  [[nodiscard]] auto SublevelDepth() const -> size_t {
    return substack_.size();
  }

  // Pushes a new master for transformation T at the next level (the
  // bottom of the stack when `bottom`).
  template <typename T>
  [[nodiscard]] auto NewMaster(bool bottom = false) -> MasterScope;

  [[nodiscard]] auto NewSublevel() -> SublevelScope;

  // Leaks found when scopes were destroyed without Exit(), oldest first.
  // Clears the record.
  [[nodiscard]] auto TakeLeaks() -> std::vector<Diagnostic>;

 private:
  friend class MasterScope;
  friend class SublevelScope;

  const core::TypeRegistry& types_;
  config::CoreConfig config_;
  common::Logger logger_;
  TraceStack stack_;
  std::vector<Sublevel> substack_;
  std::vector<Diagnostic> leaks_;
};

template <typename T>
auto TraceContext::NewMaster(bool bottom) -> MasterScope {
  static_assert(std::is_base_of_v<Trace, T>, "T must derive from Trace");
  auto master = std::make_shared<MasterTrace>(
      this, stack_.NextLevel(bottom), std::type_index(typeid(T)),
      std::string(T::kName),
      [](std::shared_ptr<MasterTrace> m,
         Sublevel sublevel) -> std::shared_ptr<Trace> {
        return std::make_shared<T>(std::move(m), std::move(sublevel));
      });
  return MasterScope(*this, std::move(master), bottom);
}

}  // namespace stax::trace
