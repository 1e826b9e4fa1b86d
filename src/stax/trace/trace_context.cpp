#include "stax/trace/trace_context.hpp"

#include <cstdio>
#include <exception>
#include <expected>
#include <memory>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "stax/common/diagnostic.hpp"
#include "stax/common/internal_error.hpp"
#include "stax/common/logger.hpp"

namespace stax::trace {

TraceContext::TraceContext(
    const core::TypeRegistry& types, config::CoreConfig config, FILE* log_sink)
    : types_(types),
      config_(config),
      logger_(config.log_level, log_sink),
      substack_{Sublevel(0)} {
}

auto TraceContext::NewSublevel() -> SublevelScope {
  return SublevelScope(*this, Sublevel(static_cast<int>(substack_.size())));
}

auto TraceContext::TakeLeaks() -> std::vector<Diagnostic> {
  return std::exchange(leaks_, {});
}

MasterScope::MasterScope(
    TraceContext& ctx, std::shared_ptr<MasterTrace> master, bool bottom)
    : ctx_(ctx),
      master_(std::move(master)),
      bottom_(bottom),
      uncaught_on_entry_(std::uncaught_exceptions()) {
  ctx_.stack_.Push(master_, bottom_);
  ctx_.logger_.Log(
      common::kLogStack, "trace", "push {}{}", master_->ToString(),
      bottom_ ? " (bottom)" : "");
}

MasterScope::~MasterScope() {
  if (!active_) return;
  Pop();
  if (std::uncaught_exceptions() > uncaught_on_entry_) return;
  auto checked = CheckLeak();
  if (!checked) {
    ctx_.leaks_.push_back(std::move(checked.error()));
  }
}

auto MasterScope::NewTrace() const -> std::shared_ptr<Trace> {
  return master_->NewTrace(ctx_.CurSublevel());
}

void MasterScope::Pop() {
  ctx_.stack_.Pop(*master_, bottom_);
  active_ = false;
  ctx_.logger_.Log(common::kLogStack, "trace", "pop {}", master_->ToString());
}

auto MasterScope::Exit() -> Result<void> {
  if (!active_) {
    common::ThrowInternalError("MasterScope::Exit", "scope already exited");
  }
  Pop();
  return CheckLeak();
}

auto MasterScope::CheckLeak() const -> Result<void> {
  if (!ctx_.config_.check_leaks) {
    return {};
  }
  if (master_.use_count() > 1) {
    auto diag =
        Diagnostic::Leak(fmt::format("Leaked trace {}", master_->ToString()))
            .WithNote(ctx_.stack_.ToString());
    ctx_.logger_.Log(common::kLogErrors, "leak", "{}", diag.message);
    return std::unexpected(std::move(diag));
  }
  return {};
}

SublevelScope::SublevelScope(TraceContext& ctx, Sublevel sublevel)
    : ctx_(ctx),
      sublevel_(std::move(sublevel)),
      uncaught_on_entry_(std::uncaught_exceptions()) {
  ctx_.substack_.push_back(sublevel_);
  ctx_.logger_.Log(
      common::kLogStack, "trace", "push sublevel {}", sublevel_.value());
}

SublevelScope::~SublevelScope() {
  if (!active_) return;
  Pop();
  if (std::uncaught_exceptions() > uncaught_on_entry_) return;
  auto checked = CheckLeak();
  if (!checked) {
    ctx_.leaks_.push_back(std::move(checked.error()));
  }
}

void SublevelScope::Pop() {
  if (ctx_.substack_.size() <= 1 || ctx_.substack_.back() != sublevel_) {
    common::ThrowInternalError(
        "SublevelScope::Pop",
        fmt::format("sublevel {} is not the current one", sublevel_.value()));
  }
  ctx_.substack_.pop_back();
  active_ = false;
  ctx_.logger_.Log(
      common::kLogStack, "trace", "pop sublevel {}", sublevel_.value());
}

auto SublevelScope::Exit() -> Result<void> {
  if (!active_) {
    common::ThrowInternalError("SublevelScope::Exit", "scope already exited");
  }
  Pop();
  return CheckLeak();
}

auto SublevelScope::CheckLeak() const -> Result<void> {
  if (!ctx_.config_.check_leaks) {
    return {};
  }
  if (sublevel_.UseCount() > 1) {
    auto diag = Diagnostic::Leak(
        fmt::format("Leaked sublevel {}", sublevel_.value()));
    ctx_.logger_.Log(common::kLogErrors, "leak", "{}", diag.message);
    return std::unexpected(std::move(diag));
  }
  return {};
}

}  // namespace stax::trace
