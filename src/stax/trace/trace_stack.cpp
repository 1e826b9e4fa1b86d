#include "stax/trace/trace_stack.hpp"

#include <memory>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "stax/common/internal_error.hpp"

namespace stax::trace {

void TraceStack::Push(std::shared_ptr<MasterTrace> master, bool bottom) {
  if (bottom) {
    downward_.push_back(std::move(master));
  } else {
    upward_.push_back(std::move(master));
  }
}

void TraceStack::Pop(const MasterTrace& master, bool bottom) {
  auto& side = bottom ? downward_ : upward_;
  if (side.empty() || side.back().get() != &master) {
    common::ThrowInternalError(
        "TraceStack::Pop",
        fmt::format(
            "{} is not the most recent {} master", master.ToString(),
            bottom ? "downward" : "upward"));
  }
  side.pop_back();
}

auto TraceStack::ToString() const -> std::string {
  std::string result = "Trace stack\n";
  for (auto it = upward_.rbegin(); it != upward_.rend(); ++it) {
    result += fmt::format("  {}\n", (*it)->ToString());
  }
  result += " ---\n";
  for (const auto& master : downward_) {
    result += fmt::format("  {}\n", master->ToString());
  }
  return result;
}

}  // namespace stax::trace
