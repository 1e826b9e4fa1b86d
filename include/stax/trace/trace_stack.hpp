#pragma once

#include <memory>
#include <string>
#include <vector>

#include "stax/trace/master_trace.hpp"

namespace stax::trace {

// Active masters of one context. Upward levels count 0, 1, 2, ...; bottom
// insertions go on the downward stack with levels -1, -2, ... so they sit
// below everything already active.
class TraceStack {
 public:
  [[nodiscard]] auto NextLevel(bool bottom) const -> int {
    if (bottom) {
      return -static_cast<int>(downward_.size() + 1);
    }
    return static_cast<int>(upward_.size());
  }

  void Push(std::shared_ptr<MasterTrace> master, bool bottom);

  // Pops the most recent master of the given side. Throws InternalError
  // when it is not `master`.
  void Pop(const MasterTrace& master, bool bottom);

  [[nodiscard]] auto upward() const
      -> const std::vector<std::shared_ptr<MasterTrace>>& {
    return upward_;
  }
  [[nodiscard]] auto downward() const
      -> const std::vector<std::shared_ptr<MasterTrace>>& {
    return downward_;
  }

  [[nodiscard]] auto Empty() const -> bool {
    return upward_.empty() && downward_.empty();
  }

  [[nodiscard]] auto ToString() const -> std::string;

 private:
  std::vector<std::shared_ptr<MasterTrace>> upward_;
  std::vector<std::shared_ptr<MasterTrace>> downward_;
};

}  // namespace stax::trace
