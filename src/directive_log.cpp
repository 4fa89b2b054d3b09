#include "directive_log.hpp"

namespace canfuzz {

void BoundedLog::record(const std::string& directive) {
  if (slots_.empty()) return;
  slots_[recorded_ % slots_.size()] = directive;
  ++recorded_;
}

size_t BoundedLog::size() const {
  if (recorded_ < slots_.size()) return static_cast<size_t>(recorded_);
  return slots_.size();
}

std::vector<std::string> BoundedLog::entries() const {
  std::vector<std::string> out;
  const size_t n = size();
  out.reserve(n);
  if (n < slots_.size()) {
    out.assign(slots_.begin(), slots_.begin() + n);
    return out;
  }
  // Full ring: the oldest entry sits where the next write would go
  const size_t start = static_cast<size_t>(recorded_ % slots_.size());
  for (size_t i = 0; i < n; ++i) {
    out.push_back(slots_[(start + i) % slots_.size()]);
  }
  return out;
}

void BoundedLog::clear() {
  for (auto& s : slots_) s.clear();
  recorded_ = 0;
}

} // namespace canfuzz
