#include "ring_enumerator.hpp"

namespace canfuzz {

std::optional<RingEnumerator> RingEnumerator::create(const std::string& seed,
                                                     const Alphabet& alphabet) {
  return create(seed, std::vector<Alphabet>(seed.size(), alphabet));
}

std::optional<RingEnumerator> RingEnumerator::create(const std::string& seed,
                                                     const std::vector<Alphabet>& radix) {
  if (radix.size() != seed.size()) return std::nullopt;
  for (size_t i = 0; i < seed.size(); ++i) {
    if (radix[i].size() == 0 || !radix[i].contains(seed[i])) return std::nullopt;
  }

  std::string reversed(seed.rbegin(), seed.rend());
  std::vector<Alphabet> reversed_radix(radix.rbegin(), radix.rend());
  return RingEnumerator(std::move(reversed), std::move(reversed_radix));
}

AdvanceStatus RingEnumerator::advance() {
  // Lowest-order digit that still has room to grow
  size_t ring = 0;
  while (ring < state_.size() && state_[ring] == radix_[ring].max()) {
    ++ring;
  }
  if (ring == state_.size()) return AdvanceStatus::Exhausted;

  state_[ring] = radix_[ring].next(state_[ring]);
  for (size_t i = 0; i < ring; ++i) {
    state_[i] = radix_[i].min();
  }
  ++steps_;
  return AdvanceStatus::Advanced;
}

std::string RingEnumerator::value() const {
  return std::string(state_.rbegin(), state_.rend());
}

bool RingEnumerator::at_maximum() const {
  for (size_t i = 0; i < state_.size(); ++i) {
    if (state_[i] != radix_[i].max()) return false;
  }
  return true;
}

std::optional<std::string> advance(const std::string& digits, const Alphabet& alphabet) {
  auto ring = RingEnumerator::create(digits, alphabet);
  if (!ring || ring->advance() == AdvanceStatus::Exhausted) return std::nullopt;
  return ring->value();
}

} // namespace canfuzz
