#include "alphabet.hpp"

namespace canfuzz {

const Alphabet& Alphabet::hex() {
  static const Alphabet instance("0123456789ABCDEF");
  return instance;
}

const Alphabet& Alphabet::lead_id() {
  static const Alphabet instance("01234567");
  return instance;
}

char Alphabet::next(char c) const {
  const size_t i = index_of(c);
  if (i == std::string::npos) return min();
  return symbols_[(i + 1) % symbols_.size()];
}

} // namespace canfuzz
