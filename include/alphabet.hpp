#ifndef CANFUZZ_ALPHABET_HPP
#define CANFUZZ_ALPHABET_HPP

/**
 * @file alphabet.hpp
 * @brief Ordered symbol sets used to build and enumerate directive digits
 *
 * Two alphabets cover the whole directive space:
 * - HEX:     "0123456789ABCDEF" - every payload digit and the low id digits
 * - LEAD_ID: "01234567"         - leading id digit (11-bit identifier, max 0x7FF)
 *
 * Symbol order is significant: the ring enumerator relies on ascending order
 * for carry propagation.
 */

#include <cstddef>
#include <string>
#include <utility>

namespace canfuzz {

class Alphabet {
public:
  explicit Alphabet(std::string symbols) : symbols_(std::move(symbols)) {}

  static const Alphabet& hex();
  static const Alphabet& lead_id();

  const std::string& symbols() const { return symbols_; }
  size_t size() const { return symbols_.size(); }

  char min() const { return symbols_.front(); }
  char max() const { return symbols_.back(); }
  char at(size_t index) const { return symbols_[index]; }

  bool contains(char c) const { return symbols_.find(c) != std::string::npos; }

  /// Position of c in the alphabet, npos if absent
  size_t index_of(char c) const { return symbols_.find(c); }

  /// Successor of c; wraps from max() to min()
  char next(char c) const;

private:
  std::string symbols_;
};

} // namespace canfuzz

#endif // CANFUZZ_ALPHABET_HPP
