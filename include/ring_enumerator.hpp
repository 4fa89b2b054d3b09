#ifndef CANFUZZ_RING_ENUMERATOR_HPP
#define CANFUZZ_RING_ENUMERATOR_HPP

/**
 * @file ring_enumerator.hpp
 * @brief Ring-carry increment over a digit string
 *
 * Each advance() adds one unit to the least significant digit and carries
 * into higher digits:
 *
 *   0000 -> 0001 -> ... -> 000F -> 0010 -> ... -> FFFF -> Exhausted
 *
 * Starting from any seed the enumerator visits every remaining value of the
 * space exactly once, in ascending order, then reports Exhausted and stops
 * changing. Each position may carry its own alphabet (mixed radix); the
 * leading id digit for example only ranges over 0-7.
 *
 * The state is kept reversed (least significant digit at index 0) so the
 * carry scan always starts at index 0.
 */

#include "alphabet.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace canfuzz {

enum class AdvanceStatus : uint8_t {
  Advanced,  ///< State moved to the next value
  Exhausted  ///< Every digit is at its maximum; state unchanged
};

class RingEnumerator {
public:
  /// Enumerator where every position uses the same alphabet.
  /// nullopt if a seed digit is not part of the alphabet.
  static std::optional<RingEnumerator> create(const std::string& seed,
                                              const Alphabet& alphabet = Alphabet::hex());

  /// Mixed-radix enumerator; radix[i] is the alphabet of seed[i]
  /// (most significant first). nullopt on size mismatch or foreign digits.
  static std::optional<RingEnumerator> create(const std::string& seed,
                                              const std::vector<Alphabet>& radix);

  AdvanceStatus advance();

  /// Current value, most significant digit first
  std::string value() const;

  bool at_maximum() const;
  size_t width() const { return state_.size(); }
  uint64_t steps() const { return steps_; }

private:
  RingEnumerator(std::string reversed_state, std::vector<Alphabet> reversed_radix)
      : state_(std::move(reversed_state)), radix_(std::move(reversed_radix)) {}

  std::string state_;           // least significant digit first
  std::vector<Alphabet> radix_; // alphabet of state_[i]
  uint64_t steps_{0};
};

/// One ring-carry step over the hex alphabet.
/// Returns the successor of `digits`, or nullopt when digits is all 'F'
/// (or contains a non-hex digit).
std::optional<std::string> advance(const std::string& digits,
                                   const Alphabet& alphabet = Alphabet::hex());

} // namespace canfuzz

#endif // CANFUZZ_RING_ENUMERATOR_HPP
