#ifndef CANFUZZ_DIRECTIVE_LOG_HPP
#define CANFUZZ_DIRECTIVE_LOG_HPP

/**
 * @file directive_log.hpp
 * @brief Fixed-capacity ring of recently sent directives
 *
 * The n-th recorded directive (counting from 0) lands in slot n % capacity,
 * so after k > capacity records the log holds the last `capacity` directives.
 * Capacity 0 disables logging: record() is a no-op.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace canfuzz {

class BoundedLog {
public:
  explicit BoundedLog(size_t capacity) : slots_(capacity) {}

  void record(const std::string& directive);

  size_t capacity() const { return slots_.size(); }
  size_t size() const;
  bool empty() const { return size() == 0; }
  bool enabled() const { return !slots_.empty(); }

  /// Total records seen, including overwritten ones
  uint64_t recorded() const { return recorded_; }

  /// Raw slot contents (slot i holds record n with n % capacity == i)
  const std::vector<std::string>& slots() const { return slots_; }

  /// Retained directives, oldest first
  std::vector<std::string> entries() const;

  void clear();

private:
  std::vector<std::string> slots_;
  uint64_t recorded_{0};
};

} // namespace canfuzz

#endif // CANFUZZ_DIRECTIVE_LOG_HPP
