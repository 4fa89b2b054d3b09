#ifndef CANFUZZ_GENERATORS_HPP
#define CANFUZZ_GENERATORS_HPP

/**
 * @file generators.hpp
 * @brief Directive generation strategies
 *
 * Strategy        Bounded  Source of directives
 * --------------  -------  ------------------------------------------------
 * Random          no       fresh random id and/or payload every call
 * LinearReplay    yes      corpus file, one directive per line, in order
 * RingBruteForce  yes      ring-carry enumeration of the free digits
 * Mutation        no       random symbols on the free digits of a base value
 *
 * Unbounded strategies never return Exhausted; the dispatch loop stops them
 * through its cancellation token.
 */

#include "alphabet.hpp"
#include "bitmap.hpp"
#include "directive.hpp"
#include "ring_enumerator.hpp"
#include <cstdint>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <utility>

namespace canfuzz {

constexpr const char* DEFAULT_ID = "001";
constexpr const char* DEFAULT_PAYLOAD = "FFFFFFFF";
constexpr const char* DEFAULT_BRUTE_FORCE_SEED = "0000000000000000";
constexpr size_t DEFAULT_RANDOM_PAYLOAD_BYTES = 8;

enum class NextStatus : uint8_t {
  Ok,               ///< out holds a new directive
  Exhausted,        ///< Bounded strategy has nothing left (normal end)
  InvalidDirective  ///< Source data is malformed; see last_error()
};

class Generator {
public:
  virtual ~Generator() = default;

  virtual NextStatus next(Directive& out) = 0;
  virtual const char* name() const = 0;
  virtual bool bounded() const = 0;

  const std::string& last_error() const { return last_error_; }

protected:
  std::string last_error_;
};

/// Uniform symbol draws over an alphabet
class SymbolSource {
public:
  explicit SymbolSource(uint32_t seed) : rng_(seed) {}

  char pick(const Alphabet& alphabet);
  std::string digits(const Alphabet& alphabet, size_t count);

private:
  std::mt19937 rng_;
};

// ============================================================================
// Random
// ============================================================================

struct RandomConfig {
  std::optional<std::string> static_id;      ///< Hold the id constant
  std::optional<std::string> static_payload; ///< Hold the payload constant
  size_t payload_length{DEFAULT_RANDOM_PAYLOAD_BYTES}; ///< Random payload size in bytes (max 8)
};

class RandomGenerator : public Generator {
public:
  RandomGenerator(RandomConfig config, uint32_t seed);

  NextStatus next(Directive& out) override;
  const char* name() const override { return "random"; }
  bool bounded() const override { return false; }

  /// Random 11-bit id, e.g. "5C1"
  std::string random_id();
  /// Random payload of `bytes` bytes (clamped to 8)
  std::string random_payload(size_t bytes);

private:
  RandomConfig config_;
  SymbolSource source_;
};

// ============================================================================
// Linear replay
// ============================================================================

/// Replays a corpus file in line order. A malformed line ends the run
/// (InvalidDirective), blank lines included. Restart by constructing anew.
class LinearReplayGenerator : public Generator {
public:
  explicit LinearReplayGenerator(std::string path) : path_(std::move(path)) {}

  bool open();
  bool is_open() const { return in_.is_open(); }

  NextStatus next(Directive& out) override;
  const char* name() const override { return "linear"; }
  bool bounded() const override { return true; }

  size_t line_number() const { return line_number_; }

private:
  std::string path_;
  std::ifstream in_;
  size_t line_number_{0};
};

// ============================================================================
// Ring brute force
// ============================================================================

struct RingBruteForceConfig {
  std::string id;                                   ///< Base id (fixed unless brute_force_id)
  std::string initial_payload{DEFAULT_BRUTE_FORCE_SEED}; ///< Seed and base for fixed digits
  std::optional<Bitmap> id_bitmap;                  ///< Free id digits (all when absent)
  std::optional<Bitmap> payload_bitmap;             ///< Free payload digits (all when absent)
  bool brute_force_id{false};                       ///< Enumerate id digits too
};

/// Enumerates mask(id) + mask(payload) as one ring; the payload is the low
/// order end, so the id only moves once the free payload digits wrap.
/// The seed itself is emitted first.
class RingBruteForceGenerator : public Generator {
public:
  explicit RingBruteForceGenerator(RingBruteForceConfig config);

  /// False when the base id/payload cannot seed the enumerator
  bool valid() const { return ring_.has_value(); }

  NextStatus next(Directive& out) override;
  const char* name() const override { return "ring_bf"; }
  bool bounded() const override { return true; }

private:
  Directive current() const;

  RingBruteForceConfig config_;
  Bitmap id_bitmap_;
  Bitmap payload_bitmap_;
  size_t id_free_{0};
  std::optional<RingEnumerator> ring_;
  bool started_{false};
};

// ============================================================================
// Bitmap mutation
// ============================================================================

struct MutationConfig {
  std::string id{DEFAULT_ID};
  std::string payload{DEFAULT_PAYLOAD};
  Bitmap id_bitmap;      ///< Free id digits (empty = id fixed)
  Bitmap payload_bitmap; ///< Free payload digits (empty = payload fixed)
};

class MutationGenerator : public Generator {
public:
  MutationGenerator(MutationConfig config, uint32_t seed);

  NextStatus next(Directive& out) override;
  const char* name() const override { return "mutate"; }
  bool bounded() const override { return false; }

private:
  std::string mutate(const std::string& digits, const Bitmap& bitmap, bool is_id);

  MutationConfig config_;
  SymbolSource source_;
};

} // namespace canfuzz

#endif // CANFUZZ_GENERATORS_HPP
