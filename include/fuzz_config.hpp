#ifndef CANFUZZ_FUZZ_CONFIG_HPP
#define CANFUZZ_FUZZ_CONFIG_HPP

/**
 * @file fuzz_config.hpp
 * @brief Run configuration and command-line parsing
 *
 * Options are parsed with CLI11:
 *
 *   canfuzz --alg random --static False --device /dev/ttyACM0
 *   canfuzz --alg linear --gen True --file corpus.txt --device /dev/ttyACM0
 *   canfuzz --alg ring_bf --id 7DF --payload 0210 --payload_bitmap False,False,True,True ...
 *   canfuzz --alg mutate --id 7E0 --id_bitmap False,True,True --log 10 ...
 */

#include "bitmap.hpp"
#include "generators.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace canfuzz {

enum class Algorithm : uint8_t {
  Random,
  Linear,
  RingBruteForce,
  Mutate
};

/// "random", "linear", "ring_bf" (alias "cyclic_bf"), "mutate"
std::optional<Algorithm> parse_algorithm(const std::string& name);
const char* to_string(Algorithm algorithm);

struct FuzzConfig {
  std::optional<Algorithm> algorithm;

  // Directive shaping
  std::optional<std::string> id;      ///< Static id / brute-force and mutation base
  std::optional<std::string> payload; ///< Static payload / brute-force seed / mutation base
  bool static_payload{true};          ///< Random: hold the payload constant
  size_t payload_length{DEFAULT_RANDOM_PAYLOAD_BYTES};
  std::optional<Bitmap> id_bitmap;
  std::optional<Bitmap> payload_bitmap;
  bool brute_force_id{false};

  // Bookkeeping
  size_t log_depth{1};                 ///< 0 disables the bounded log
  std::optional<std::string> input_file;  ///< --file (linear replay)
  std::optional<std::string> output_file; ///< --out (corpus of sent directives)
  bool generate{false};                ///< --gen: fill --file before replaying it
  size_t generate_amount{100};
  std::optional<uint32_t> seed;        ///< Non-deterministic when absent

  // Bus
  std::string device;
  uint32_t bitrate{500000};
  std::chrono::microseconds observation_window{100};
};

enum class ArgStatus : uint8_t {
  Ok,
  Help,            ///< -h / --help
  MissingArgument, ///< A required flag or flag value is absent
  InvalidArgument  ///< A value did not parse
};

struct ArgResult {
  ArgStatus status{ArgStatus::Ok};
  std::string message;

  bool ok() const { return status == ArgStatus::Ok; }
};

/// "False", "0" and "" (any case) are false, everything else is true
bool to_bool(const std::string& text);

/// Parse argv into cfg and apply the per-algorithm required-argument rules
ArgResult parse_arguments(int argc, const char* const* argv, FuzzConfig& cfg);

std::string usage(const std::string& prog);

/// Build the generator cfg selects. nullptr (with error set) if its inputs
/// cannot be used, e.g. an unreadable corpus file.
std::unique_ptr<Generator> make_generator(const FuzzConfig& cfg, uint32_t seed, std::string& error);

/// Random generator used to pre-populate a corpus with --gen
std::unique_ptr<Generator> make_corpus_generator(const FuzzConfig& cfg, uint32_t seed);

} // namespace canfuzz

#endif // CANFUZZ_FUZZ_CONFIG_HPP
