#include "fuzz_config.hpp"
#include "directive.hpp"
#include "CLI/CLI11.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace canfuzz {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string canonical_id(const std::string& value) {
  std::string id;
  ParseError err = ParseError::None;
  if (!DirectiveCodec::parse_id(value, id, &err)) throw CLI::ValidationError(to_string(err));
  return id;
}

std::string canonical_payload(const std::string& value) {
  std::string payload;
  ParseError err = ParseError::None;
  if (!DirectiveCodec::parse_payload(value, payload, &err)) throw CLI::ValidationError(to_string(err));
  return payload;
}

std::string check_bitmap(const std::string& value) {
  Bitmap bm;
  return parse_bitmap(value, bm) ? std::string() : std::string("expected True/False tokens");
}

// Option table shared by parse_arguments() and usage(). Numeric options bind
// straight into the FuzzConfig; the rest land in the text fields below.
struct CommandLine {
  CLI::App app;
  std::string algorithm;
  std::string static_payload, generate, brute_force_id;
  std::string id, payload, id_bitmap, payload_bitmap;
  std::string input_file, output_file;
  uint32_t seed = 0;
  uint64_t window_us = 0;

  CommandLine(const std::string& prog, FuzzConfig& cfg)
      : app{"CAN bus fuzzer for SLCAN adapters", prog},
        window_us(static_cast<uint64_t>(cfg.observation_window.count())) {
    app.add_option("--alg", algorithm, "Generator algorithm")
        ->required()
        ->check(CLI::IsMember({"random", "linear", "ring_bf", "cyclic_bf", "mutate"}));
    app.add_option("--device", cfg.device, "SLCAN adapter, e.g. /dev/ttyACM0")->required();

    app.add_option("--static", static_payload, "Keep the payload constant (random, default True)");
    app.add_option("--payload", payload, "Static payload / brute force seed / mutation base")
        ->transform(canonical_payload);
    app.add_option("--id", id, "Static id / brute force and mutation base")->transform(canonical_id);
    app.add_option("--length", cfg.payload_length, "Random payload length in bytes")
        ->capture_default_str()
        ->check(CLI::Range(size_t{0}, MAX_PAYLOAD_BYTES));
    app.add_option("--id_bitmap", id_bitmap, "Free id digits, e.g. False,True,True")->check(check_bitmap);
    app.add_option("--payload_bitmap", payload_bitmap, "Free payload digits")->check(check_bitmap);
    app.add_option("--bf_id", brute_force_id, "Also brute force the id (ring_bf)");

    app.add_option("--file", input_file, "Corpus to replay (linear)");
    app.add_option("--gen", generate, "Fill --file with random directives first");
    app.add_option("--amount", cfg.generate_amount, "Directives written by --gen")
        ->capture_default_str()
        ->check(CLI::Range(size_t{0}, size_t{100000000}));
    app.add_option("--out", output_file, "Append every sent directive to this corpus");
    app.add_option("--log", cfg.log_depth, "Keep the last n directives (0 disables)")
        ->capture_default_str()
        ->check(CLI::Range(size_t{0}, size_t{1000000}));
    app.add_option("--seed", seed, "RNG seed for random and mutate")
        ->check(CLI::Range(uint32_t{0}, std::numeric_limits<uint32_t>::max()));

    app.add_option("--bitrate", cfg.bitrate, "CAN bitrate in bit/s")
        ->capture_default_str()
        ->check(CLI::Range(uint32_t{10000}, uint32_t{1000000}));
    app.add_option("--window", window_us, "Response observation window in microseconds")
        ->capture_default_str()
        ->check(CLI::Range(uint64_t{0}, uint64_t{60000000}));

    app.footer("Algorithms:\n"
               "  random     random ids with a random or static payload\n"
               "  linear     replay directives from a corpus file (--file)\n"
               "  ring_bf    ring-carry brute force over the free digits (alias cyclic_bf)\n"
               "  mutate     random digits on the free positions of --id / --payload\n"
               "\n"
               "Example:\n"
               "  " + prog + " --alg linear --gen True --file example.txt --device /dev/ttyACM0");
  }

  bool given(const std::string& name) const { return app.count(name) > 0; }
};

} // namespace

std::optional<Algorithm> parse_algorithm(const std::string& name) {
  if (name == "random") return Algorithm::Random;
  if (name == "linear") return Algorithm::Linear;
  if (name == "ring_bf" || name == "cyclic_bf") return Algorithm::RingBruteForce;
  if (name == "mutate") return Algorithm::Mutate;
  return std::nullopt;
}

const char* to_string(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::Random:         return "random";
    case Algorithm::Linear:         return "linear";
    case Algorithm::RingBruteForce: return "ring_bf";
    case Algorithm::Mutate:         return "mutate";
  }
  return "unknown";
}

bool to_bool(const std::string& text) {
  const std::string v = lower(text);
  return !(v.empty() || v == "false" || v == "0");
}

ArgResult parse_arguments(int argc, const char* const* argv, FuzzConfig& cfg) {
  CommandLine cl(argc > 0 ? argv[0] : "canfuzz", cfg);

  try {
    cl.app.parse(argc, argv);
  } catch (const CLI::CallForHelp&) {
    return ArgResult{ArgStatus::Help, ""};
  } catch (const CLI::RequiredError& e) {
    return ArgResult{ArgStatus::MissingArgument, e.what()};
  } catch (const CLI::ArgumentMismatch& e) {
    return ArgResult{ArgStatus::MissingArgument, e.what()};
  } catch (const CLI::ParseError& e) {
    return ArgResult{ArgStatus::InvalidArgument, e.what()};
  }

  cfg.algorithm = parse_algorithm(cl.algorithm);
  if (cl.given("--static")) cfg.static_payload = to_bool(cl.static_payload);
  if (cl.given("--gen")) cfg.generate = to_bool(cl.generate);
  if (cl.given("--bf_id")) cfg.brute_force_id = to_bool(cl.brute_force_id);
  if (cl.given("--id")) cfg.id = cl.id;
  if (cl.given("--payload")) cfg.payload = cl.payload;
  if (cl.given("--file")) cfg.input_file = cl.input_file;
  if (cl.given("--out")) cfg.output_file = cl.output_file;
  if (cl.given("--seed")) cfg.seed = cl.seed;
  cfg.observation_window = std::chrono::microseconds(static_cast<long long>(cl.window_us));

  Bitmap id_bits, payload_bits;
  if (cl.given("--id_bitmap") && parse_bitmap(cl.id_bitmap, id_bits)) cfg.id_bitmap = id_bits;
  if (cl.given("--payload_bitmap") && parse_bitmap(cl.payload_bitmap, payload_bits)) {
    cfg.payload_bitmap = payload_bits;
  }

  if (!cfg.algorithm) {
    return ArgResult{ArgStatus::InvalidArgument, "unknown algorithm " + cl.algorithm};
  }

  switch (*cfg.algorithm) {
    case Algorithm::Random:
      break;
    case Algorithm::Linear:
      if (!cfg.input_file) return ArgResult{ArgStatus::MissingArgument, "linear replay needs a corpus file (--file)"};
      break;
    case Algorithm::RingBruteForce:
      if (!cfg.id) return ArgResult{ArgStatus::MissingArgument, "ring_bf needs a base arbitration id (--id)"};
      break;
    case Algorithm::Mutate:
      if (!cfg.id_bitmap && !cfg.payload_bitmap) {
        return ArgResult{ArgStatus::MissingArgument, "mutate needs --id_bitmap and/or --payload_bitmap"};
      }
      break;
  }

  if (cfg.device.empty()) return ArgResult{ArgStatus::MissingArgument, "no SLCAN device given (--device)"};
  return ArgResult{};
}

std::string usage(const std::string& prog) {
  FuzzConfig defaults;
  CommandLine cl(prog, defaults);
  return cl.app.help();
}

std::unique_ptr<Generator> make_corpus_generator(const FuzzConfig& cfg, uint32_t seed) {
  RandomConfig rc;
  rc.static_id = cfg.id;
  if (cfg.static_payload) rc.static_payload = cfg.payload.value_or(DEFAULT_PAYLOAD);
  rc.payload_length = cfg.payload_length;
  return std::make_unique<RandomGenerator>(rc, seed);
}

std::unique_ptr<Generator> make_generator(const FuzzConfig& cfg, uint32_t seed, std::string& error) {
  if (!cfg.algorithm) {
    error = "no algorithm selected";
    return nullptr;
  }

  switch (*cfg.algorithm) {
    case Algorithm::Random:
      return make_corpus_generator(cfg, seed);

    case Algorithm::Linear: {
      if (!cfg.input_file) {
        error = "no corpus file";
        return nullptr;
      }
      auto gen = std::make_unique<LinearReplayGenerator>(*cfg.input_file);
      if (!gen->open()) {
        error = gen->last_error();
        return nullptr;
      }
      return gen;
    }

    case Algorithm::RingBruteForce: {
      RingBruteForceConfig rc;
      rc.id = cfg.id.value_or(DEFAULT_ID);
      rc.initial_payload = cfg.payload.value_or(DEFAULT_BRUTE_FORCE_SEED);
      rc.id_bitmap = cfg.id_bitmap;
      rc.payload_bitmap = cfg.payload_bitmap;
      rc.brute_force_id = cfg.brute_force_id;
      auto gen = std::make_unique<RingBruteForceGenerator>(rc);
      if (!gen->valid()) {
        error = gen->last_error();
        return nullptr;
      }
      return gen;
    }

    case Algorithm::Mutate: {
      MutationConfig mc;
      mc.id = cfg.id.value_or(DEFAULT_ID);
      mc.payload = cfg.payload.value_or(DEFAULT_PAYLOAD);
      mc.id_bitmap = cfg.id_bitmap.value_or(Bitmap{});
      mc.payload_bitmap = cfg.payload_bitmap.value_or(Bitmap{});
      return std::make_unique<MutationGenerator>(mc, seed);
    }
  }

  error = "unknown algorithm";
  return nullptr;
}

} // namespace canfuzz
