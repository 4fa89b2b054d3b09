#include "generators.hpp"
#include <algorithm>

namespace canfuzz {

// ============================================================================
// SymbolSource
// ============================================================================

char SymbolSource::pick(const Alphabet& alphabet) {
  std::uniform_int_distribution<size_t> dist(0, alphabet.size() - 1);
  return alphabet.at(dist(rng_));
}

std::string SymbolSource::digits(const Alphabet& alphabet, size_t count) {
  std::string s;
  s.reserve(count);
  for (size_t i = 0; i < count; ++i) s += pick(alphabet);
  return s;
}

// ============================================================================
// RandomGenerator
// ============================================================================

RandomGenerator::RandomGenerator(RandomConfig config, uint32_t seed)
    : config_(std::move(config)), source_(seed) {
  config_.payload_length = std::min(config_.payload_length, MAX_PAYLOAD_BYTES);
}

std::string RandomGenerator::random_id() {
  std::string id;
  id += source_.pick(Alphabet::lead_id());
  id += source_.digits(Alphabet::hex(), ID_DIGITS - 1);
  return id;
}

std::string RandomGenerator::random_payload(size_t bytes) {
  return source_.digits(Alphabet::hex(), std::min(bytes, MAX_PAYLOAD_BYTES) * 2);
}

NextStatus RandomGenerator::next(Directive& out) {
  out.arbitration_id = config_.static_id ? *config_.static_id : random_id();
  out.payload = config_.static_payload ? *config_.static_payload
                                       : random_payload(config_.payload_length);
  return NextStatus::Ok;
}

// ============================================================================
// LinearReplayGenerator
// ============================================================================

bool LinearReplayGenerator::open() {
  in_.open(path_);
  line_number_ = 0;
  if (!in_.is_open()) {
    last_error_ = "cannot open corpus file " + path_;
    return false;
  }
  return true;
}

NextStatus LinearReplayGenerator::next(Directive& out) {
  if (!in_.is_open()) {
    last_error_ = "corpus file " + path_ + " is not open";
    return NextStatus::InvalidDirective;
  }

  std::string line;
  if (!std::getline(in_, line)) return NextStatus::Exhausted;
  ++line_number_;

  // Every line is a directive; a blank one is as malformed as any other
  ParseError error = ParseError::None;
  if (!DirectiveCodec::parse(line, out, &error)) {
    last_error_ = path_ + ":" + std::to_string(line_number_) + ": " + to_string(error) +
                  " in \"" + line + "\"";
    return NextStatus::InvalidDirective;
  }
  return NextStatus::Ok;
}

// ============================================================================
// RingBruteForceGenerator
// ============================================================================

RingBruteForceGenerator::RingBruteForceGenerator(RingBruteForceConfig config)
    : config_(std::move(config)) {
  if (config_.brute_force_id) {
    id_bitmap_ = config_.id_bitmap ? *config_.id_bitmap : all_free(config_.id.size());
  }
  payload_bitmap_ = config_.payload_bitmap ? *config_.payload_bitmap
                                           : all_free(config_.initial_payload.size());

  const std::string id_part = mask(id_bitmap_, config_.id);
  const std::string payload_part = mask(payload_bitmap_, config_.initial_payload);
  id_free_ = id_part.size();

  std::vector<Alphabet> radix(id_part.size() + payload_part.size(), Alphabet::hex());
  if (id_free_ > 0 && id_bitmap_[0]) {
    radix[0] = Alphabet::lead_id();
  }

  ring_ = RingEnumerator::create(id_part + payload_part, radix);
  if (!ring_) {
    last_error_ = "brute force seed " + config_.id + "#" + config_.initial_payload +
                  " is not a valid starting point";
  }
}

Directive RingBruteForceGenerator::current() const {
  const std::string value = ring_->value();
  Directive d;
  d.arbitration_id = merge(value.substr(0, id_free_), config_.id, id_bitmap_);
  d.payload = merge(value.substr(id_free_), config_.initial_payload, payload_bitmap_);
  return d;
}

NextStatus RingBruteForceGenerator::next(Directive& out) {
  if (!ring_) return NextStatus::InvalidDirective;

  if (!started_) {
    started_ = true;
  } else if (ring_->advance() == AdvanceStatus::Exhausted) {
    return NextStatus::Exhausted;
  }
  out = current();
  return NextStatus::Ok;
}

// ============================================================================
// MutationGenerator
// ============================================================================

MutationGenerator::MutationGenerator(MutationConfig config, uint32_t seed)
    : config_(std::move(config)), source_(seed) {}

std::string MutationGenerator::mutate(const std::string& digits, const Bitmap& bitmap, bool is_id) {
  std::string masked = mask(bitmap, digits);
  for (size_t k = 0; k < masked.size(); ++k) {
    // Only the id's leading digit is narrowed to 0-7
    const bool lead = is_id && k == 0 && bitmap[0];
    masked[k] = source_.pick(lead ? Alphabet::lead_id() : Alphabet::hex());
  }
  return merge(masked, digits, bitmap);
}

NextStatus MutationGenerator::next(Directive& out) {
  out.arbitration_id = mutate(config_.id, config_.id_bitmap, true);
  out.payload = mutate(config_.payload, config_.payload_bitmap, false);
  return NextStatus::Ok;
}

} // namespace canfuzz
