#ifndef CANFUZZ_DIRECTIVE_HPP
#define CANFUZZ_DIRECTIVE_HPP

/**
 * @file directive.hpp
 * @brief Directive model and its textual codec
 *
 * A directive is one (arbitration id, payload) pair, written the way cansend
 * takes it:
 *
 *   <id>#<payload>\n        e.g. "123#FFFFFFFF\n"
 *
 * - id:      3 upper-case hex digits, leading digit 0-7 (11-bit identifier)
 * - payload: 0-16 upper-case hex digits, even length (one pair per byte)
 *
 * Input is lenient: "0x123#0xFF 0xFF 0xFF 0xFF" (the notation the older
 * tooling produced), lower-case digits and short ids ("7#00") are accepted
 * and normalized. Output is always the canonical compact form.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace canfuzz {

constexpr size_t ID_DIGITS = 3;
constexpr size_t MAX_PAYLOAD_DIGITS = 16;
constexpr size_t MAX_PAYLOAD_BYTES = MAX_PAYLOAD_DIGITS / 2;
constexpr uint32_t MAX_ARBITRATION_ID = 0x7FF;
constexpr char DIRECTIVE_DELIMITER = '#';

struct Directive {
  std::string arbitration_id; ///< Always ID_DIGITS hex digits
  std::string payload;        ///< Even length, at most MAX_PAYLOAD_DIGITS

  bool operator==(const Directive& other) const {
    return arbitration_id == other.arbitration_id && payload == other.payload;
  }
  bool operator!=(const Directive& other) const { return !(*this == other); }
};

enum class ParseError : uint8_t {
  None,
  MissingDelimiter,  ///< No '#' in the line
  InvalidId,         ///< Empty, too long or non-hex id
  IdOutOfRange,      ///< Id above 0x7FF
  InvalidPayload,    ///< Non-hex payload digits or malformed byte token
  OddPayloadLength,  ///< Payload does not split into whole bytes
  PayloadTooLong     ///< More than 8 bytes
};

const char* to_string(ParseError error);

class DirectiveCodec {
public:
  /// Parse "<id>#<payload>" (trailing CR/LF allowed) into a directive.
  /// Splits on the first '#'. Leaves out untouched on failure.
  static bool parse(const std::string& line, Directive& out, ParseError* error = nullptr);

  /// Render "<id>#<payload>\n"
  static std::string format(const Directive& directive);

  /// Same as format() without the trailing newline
  static std::string to_text(const Directive& directive);

  /// Validate and normalize a standalone id ("123", "0x7df", "5")
  static bool parse_id(const std::string& text, std::string& id, ParseError* error = nullptr);

  /// Validate and normalize a standalone payload ("FFFF", "0xFF 0xFF", "")
  static bool parse_payload(const std::string& text, std::string& payload, ParseError* error = nullptr);

  /// Numeric 11-bit identifier of a canonical directive
  static uint32_t arbitration_id(const Directive& directive);

  /// Payload bytes of a canonical directive
  static std::vector<uint8_t> payload_bytes(const Directive& directive);

  /// Upper-case hex string of bytes, two digits per byte
  static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
};

} // namespace canfuzz

#endif // CANFUZZ_DIRECTIVE_HPP
