#include "directive.hpp"
#include "alphabet.hpp"
#include <cctype>
#include <sstream>

namespace canfuzz {

namespace {

std::string strip_line_end(const std::string& line) {
  size_t end = line.size();
  while (end > 0 && (line[end - 1] == '\n' || line[end - 1] == '\r')) --end;
  return line.substr(0, end);
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string strip_hex_prefix(const std::string& s) {
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) return s.substr(2);
  return s;
}

// Upper-cases s in place; false if any character is not a hex digit
bool normalize_hex(std::string& s) {
  for (char& c : s) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return true;
}

uint8_t hex_value(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  return 0;
}

bool fail(ParseError* error, ParseError code) {
  if (error) *error = code;
  return false;
}

} // namespace

const char* to_string(ParseError error) {
  switch (error) {
    case ParseError::None:             return "ok";
    case ParseError::MissingDelimiter: return "missing '#' delimiter";
    case ParseError::InvalidId:        return "arbitration id must be 1-3 hex digits";
    case ParseError::IdOutOfRange:     return "arbitration id exceeds 0x7FF";
    case ParseError::InvalidPayload:   return "payload contains non-hex data";
    case ParseError::OddPayloadLength: return "payload length must be even";
    case ParseError::PayloadTooLong:   return "payload exceeds 8 bytes";
  }
  return "unknown error";
}

bool DirectiveCodec::parse_id(const std::string& text, std::string& id, ParseError* error) {
  std::string digits = strip_hex_prefix(trim(text));
  if (digits.empty() || digits.size() > ID_DIGITS || !normalize_hex(digits)) {
    return fail(error, ParseError::InvalidId);
  }
  digits.insert(0, ID_DIGITS - digits.size(), '0');
  if (!Alphabet::lead_id().contains(digits[0])) {
    return fail(error, ParseError::IdOutOfRange);
  }
  id = digits;
  return true;
}

bool DirectiveCodec::parse_payload(const std::string& text, std::string& payload, ParseError* error) {
  std::istringstream iss(text);
  std::vector<std::string> tokens;
  std::string token;
  while (iss >> token) tokens.push_back(token);

  std::string digits;
  if (tokens.size() == 1) {
    // Compact form: "FFFF" or "0xFFFF"
    digits = strip_hex_prefix(tokens[0]);
    if (digits.empty() || !normalize_hex(digits)) return fail(error, ParseError::InvalidPayload);
  } else {
    // Byte-token form: "0xFF 0x1 AB"
    for (const auto& t : tokens) {
      std::string byte = strip_hex_prefix(t);
      if (byte.empty() || byte.size() > 2 || !normalize_hex(byte)) {
        return fail(error, ParseError::InvalidPayload);
      }
      if (byte.size() == 1) byte.insert(0, 1, '0');
      digits += byte;
    }
  }

  if (digits.size() % 2 != 0) return fail(error, ParseError::OddPayloadLength);
  if (digits.size() > MAX_PAYLOAD_DIGITS) return fail(error, ParseError::PayloadTooLong);

  payload = digits;
  return true;
}

bool DirectiveCodec::parse(const std::string& line, Directive& out, ParseError* error) {
  const std::string text = strip_line_end(line);
  const size_t pos = text.find(DIRECTIVE_DELIMITER);
  if (pos == std::string::npos) return fail(error, ParseError::MissingDelimiter);

  Directive d;
  if (!parse_id(text.substr(0, pos), d.arbitration_id, error)) return false;
  if (!parse_payload(text.substr(pos + 1), d.payload, error)) return false;

  out = d;
  if (error) *error = ParseError::None;
  return true;
}

std::string DirectiveCodec::to_text(const Directive& directive) {
  return directive.arbitration_id + DIRECTIVE_DELIMITER + directive.payload;
}

std::string DirectiveCodec::format(const Directive& directive) {
  return to_text(directive) + "\n";
}

uint32_t DirectiveCodec::arbitration_id(const Directive& directive) {
  uint32_t id = 0;
  for (char c : directive.arbitration_id) {
    id = (id << 4) | hex_value(c);
  }
  return id & MAX_ARBITRATION_ID;
}

std::vector<uint8_t> DirectiveCodec::payload_bytes(const Directive& directive) {
  std::vector<uint8_t> bytes;
  bytes.reserve(directive.payload.size() / 2);
  for (size_t i = 0; i + 1 < directive.payload.size(); i += 2) {
    bytes.push_back(static_cast<uint8_t>((hex_value(directive.payload[i]) << 4) |
                                         hex_value(directive.payload[i + 1])));
  }
  return bytes;
}

std::string DirectiveCodec::bytes_to_hex(const std::vector<uint8_t>& bytes) {
  static const char* digits = "0123456789ABCDEF";
  std::string result;
  result.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    result += digits[b >> 4];
    result += digits[b & 0x0F];
  }
  return result;
}

} // namespace canfuzz
