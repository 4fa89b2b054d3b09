#include "bitmap.hpp"
#include <algorithm>
#include <cctype>

namespace canfuzz {

std::string mask(const Bitmap& bitmap, const std::string& digits) {
  std::string masked;
  const size_t n = std::min(bitmap.size(), digits.size());
  for (size_t i = 0; i < n; ++i) {
    if (bitmap[i]) masked += digits[i];
  }
  return masked;
}

std::string merge(const std::string& masked, const std::string& digits, const Bitmap& bitmap) {
  std::string result = digits;
  size_t next = 0;
  const size_t n = std::min(bitmap.size(), digits.size());
  for (size_t i = 0; i < n && next < masked.size(); ++i) {
    if (bitmap[i]) result[i] = masked[next++];
  }
  return result;
}

size_t free_positions(const Bitmap& bitmap, size_t length) {
  const size_t n = std::min(bitmap.size(), length);
  return static_cast<size_t>(std::count(bitmap.begin(), bitmap.begin() + n, true));
}

Bitmap all_free(size_t length) {
  return Bitmap(length, true);
}

bool parse_bitmap(const std::string& text, Bitmap& out) {
  Bitmap result;
  std::string token;

  auto flush = [&]() -> bool {
    if (token.empty()) return true;
    std::string lower;
    for (char c : token) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    token.clear();
    if (lower == "true" || lower == "1" || lower == "t") { result.push_back(true); return true; }
    if (lower == "false" || lower == "0" || lower == "f") { result.push_back(false); return true; }
    return false;
  };

  for (char c : text) {
    if (c == ',' || c == '[' || c == ']' || std::isspace(static_cast<unsigned char>(c))) {
      if (!flush()) return false;
    } else {
      token += c;
    }
  }
  if (!flush()) return false;
  if (result.empty()) return false;

  out = result;
  return true;
}

std::string to_string(const Bitmap& bitmap) {
  std::string s;
  for (size_t i = 0; i < bitmap.size(); ++i) {
    if (i) s += ',';
    s += bitmap[i] ? "True" : "False";
  }
  return s;
}

} // namespace canfuzz
