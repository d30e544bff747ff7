#include "utf8.hpp"

#include <cstdint>

namespace docflow::util {
namespace {

// Length of the sequence starting with lead byte `c`, 0 if `c` cannot start one.
std::size_t SequenceLength(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return 2;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return 4;
  return 0;
}

std::size_t NextBoundary(std::string_view text, std::size_t pos) {
  auto len = SequenceLength(static_cast<unsigned char>(text[pos]));
  if (len == 0 || pos + len > text.size()) return pos + 1;
  for (std::size_t i = 1; i < len; ++i) {
    if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) return pos + 1;
  }
  return pos + len;
}

} // namespace

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto c   = static_cast<unsigned char>(text[i]);
    const auto len = SequenceLength(c);
    if (len == 0 || i + len > text.size()) return false;

    uint32_t cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
    for (std::size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
  }
  return true;
}

std::size_t CodePointCount(std::string_view text) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < text.size(); i = NextBoundary(text, i)) {
    ++count;
  }
  return count;
}

std::string TruncateCodePoints(std::string_view text, std::size_t max_code_points) {
  std::size_t pos   = 0;
  std::size_t count = 0;
  while (pos < text.size() && count < max_code_points) {
    pos = NextBoundary(text, pos);
    ++count;
  }
  return std::string(text.substr(0, pos));
}

} // namespace docflow::util
