#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docflow::util {

// Strict UTF-8 check (no overlong forms, no surrogates, max U+10FFFF).
bool IsValidUtf8(std::string_view text);

// Number of code points; invalid bytes count as one each.
std::size_t CodePointCount(std::string_view text);

// Prefix of `text` holding at most `max_code_points` code points.
// Never splits a multi-byte sequence.
std::string TruncateCodePoints(std::string_view text, std::size_t max_code_points);

} // namespace docflow::util
