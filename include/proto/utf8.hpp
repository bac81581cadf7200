#pragma once
#include <cstddef>
#include <string_view>

namespace utf8
{

// True when `s` is well-formed UTF-8 (no overlongs, no surrogates, <= U+10FFFF)
bool valid(std::string_view s);

// True when s[pos] is a continuation byte (10xxxxxx)
inline bool is_continuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

// Largest cut <= start + max_bytes that does not land inside a code point.
// Returns s.size() when the rest fits. Never returns start unless max_bytes == 0.
std::size_t cut_point(std::string_view s, std::size_t start, std::size_t max_bytes);

}  // namespace utf8
