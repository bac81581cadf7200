#include "proto/utf8.hpp"

namespace utf8
{

bool valid(std::string_view s)
{
    const auto       *p = reinterpret_cast<const unsigned char *>(s.data());
    const std::size_t n = s.size();
    std::size_t       i = 0;
    while (i < n)
    {
        const unsigned char c = p[i];
        if (c < 0x80)
        {
            i++;
            continue;
        }

        std::size_t   need = 0;
        unsigned char lo   = 0x80;  // allowed range of the 2nd byte
        unsigned char hi   = 0xBF;
        if (c >= 0xC2 && c <= 0xDF)
            need = 1;
        else if (c == 0xE0)
        {
            need = 2;
            lo   = 0xA0;  // no overlongs
        }
        else if (c == 0xED)
        {
            need = 2;
            hi   = 0x9F;  // no surrogates
        }
        else if (c >= 0xE1 && c <= 0xEF)
            need = 2;
        else if (c == 0xF0)
        {
            need = 3;
            lo   = 0x90;
        }
        else if (c >= 0xF1 && c <= 0xF3)
            need = 3;
        else if (c == 0xF4)
        {
            need = 3;
            hi   = 0x8F;  // <= U+10FFFF
        }
        else
            return false;  // 0x80..0xC1, 0xF5..0xFF

        if (i + need >= n)
            return false;  // truncated sequence
        if (p[i + 1] < lo || p[i + 1] > hi)
            return false;
        for (std::size_t k = 2; k <= need; k++)
        {
            if (!is_continuation(p[i + k]))
                return false;
        }
        i += need + 1;
    }
    return true;
}

std::size_t cut_point(std::string_view s, std::size_t start, std::size_t max_bytes)
{
    if (start >= s.size() || s.size() - start <= max_bytes)
        return s.size();

    std::size_t cut = start + max_bytes;
    // s[cut] is the first byte of the next fragment; it must start a code point
    while (cut > start && is_continuation(static_cast<unsigned char>(s[cut])))
        cut--;
    if (cut == start)
        return start + max_bytes;  // not UTF-8 at all; fall back to a byte cut
    return cut;
}

}  // namespace utf8
