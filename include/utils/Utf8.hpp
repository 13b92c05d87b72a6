#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace venue_guard {

// Strict RFC 3629 check: no overlongs, no surrogates, nothing above U+10FFFF.
bool check_utf8(std::string_view str);

// Byte length of the character starting with `lead` (1 for non-lead bytes).
inline size_t utf8_char_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

inline bool is_utf8_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Number of code points. Assumes valid UTF-8.
size_t utf8_length(std::string_view str);

// Longest prefix holding at most max_chars whole characters.
std::string_view utf8_truncate(std::string_view str, size_t max_chars);

// Unicode White_Space property.
bool is_unicode_space(uint32_t code);

// Strips leading and trailing White_Space characters. Assumes valid UTF-8.
std::string_view utf8_trim(std::string_view str);

}
