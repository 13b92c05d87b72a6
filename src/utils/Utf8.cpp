#include "utils/Utf8.hpp"

namespace venue_guard {

namespace {

uint32_t byte_at(std::string_view str, size_t pos) {
    return static_cast<unsigned char>(str[pos]);
}

// Decodes the `len`-byte character starting at `pos`.
uint32_t decode_at(std::string_view str, size_t pos, size_t len) {
    uint32_t b0 = byte_at(str, pos);
    switch (len) {
        case 1: return b0;
        case 2: return ((b0 & 0x1Fu) << 6) | (byte_at(str, pos + 1) & 0x3Fu);
        case 3:
            return ((b0 & 0x0Fu) << 12) | ((byte_at(str, pos + 1) & 0x3Fu) << 6) |
                   (byte_at(str, pos + 2) & 0x3Fu);
        default:
            return ((b0 & 0x07u) << 18) | ((byte_at(str, pos + 1) & 0x3Fu) << 12) |
                   ((byte_at(str, pos + 2) & 0x3Fu) << 6) | (byte_at(str, pos + 3) & 0x3Fu);
    }
}

}

bool check_utf8(std::string_view str) {
    const size_t n = str.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t min_code;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
            min_code = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            min_code = 0x800;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            min_code = 0x10000;
        } else {
            // Stray continuation byte, 0xC0/0xC1 or 0xF5..0xFF
            return false;
        }

        if (n - i < len) return false;
        for (size_t k = 1; k < len; ++k) {
            if (!is_utf8_continuation(static_cast<unsigned char>(str[i + k]))) return false;
        }

        uint32_t code = decode_at(str, i, len);
        if (code < min_code) return false;                    // overlong
        if (code >= 0xD800 && code <= 0xDFFF) return false;   // surrogate
        if (code > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

size_t utf8_length(std::string_view str) {
    size_t count = 0;
    for (unsigned char c : str) {
        if (!is_utf8_continuation(c)) count++;
    }
    return count;
}

std::string_view utf8_truncate(std::string_view str, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if (is_utf8_continuation(static_cast<unsigned char>(str[i]))) continue;
        if (chars == max_chars) return str.substr(0, i);
        chars++;
    }
    return str;
}

bool is_unicode_space(uint32_t code) {
    if (code >= 0x09 && code <= 0x0D) return true;
    if (code >= 0x2000 && code <= 0x200A) return true;
    switch (code) {
        case 0x20:
        case 0x85:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return false;
    }
}

std::string_view utf8_trim(std::string_view str) {
    size_t begin = 0;
    size_t end = str.size();

    while (begin < end) {
        size_t len = utf8_char_length(static_cast<unsigned char>(str[begin]));
        if (begin + len > end || !is_unicode_space(decode_at(str, begin, len))) break;
        begin += len;
    }

    while (end > begin) {
        size_t start = end - 1;
        while (start > begin && is_utf8_continuation(static_cast<unsigned char>(str[start]))) start--;
        size_t len = end - start;
        if (utf8_char_length(static_cast<unsigned char>(str[start])) != len ||
            !is_unicode_space(decode_at(str, start, len))) break;
        end = start;
    }

    return str.substr(begin, end - begin);
}

}
