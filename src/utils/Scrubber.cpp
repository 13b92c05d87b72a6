#include "utils/Scrubber.hpp"
#include "utils/Utf8.hpp"

namespace venue_guard {

namespace {

bool is_replaced_control(unsigned char c) {
    return c <= 8 || c == 11 || c == 12 || (c >= 14 && c <= 31) || c == 127;
}

}

std::optional<std::string> clean_input_string(std::string_view str) {
    if (!check_utf8(str)) {
        return std::nullopt;
    }

    const size_t n = str.size();

    std::string out;
    out.reserve(n);

    auto byte_at = [&str](size_t pos) { return static_cast<unsigned char>(str[pos]); };

    size_t i = 0;
    while (i < n) {
        unsigned char c = byte_at(i);

        if (c == '\r') {
            i++;
            continue;
        }
        if (is_replaced_control(c)) {
            out += ' ';
            i++;
            continue;
        }
        // Line/paragraph separators and bidi embedding marks
        if (c == 0xE2 && i + 2 < n && byte_at(i + 1) == 0x80 && byte_at(i + 2) >= 0xA8 && byte_at(i + 2) <= 0xAE) {
            i += 3;
            continue;
        }
        // Vertical-line combining marks
        if (c == 0xCC && i + 1 < n && (byte_at(i + 1) == 0xB3 || byte_at(i + 1) == 0xBF || byte_at(i + 1) == 0x8A)) {
            i += 2;
            continue;
        }

        // Input is valid UTF-8, so the whole character is in range.
        size_t len = utf8_char_length(c);
        out.append(str.data() + i, len);
        i += len;
    }

    std::string_view result = utf8_truncate(out, MAX_STRING_LENGTH);
    return std::string(utf8_trim(result));
}

}
