#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace venue_guard {

// Upper bound, in characters, of any cleaned string.
constexpr size_t MAX_STRING_LENGTH = 35000;

// Byte-exact input string cleaner shared with peer clients.
//
// Returns std::nullopt if `str` is not valid UTF-8. Otherwise, in one pass:
//   - bytes 0-8, 11-12, 14-31 and 127 become a single space
//   - '\r' is dropped, '\t' and '\n' are kept
//   - U+2028..U+202E (E2 80 A8..AE) are dropped
//   - combining marks U+030A, U+0333, U+033F (CC 8A/B3/BF) are dropped
//   - every other character is copied as a whole
// then the result is cut to MAX_STRING_LENGTH characters and trimmed.
std::optional<std::string> clean_input_string(std::string_view str);

}
