#include <gtest/gtest.h>
#include <string>
#include "utils/Scrubber.hpp"
#include "utils/Utf8.hpp"

using namespace venue_guard;

namespace {

std::string clean(const std::string& s) {
    auto result = clean_input_string(s);
    EXPECT_TRUE(result.has_value()) << "unexpected UTF-8 rejection";
    return result.value_or("<invalid>");
}

}

TEST(ScrubberTest, passes_normal_text_through) {
    EXPECT_EQ("Hello, world!", clean("Hello, world!"));
    EXPECT_EQ("", clean(""));
    EXPECT_EQ("", clean("   "));
}

TEST(ScrubberTest, rejects_invalid_utf8) {
    EXPECT_FALSE(clean_input_string("Caf\xE9").has_value());
    EXPECT_FALSE(clean_input_string("\xC3").has_value());
    EXPECT_FALSE(clean_input_string("ok\x80ok").has_value());
    EXPECT_FALSE(clean_input_string("\xED\xA0\x80").has_value());
}

TEST(ScrubberTest, control_characters_become_spaces) {
    EXPECT_EQ("Hello World", clean(std::string("Hello\0World", 11)));
    EXPECT_EQ("Hello World", clean("Hello\x01World"));
    EXPECT_EQ("Hello World", clean("Hello\x08World"));
    EXPECT_EQ("Hello World", clean("Hello\x0BWorld"));
    EXPECT_EQ("Hello World", clean("Hello\x0CWorld"));
    EXPECT_EQ("Hello World", clean("Hello\x0EWorld"));
    EXPECT_EQ("Hello World", clean("Hello\x1FWorld"));
    EXPECT_EQ("Hello World", clean("Hello\x7FWorld"));
}

TEST(ScrubberTest, each_control_byte_maps_to_one_space) {
    for (int c = 0; c < 128; ++c) {
        if (c == 9 || c == 10 || c == 13 || (c >= 32 && c < 127)) continue;
        std::string input = "a";
        input += static_cast<char>(c);
        input += static_cast<char>(c);
        input += "b";
        EXPECT_EQ("a  b", clean(input)) << "byte " << c;
    }
}

TEST(ScrubberTest, tab_and_newline_are_kept) {
    EXPECT_EQ("a\tb", clean("a\tb"));
    EXPECT_EQ("a\nb", clean("a\nb"));
}

TEST(ScrubberTest, carriage_return_is_dropped) {
    EXPECT_EQ("HelloWorld", clean("Hello\rWorld"));
    EXPECT_EQ("Hello\nWorld", clean("Hello\r\nWorld"));
    EXPECT_EQ("", clean("\r\r\r"));
}

TEST(ScrubberTest, separators_and_direction_marks_are_dropped) {
    for (int trail = 0xA8; trail <= 0xAE; ++trail) {
        std::string input = "ab";
        input += "\xE2\x80";
        input += static_cast<char>(trail);
        input += "cd";
        EXPECT_EQ("abcd", clean(input)) << "trail " << trail;
    }
    // Neighbours of the range survive
    EXPECT_EQ("a\xE2\x80\xA7z", clean("a\xE2\x80\xA7z"));   // U+2027
    EXPECT_EQ("a\xE2\x80\xAFz", clean("a\xE2\x80\xAFz"));   // U+202F
    EXPECT_EQ("a\xE2\x81\xA8z", clean("a\xE2\x81\xA8z"));   // U+2068
}

TEST(ScrubberTest, vertical_line_combining_marks_are_dropped) {
    EXPECT_EQ("ab", clean("a\xCC\xB3" "b"));
    EXPECT_EQ("ab", clean("a\xCC\xBF" "b"));
    EXPECT_EQ("ab", clean("a\xCC\x8A" "b"));
    EXPECT_EQ("a\xCC\x81" "b", clean("a\xCC\x81" "b"));     // acute accent kept
}

TEST(ScrubberTest, multi_byte_characters_are_copied_whole) {
    std::string kremlin = "\xD0\x9A\xD1\x80\xD0\xB5\xD0\xBC\xD0\xBB\xD1\x8C";
    EXPECT_EQ(kremlin, clean(kremlin));
    EXPECT_EQ("\xE2\x82\xAC 5", clean("\xE2\x82\xAC\x01" "5"));
    EXPECT_EQ("pizza \xF0\x9F\x8D\x95", clean("pizza \xF0\x9F\x8D\x95"));
}

TEST(ScrubberTest, trims_leading_and_trailing_whitespace) {
    EXPECT_EQ("Hello", clean("  Hello  "));
    EXPECT_EQ("Hello", clean("\x01Hello\x02"));
    EXPECT_EQ("Hello", clean("\n\tHello\r\n"));
    EXPECT_EQ("Hello", clean("\xC2\xA0Hello\xE3\x80\x80"));
    EXPECT_EQ("a  b", clean(std::string("\x7F" "a \x1F" "b\0", 6)));
}

TEST(ScrubberTest, truncates_to_max_length_in_characters) {
    std::string ascii(MAX_STRING_LENGTH + 100, 'x');
    auto result = clean(ascii);
    EXPECT_EQ(MAX_STRING_LENGTH, result.size());

    std::string cyrillic;
    for (size_t i = 0; i < MAX_STRING_LENGTH + 10; ++i) cyrillic += "\xD0\x96";
    result = clean(cyrillic);
    EXPECT_EQ(MAX_STRING_LENGTH, utf8_length(result));
    EXPECT_EQ(2 * MAX_STRING_LENGTH, result.size());
    EXPECT_TRUE(check_utf8(result));
}

TEST(ScrubberTest, truncation_happens_before_trim) {
    std::string input(MAX_STRING_LENGTH - 1, 'x');
    input += "   tail";
    auto result = clean(input);
    EXPECT_EQ(MAX_STRING_LENGTH - 1, result.size());
    EXPECT_EQ('x', result.back());
}

TEST(ScrubberTest, removed_sequences_do_not_count_towards_limit) {
    std::string input;
    for (int i = 0; i < 100; ++i) input += "\xE2\x80\xAE";
    input += std::string(MAX_STRING_LENGTH, 'y');
    EXPECT_EQ(std::string(MAX_STRING_LENGTH, 'y'), clean(input));
}

TEST(ScrubberTest, cleaning_is_idempotent) {
    const std::string samples[] = {
        "Hello\r\nWorld",
        std::string("  \0Cafe\0Pushkin \x7F", 17),
        "\xE2\x80\xAE" "evil\xE2\x80\xAC text\xCC\xB3",
        "\t\xC2\xA0 mixed \x0B\x0C spaces \xE2\x80\x83",
        "\xD0\x9A\xD1\x80\xD0\xB5\xD0\xBC\xD0\xBB\xD1\x8C\r",
        std::string(MAX_STRING_LENGTH + 5, 'z'),
    };
    for (const auto& s : samples) {
        auto once = clean(s);
        EXPECT_EQ(once, clean(once));
    }
}

TEST(ScrubberTest, output_has_no_forbidden_bytes) {
    std::string input;
    for (int c = 1; c < 128; ++c) input += static_cast<char>(c);
    input += "\xE2\x80\xA8\xCC\xB3";
    auto result = clean(input);
    EXPECT_TRUE(check_utf8(result));
    for (unsigned char c : result) {
        EXPECT_NE('\r', c);
        EXPECT_FALSE(c < 32 && c != '\t' && c != '\n') << "byte " << int(c);
        EXPECT_NE(127, c);
    }
}

TEST(ScrubberTest, drops_marks_next_to_multibyte_text) {
    auto out = clean_input_string("\xD0\x9A\xCC\xB3\xE2\x80\xAE\xF0\x9F\x98\x80\xE2\x80\x94");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("\xD0\x9A\xF0\x9F\x98\x80\xE2\x80\x94", *out);
}
