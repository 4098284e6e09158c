#include "exifdate/console_format.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace exifdate {
namespace {

    static std::vector<std::byte> bytes_of(std::string_view s)
    {
        std::vector<std::byte> out;
        for (char c : s) {
            out.push_back(std::byte { static_cast<uint8_t>(c) });
        }
        return out;
    }


    TEST(ConsoleFormat, EscapesControlBytes)
    {
        std::string out;
        EXPECT_FALSE(append_console_escaped_ascii("2024:03:15", 0, &out));
        EXPECT_EQ(out, "2024:03:15");

        out.clear();
        EXPECT_TRUE(append_console_escaped_ascii(
            std::string_view("a\nb\x1b[0m\xff", 8), 0, &out));
        EXPECT_EQ(out, "a\\nb\\x1B[0m\\xFF");

        out.clear();
        EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
        EXPECT_EQ(out, "abc...");
    }


    TEST(ConsoleFormat, FormatsHexBytes)
    {
        std::string out;
        append_hex_bytes(bytes_of("2024"), 0, &out);
        EXPECT_EQ(out, "32 30 32 34");

        out.clear();
        append_hex_bytes(bytes_of("2024"), 2, &out);
        EXPECT_EQ(out, "32 30 ...");
    }


    TEST(ConsoleFormat, DetectsHighBytes)
    {
        EXPECT_TRUE(is_seven_bit_ascii("2024:03:15 14:30:45"));
        EXPECT_TRUE(is_seven_bit_ascii(""));
        EXPECT_FALSE(is_seven_bit_ascii(std::string_view("2024:03:15\xe9", 11)));
        EXPECT_FALSE(is_seven_bit_ascii(std::string_view("\x80", 1)));
    }

}  // namespace
}  // namespace exifdate
