#include "exifdate/console_format.h"

namespace exifdate {
namespace {

    static constexpr char kHexDigits[] = "0123456789ABCDEF";

    static void append_hex_pair(uint8_t v, std::string* out) noexcept
    {
        out->push_back(kHexDigits[(v >> 4U) & 0x0FU]);
        out->push_back(kHexDigits[v & 0x0FU]);
    }

    static uint32_t clamp_len(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return static_cast<uint32_t>(size);
        }
        return max_bytes;
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    const uint32_t n = clamp_len(s.size(), max_bytes);
    bool escaped     = false;

    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t c = static_cast<uint8_t>(s[i]);
        switch (c) {
        case '\\': out->append("\\\\"); continue;
        case '"': out->append("\\\""); continue;
        case '\n': out->append("\\n"); escaped = true; continue;
        case '\r': out->append("\\r"); escaped = true; continue;
        case '\t': out->append("\\t"); escaped = true; continue;
        default: break;
        }
        if (c < 0x20U || c >= 0x7FU) {
            out->append("\\x");
            append_hex_pair(c, out);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    const uint32_t n = clamp_len(bytes.size(), max_bytes);
    for (uint32_t i = 0; i < n; ++i) {
        if (i != 0U) {
            out->push_back(' ');
        }
        append_hex_pair(static_cast<uint8_t>(bytes[i]), out);
    }
    if (n < bytes.size()) {
        out->append(" ...");
    }
}

bool
is_seven_bit_ascii(std::string_view s) noexcept
{
    for (char c : s) {
        if (static_cast<uint8_t>(c) >= 0x80U) {
            return false;
        }
    }
    return true;
}

}  // namespace exifdate
