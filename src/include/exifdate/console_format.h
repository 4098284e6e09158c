#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace exifdate {

// Appends a terminal-safe copy of an EXIF string into `out`.
//
// Control bytes, DEL and bytes >= 0x80 become `\xNN`; `\n`, `\r`, `\t`, `"`
// and `\` get C escapes. At most `max_bytes` input bytes are used
// (0 = unlimited), with "..." appended when cut.
//
// Returns true when anything was escaped or cut.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Returns true when every byte of `s` is below 0x80.
bool
is_seven_bit_ascii(std::string_view s) noexcept;

// Appends uppercase hex pairs separated by spaces (e.g. "32 30 32 34").
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

}  // namespace exifdate
