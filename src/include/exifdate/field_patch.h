#pragma once

#include "exifdate/byte_arena.h"
#include "exifdate/date_field.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

/**
 * \file field_patch.h
 * \brief Writes edited date/time values back into their original byte range.
 */

namespace exifdate {

/// GPS time as whole `{hour, minute, second}`, stored as three `x/1` rationals.
using GpsTime = std::array<uint32_t, 3>;

/**
 * \brief A new value for one field.
 *
 * `std::monostate` and an empty string mean "unchanged". A string is written
 * to ASCII fields (EXIF wire format), a \ref GpsTime to the GPS time field.
 */
using FieldEdit = std::variant<std::monostate, std::string, GpsTime>;

enum class PatchStatus : uint8_t {
    /// The value was written in full.
    Written,
    /// The value was written but its tail was cut to fit `count - 1` bytes.
    Truncated,
    /// Empty edit; the original bytes were left untouched.
    Skipped,
    /// The edit shape does not match the field's wire type/count.
    ShapeMismatch,
    /// The field's byte range is not inside the working buffer.
    OutOfRange,
};

struct PatchResult final {
    PatchStatus status     = PatchStatus::Skipped;
    uint32_t bytes_written = 0;
    /// Bytes of the replacement string that did not fit.
    uint32_t bytes_dropped = 0;
};

/**
 * \brief Writes \p text over the `count` ASCII bytes at \p value_offset.
 *
 * At most `count - 1` bytes of \p text are kept, a NUL follows immediately and
 * the rest of the reserved bytes are zeroed.
 */
PatchResult
patch_ascii(FixedByteArena& working, uint32_t value_offset, uint32_t count,
            std::string_view text) noexcept;

/// Writes three `(x, 1)` rational pairs at \p value_offset in \p order.
PatchResult
patch_gps_time(FixedByteArena& working, ByteOrder order, uint32_t value_offset,
               const GpsTime& hms) noexcept;

/**
 * \brief Applies \p edit to \p working at the location recorded in \p field.
 *
 * Never resizes the buffer and never changes the entry's count. Shape or
 * range violations leave the buffer untouched.
 */
PatchResult
patch_field(FixedByteArena& working, const DateField& field,
            const FieldEdit& edit) noexcept;

/// Returns a short status name ("written", "truncated", ...).
std::string_view
patch_status_name(PatchStatus status) noexcept;

}  // namespace exifdate
