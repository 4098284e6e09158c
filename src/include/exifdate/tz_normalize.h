#pragma once

#include "exifdate/date_field.h"
#include "exifdate/field_patch.h"

#include <cstdint>
#include <ctime>
#include <span>
#include <string>
#include <string_view>

/**
 * \file tz_normalize.h
 * \brief Civil/UTC reconciliation and the string formats used by editors.
 *
 * EXIF `DateTime*` values are civil wall-clock time and are only reformatted.
 * `GPSDateStamp`/`GPSTimeStamp` are UTC; they are shown and entered in the
 * host's local zone, using whatever zone rules the running system provides.
 *
 * Formats:
 * - EXIF wire: `YYYY:MM:DD HH:MM:SS`
 * - calendar: `YYYY-MM-DD`
 * - clock: `HH:MM:SS` (`HH:MM` accepted on input)
 * - combined civil: `YYYY-MM-DDTHH:MM:SS`
 */

namespace exifdate {

struct CivilDate final {
    int year  = 0;
    int month = 0;
    int day   = 0;

    bool operator==(const CivilDate&) const = default;
};

struct CivilTime final {
    int hour   = 0;
    int minute = 0;
    int second = 0;

    bool operator==(const CivilTime&) const = default;
};

struct CivilDateTime final {
    CivilDate date;
    CivilTime time;

    bool operator==(const CivilDateTime&) const = default;
};

struct NormalizeOptions final {
    /// Instant used when no date can be paired with a GPS time (0 = now).
    std::time_t now = 0;
};

/// Finds the first `YYYY:MM:DD` in \p s.
bool
find_exif_date(std::string_view s, CivilDate* out) noexcept;

/// Finds the first `YYYY:MM:DD[ ]HH:MM[:SS]` in \p s (seconds default to 0).
bool
find_exif_datetime(std::string_view s, CivilDateTime* out) noexcept;

/// Parses calendar `YYYY-MM-DD`.
bool
parse_input_date(std::string_view s, CivilDate* out) noexcept;

/// Parses clock `HH:MM` or `HH:MM:SS`.
bool
parse_input_time(std::string_view s, CivilTime* out) noexcept;

/// Parses `YYYY-MM-DDTHH:MM[:SS]`; a bare calendar date means midnight.
bool
parse_input_datetime(std::string_view s, CivilDateTime* out) noexcept;

std::string
format_exif_date(const CivilDate& d);
std::string
format_exif_datetime(const CivilDateTime& dt);
std::string
format_input_date(const CivilDate& d);
std::string
format_input_time(const CivilTime& t);
std::string
format_input_datetime(const CivilDateTime& dt);

/// EXIF wire datetime -> combined civil form, or empty if it does not parse.
std::string
to_input_datetime(std::string_view exif);
/// EXIF wire date -> calendar form, or empty.
std::string
to_input_date(std::string_view exif);
/// `[h, m, s]` quotients -> clock form, or empty unless exactly 3 values.
std::string
to_input_time(std::span<const double> hms);

/// Combined civil form -> EXIF wire datetime, or empty.
std::string
from_input_datetime(std::string_view input);
/// Calendar form -> EXIF wire date (`YYYY:MM:DD`), or empty.
std::string
from_input_date(std::string_view input);
/// Clock form -> GPS time; false if it does not parse.
bool
from_input_time(std::string_view input, GpsTime* out) noexcept;

/// Interprets \p utc as UTC and converts it to the host's local zone.
bool
utc_to_local(const CivilDateTime& utc, CivilDateTime* local) noexcept;

/// Interprets \p local in the host's zone and converts it to UTC.
bool
local_to_utc(const CivilDateTime& local, CivilDateTime* utc) noexcept;

/**
 * \brief Picks the UTC date a GPS time in \p field is paired with.
 *
 * Priority: the GPSDateStamp field, a datetime field in the same IFD as
 * \p field, any datetime field, then the local date of `options.now`.
 */
CivilDate
gps_reference_date(std::span<const DateField> fields, const DateField& field,
                   const NormalizeOptions& options);

/**
 * \brief Builds the UTC instant shared by the GPS date and time fields.
 *
 * Date from \ref gps_reference_date, time from the stored GPSTimeStamp
 * (midnight when there is none).
 */
CivilDateTime
gps_utc_instant(std::span<const DateField> fields, const DateField& field,
                const NormalizeOptions& options);

/// Returns the editor string for \p field (local time for GPS fields).
std::string
display_value(const DateField& field, std::span<const DateField> fields,
              const NormalizeOptions& options);

/**
 * \brief Converts editor input back into a patchable value.
 *
 * Empty or unparsable input yields `std::monostate` (left unchanged).
 * GPS input is local time and is converted back to UTC.
 */
FieldEdit
encode_edit(const DateField& field, std::span<const DateField> fields,
            std::string_view input, const NormalizeOptions& options);

/// Patchable values for the GPSDateStamp/GPSTimeStamp pair.
struct GpsPairEdit final {
    FieldEdit date;
    FieldEdit time;
};

/**
 * \brief Encodes local GPS date and time input as one UTC instant.
 *
 * A component whose input is empty or does not parse keeps its displayed
 * local value. When either input parses, every GPS field present in
 * \p fields gets a value taken from the same converted instant, so a UTC day
 * change is carried into the date as well as the time.
 */
GpsPairEdit
encode_gps_pair(std::span<const DateField> fields, std::string_view date_input,
                std::string_view time_input, const NormalizeOptions& options);

}  // namespace exifdate
