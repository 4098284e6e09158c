#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * \file date_field.h
 * \brief Editable EXIF date/time field descriptors and decoded tag values.
 */

namespace exifdate {

/// Extraction status shared by the JPEG scanner and the TIFF reader.
enum class DateParseStatus : uint8_t {
    Ok,
    /// The buffer does not start with the JPEG SOI marker (FFD8).
    FormatError,
    /// No APP1 segment carrying an `Exif\0\0` header was found.
    SegmentError,
    /// Bad TIFF byte-order mark or magic, or a directory/value out of range.
    HeaderError,
};

/// TIFF wire type codes understood by the reader.
enum class TiffType : uint16_t {
    Ascii    = 2,
    Short    = 3,
    Long     = 4,
    Rational = 5,
};

enum class ByteOrder : uint8_t {
    LittleEndian,
    BigEndian,
};

/// The directory a field was found in.
enum class IfdKind : uint8_t {
    Ifd0,
    Exif,
    Gps,
};

/// How a field is presented and edited.
enum class FieldKind : uint8_t {
    Date,
    Time,
    DateTime,
};

/// Tag ids of the date/time whitelist and the pointer tags leading to it.
namespace tags {
    inline constexpr uint16_t kDateTime          = 0x0132;
    inline constexpr uint16_t kExifIfdPointer    = 0x8769;
    inline constexpr uint16_t kGpsIfdPointer     = 0x8825;
    inline constexpr uint16_t kDateTimeOriginal  = 0x9003;
    inline constexpr uint16_t kDateTimeDigitized = 0x9004;
    inline constexpr uint16_t kGpsTimeStamp      = 0x0007;
    inline constexpr uint16_t kGpsDateStamp      = 0x001D;
}  // namespace tags

struct URational final {
    uint32_t numer = 0;
    uint32_t denom = 0;

    bool operator==(const URational&) const = default;
};

/// ASCII payload decoded up to the first NUL or `count` bytes.
struct AsciiValue final {
    std::string text;

    bool operator==(const AsciiValue&) const = default;
};

/// `count` consecutive unsigned rationals.
struct RationalValue final {
    std::vector<URational> parts;

    bool operator==(const RationalValue&) const = default;
};

/// TIFF-relative offset of a sub-IFD (ExifIFDPointer / GPSInfoIFDPointer).
struct DirectoryPointer final {
    uint32_t offset = 0;

    bool operator==(const DirectoryPointer&) const = default;
};

/// Decoded tag payload. `std::monostate` marks entries read structurally only.
using TagValue
    = std::variant<std::monostate, AsciiValue, RationalValue, DirectoryPointer>;

/// One 12-byte IFD entry as located in the original buffer.
struct IfdEntry final {
    uint16_t tag   = 0;
    uint16_t type  = 0;
    uint32_t count = 0;
    /// Absolute offset of the raw value bytes (inline slot or dereferenced).
    uint64_t value_offset = 0;
    TagValue value;
};

/**
 * \brief An editable date/time field.
 *
 * `value_offset` is absolute within the file buffer the field was read from
 * and stays valid for every buffer with the same layout (the session's
 * working copy).
 */
struct DateField final {
    std::string_view label;
    std::string_view name;
    IfdKind ifd     = IfdKind::Ifd0;
    uint16_t tag    = 0;
    uint16_t type   = 0;
    uint32_t count  = 0;
    uint32_t value_offset = 0;
    TagValue value;
    FieldKind kind  = FieldKind::DateTime;
    ByteOrder order = ByteOrder::LittleEndian;

    bool operator==(const DateField&) const = default;
};

/// Returns "0th", "Exif" or "GPS".
std::string_view
ifd_name(IfdKind ifd) noexcept;

/// Returns "date", "time" or "datetime".
std::string_view
field_kind_name(FieldKind kind) noexcept;

/// Returns a short status name ("ok", "format_error", ...).
std::string_view
parse_status_name(DateParseStatus status) noexcept;

/// Returns `numer/denom`, or 0 when the denominator is 0.
double
rational_quotient(URational r) noexcept;

/// Returns the quotient of every part of \p value, in order.
std::vector<double>
rational_quotients(const RationalValue& value);

/// True for the GPS UTC fields (GPSDateStamp / GPSTimeStamp).
bool
is_gps_utc_field(const DateField& field) noexcept;

}  // namespace exifdate
