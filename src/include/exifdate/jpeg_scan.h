#pragma once

#include "exifdate/date_field.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file jpeg_scan.h
 * \brief Locates the EXIF TIFF header inside a JPEG byte stream.
 */

namespace exifdate {

inline constexpr uint16_t kJpegSoi  = 0xFFD8;
inline constexpr uint16_t kJpegEoi  = 0xFFD9;
inline constexpr uint16_t kJpegApp1 = 0xFFE1;

struct JpegScanResult final {
    DateParseStatus status = DateParseStatus::Ok;
    /// Absolute offset of the TIFF header (valid when status is Ok).
    uint64_t tiff_offset = 0;
    /// Absolute offset of the APP1 marker that carried it.
    uint64_t segment_offset = 0;
    uint16_t segment_length = 0;
};

/// Returns true if \p bytes begins with the JPEG SOI marker.
bool
has_jpeg_soi(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Walks JPEG marker/length pairs up to the first APP1 `Exif\0\0` segment.
 *
 * Any pair whose high byte is not `0xFF`, the EOI marker, or running out of
 * bytes ends the walk with \ref DateParseStatus::SegmentError. Only the first
 * matching APP1 segment is reported.
 */
JpegScanResult
scan_jpeg_exif(std::span<const std::byte> bytes) noexcept;

}  // namespace exifdate
