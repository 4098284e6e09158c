#pragma once

#include "exifdate/date_field.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file tiff_dir_read.h
 * \brief TIFF header + IFD reader that extracts the EXIF date/time whitelist.
 */

namespace exifdate {

/// Parsed 8-byte TIFF header.
struct TiffHeader final {
    ByteOrder order = ByteOrder::LittleEndian;
    /// Absolute offset of the header (all TIFF offsets are relative to it).
    uint64_t offset = 0;
    /// TIFF-relative offset of the 0th IFD.
    uint32_t first_ifd = 0;
};

/// Result of reading one directory.
struct IfdReadResult final {
    DateParseStatus status = DateParseStatus::Ok;
    uint32_t entries_read  = 0;
    /// TIFF-relative next-IFD offset (read but never followed).
    uint32_t next_ifd = 0;
};

/// Aggregated statistics for \ref read_date_fields.
struct DirectoryReadResult final {
    DateParseStatus status = DateParseStatus::Ok;
    ByteOrder order        = ByteOrder::LittleEndian;
    uint32_t ifds_read     = 0;
    uint32_t entries_read  = 0;
};

/**
 * \brief Validates the byte-order mark and magic number at \p tiff_offset.
 *
 * Accepts `II` and `MM`; the magic (42) is read with the detected byte order.
 * Anything else, or fewer than 8 bytes, is \ref DateParseStatus::HeaderError.
 */
DateParseStatus
read_tiff_header(std::span<const std::byte> bytes, uint64_t tiff_offset,
                 TiffHeader* out) noexcept;

/**
 * \brief Reads the IFD at absolute offset \p ifd_offset.
 *
 * Every entry is appended to \p out. ASCII and RATIONAL entries get decoded
 * values, ExifIFDPointer/GPSInfoIFDPointer entries stored as SHORT or LONG get
 * a \ref DirectoryPointer, everything else is read structurally only.
 * An entry table or value range that runs past the buffer end is a
 * \ref DateParseStatus::HeaderError.
 */
IfdReadResult
read_ifd(std::span<const std::byte> bytes, const TiffHeader& header,
         uint64_t ifd_offset, std::vector<IfdEntry>* out);

/**
 * \brief Extracts the date/time fields of the 0th, Exif and GPS IFDs.
 *
 * Sub-IFDs are reached only through the pointer tags of the 0th IFD; the
 * next-IFD chain (thumbnail) is never followed. On failure \p out is left
 * empty: either the complete field list is produced or none.
 */
DirectoryReadResult
read_date_fields(std::span<const std::byte> bytes, uint64_t tiff_offset,
                 std::vector<DateField>* out);

/// Scans a JPEG buffer for its EXIF segment and calls \ref read_date_fields.
DirectoryReadResult
extract_date_fields(std::span<const std::byte> jpeg_bytes,
                    std::vector<DateField>* out);

}  // namespace exifdate
