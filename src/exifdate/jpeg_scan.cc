#include "exifdate/jpeg_scan.h"

#include "tiff_bytes_internal.h"

#include <cstring>

namespace exifdate {
namespace {

    using detail::read_u16be;

    static constexpr char kExifHeader[6] = { 'E', 'x', 'i', 'f', '\0', '\0' };

    static bool match(std::span<const std::byte> bytes, uint64_t offset,
                      const char* lit, uint32_t lit_len) noexcept
    {
        if (offset + lit_len > bytes.size()) {
            return false;
        }
        return std::memcmp(bytes.data() + offset, lit, lit_len) == 0;
    }

}  // namespace

bool
has_jpeg_soi(std::span<const std::byte> bytes) noexcept
{
    uint16_t soi = 0;
    return read_u16be(bytes, 0, &soi) && soi == kJpegSoi;
}


JpegScanResult
scan_jpeg_exif(std::span<const std::byte> bytes) noexcept
{
    JpegScanResult result;
    if (!has_jpeg_soi(bytes)) {
        result.status = DateParseStatus::FormatError;
        return result;
    }

    uint64_t offset = 2;
    while (offset + 4 <= bytes.size()) {
        const uint64_t marker_off = offset;
        uint16_t marker           = 0;
        (void)read_u16be(bytes, offset, &marker);
        offset += 2;

        if (marker == kJpegEoi) {
            break;
        }
        if ((marker & 0xFF00U) != 0xFF00U) {
            break;
        }

        uint16_t seg_len = 0;
        (void)read_u16be(bytes, offset, &seg_len);

        if (marker == kJpegApp1) {
            const uint64_t payload_off = offset + 2;
            if (match(bytes, payload_off, kExifHeader, sizeof(kExifHeader))) {
                result.status         = DateParseStatus::Ok;
                result.tiff_offset    = payload_off + sizeof(kExifHeader);
                result.segment_offset = marker_off;
                result.segment_length = seg_len;
                return result;
            }
        }

        // The length counts its own two bytes, so this lands on the next marker.
        offset += seg_len;
    }

    result.status = DateParseStatus::SegmentError;
    return result;
}

}  // namespace exifdate
