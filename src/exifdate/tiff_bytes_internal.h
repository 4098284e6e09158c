#pragma once

#include "exifdate/date_field.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace exifdate::detail {

inline constexpr uint8_t
u8(std::byte b) noexcept
{
    return static_cast<uint8_t>(b);
}


inline bool
read_u16be(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (offset + 2 > bytes.size()) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 8U)
                                 | (u8(bytes[offset + 1]) << 0U));
    return true;
}


inline bool
read_u16le(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (offset + 2 > bytes.size()) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 0U)
                                 | (u8(bytes[offset + 1]) << 8U));
    return true;
}


inline bool
read_u32be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (offset + 4 > bytes.size()) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24U)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16U)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8U)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0U);
    return true;
}


inline bool
read_u32le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (offset + 4 > bytes.size()) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0U)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8U)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16U)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24U);
    return true;
}


inline bool
read_tiff_u16(ByteOrder order, std::span<const std::byte> bytes,
              uint64_t offset, uint16_t* out) noexcept
{
    if (order == ByteOrder::LittleEndian) {
        return read_u16le(bytes, offset, out);
    }
    return read_u16be(bytes, offset, out);
}


inline bool
read_tiff_u32(ByteOrder order, std::span<const std::byte> bytes,
              uint64_t offset, uint32_t* out) noexcept
{
    if (order == ByteOrder::LittleEndian) {
        return read_u32le(bytes, offset, out);
    }
    return read_u32be(bytes, offset, out);
}


// Caller guarantees `dst` holds at least 4 bytes.
inline void
store_tiff_u32(ByteOrder order, std::span<std::byte> dst,
               uint32_t value) noexcept
{
    for (uint32_t i = 0; i < 4; ++i) {
        const uint32_t shift = (order == ByteOrder::LittleEndian)
                                   ? (i * 8U)
                                   : ((3U - i) * 8U);
        dst[i] = std::byte { static_cast<uint8_t>((value >> shift) & 0xFFU) };
    }
}

}  // namespace exifdate::detail
