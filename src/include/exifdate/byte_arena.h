#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file byte_arena.h
 * \brief Fixed-size byte arena addressed by (offset,size) spans.
 */

namespace exifdate {

/// A span (offset,size) into a \ref FixedByteArena buffer.
struct ByteSpan final {
    uint32_t offset = 0;
    uint32_t size   = 0;
};

/**
 * \brief Owned byte buffer whose size is fixed at construction.
 *
 * The arena never inserts, erases or resizes after \ref assign: every access
 * goes through a \ref ByteSpan that is range checked against the buffer, so a
 * bad offset yields an empty view instead of touching adjacent bytes.
 */
class FixedByteArena final {
public:
    FixedByteArena() = default;

    /// Replaces the content with a copy of \p bytes.
    void assign(std::span<const std::byte> bytes);
    /// Discards all stored bytes.
    void clear() noexcept;

    uint64_t size() const noexcept;
    bool empty() const noexcept;

    /// Returns true if \p view lies completely inside the buffer.
    bool contains(ByteSpan view) const noexcept;

    /// Returns a view of the full buffer.
    std::span<const std::byte> bytes() const noexcept;
    /// Returns a view for \p view, or an empty span if out of range.
    std::span<const std::byte> span(ByteSpan view) const noexcept;
    /// Returns a mutable view for \p view, or an empty span if out of range.
    std::span<std::byte> span_mut(ByteSpan view) noexcept;

private:
    std::vector<std::byte> buffer_;
};

}  // namespace exifdate
