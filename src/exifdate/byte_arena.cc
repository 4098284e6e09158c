#include "exifdate/byte_arena.h"

#include <cstring>

namespace exifdate {

void
FixedByteArena::assign(std::span<const std::byte> bytes)
{
    buffer_.resize(bytes.size());
    if (!bytes.empty()) {
        std::memcpy(buffer_.data(), bytes.data(), bytes.size());
    }
}


void
FixedByteArena::clear() noexcept
{
    buffer_.clear();
    buffer_.shrink_to_fit();
}


uint64_t
FixedByteArena::size() const noexcept
{
    return static_cast<uint64_t>(buffer_.size());
}


bool
FixedByteArena::empty() const noexcept
{
    return buffer_.empty();
}


bool
FixedByteArena::contains(ByteSpan view) const noexcept
{
    const uint64_t end = static_cast<uint64_t>(view.offset) + view.size;
    return end <= buffer_.size();
}


std::span<const std::byte>
FixedByteArena::bytes() const noexcept
{
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
}


std::span<const std::byte>
FixedByteArena::span(ByteSpan view) const noexcept
{
    if (!contains(view)) {
        return std::span<const std::byte>();
    }
    return bytes().subspan(view.offset, view.size);
}


std::span<std::byte>
FixedByteArena::span_mut(ByteSpan view) noexcept
{
    if (!contains(view)) {
        return std::span<std::byte>();
    }
    return std::span<std::byte>(buffer_.data() + view.offset, view.size);
}

}  // namespace exifdate
