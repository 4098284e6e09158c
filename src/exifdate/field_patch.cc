#include "exifdate/field_patch.h"

#include "tiff_bytes_internal.h"

#include <cstring>

namespace exifdate {
namespace {

    static constexpr uint32_t kGpsTimeParts = 3;
    static constexpr uint32_t kRationalSize = 8;

    struct EditVisitor final {
        FixedByteArena& working;
        const DateField& field;

        PatchResult operator()(const std::monostate&) const noexcept
        {
            return PatchResult {};
        }

        PatchResult operator()(const std::string& text) const noexcept
        {
            if (text.empty()) {
                return PatchResult {};
            }
            if (field.type != static_cast<uint16_t>(TiffType::Ascii)
                || field.kind == FieldKind::Time) {
                PatchResult r;
                r.status = PatchStatus::ShapeMismatch;
                return r;
            }
            return patch_ascii(working, field.value_offset, field.count, text);
        }

        PatchResult operator()(const GpsTime& hms) const noexcept
        {
            if (field.type != static_cast<uint16_t>(TiffType::Rational)
                || field.kind != FieldKind::Time
                || field.count != kGpsTimeParts) {
                PatchResult r;
                r.status = PatchStatus::ShapeMismatch;
                return r;
            }
            return patch_gps_time(working, field.order, field.value_offset,
                                  hms);
        }
    };

}  // namespace

PatchResult
patch_ascii(FixedByteArena& working, uint32_t value_offset, uint32_t count,
            std::string_view text) noexcept
{
    PatchResult result;
    if (text.empty()) {
        return result;
    }
    if (count == 0U) {
        result.status = PatchStatus::ShapeMismatch;
        return result;
    }

    const std::span<std::byte> dst = working.span_mut(
        ByteSpan { value_offset, count });
    if (dst.size() != count) {
        result.status = PatchStatus::OutOfRange;
        return result;
    }

    const uint32_t room = count - 1U;
    const uint32_t keep = (text.size() < room)
                              ? static_cast<uint32_t>(text.size())
                              : room;
    std::memset(dst.data(), 0, dst.size());
    std::memcpy(dst.data(), text.data(), keep);

    result.bytes_written = count;
    result.bytes_dropped = static_cast<uint32_t>(text.size() - keep);
    result.status        = (result.bytes_dropped != 0U) ? PatchStatus::Truncated
                                                        : PatchStatus::Written;
    return result;
}


PatchResult
patch_gps_time(FixedByteArena& working, ByteOrder order, uint32_t value_offset,
               const GpsTime& hms) noexcept
{
    PatchResult result;
    const std::span<std::byte> dst = working.span_mut(
        ByteSpan { value_offset, kGpsTimeParts * kRationalSize });
    if (dst.size() != kGpsTimeParts * kRationalSize) {
        result.status = PatchStatus::OutOfRange;
        return result;
    }

    for (uint32_t i = 0; i < kGpsTimeParts; ++i) {
        const std::span<std::byte> pair = dst.subspan(i * kRationalSize,
                                                      kRationalSize);
        detail::store_tiff_u32(order, pair.subspan(0, 4), hms[i]);
        detail::store_tiff_u32(order, pair.subspan(4, 4), 1U);
    }

    result.status        = PatchStatus::Written;
    result.bytes_written = static_cast<uint32_t>(dst.size());
    return result;
}


PatchResult
patch_field(FixedByteArena& working, const DateField& field,
            const FieldEdit& edit) noexcept
{
    return std::visit(EditVisitor { working, field }, edit);
}


std::string_view
patch_status_name(PatchStatus status) noexcept
{
    switch (status) {
    case PatchStatus::Written: return "written";
    case PatchStatus::Truncated: return "truncated";
    case PatchStatus::Skipped: return "skipped";
    case PatchStatus::ShapeMismatch: return "shape_mismatch";
    case PatchStatus::OutOfRange: return "out_of_range";
    }
    return "unknown";
}

}  // namespace exifdate
