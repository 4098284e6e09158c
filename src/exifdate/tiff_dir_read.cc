#include "exifdate/tiff_dir_read.h"

#include "exifdate/jpeg_scan.h"

#include "tiff_bytes_internal.h"

#include <array>
#include <string_view>
#include <utility>

namespace exifdate {
namespace {

    using detail::read_tiff_u16;
    using detail::read_tiff_u32;
    using detail::read_u16be;
    using detail::u8;

    static constexpr uint16_t kTiffMagic      = 42;
    static constexpr uint16_t kOrderLittle    = 0x4949;  // "II"
    static constexpr uint16_t kOrderBig       = 0x4D4D;  // "MM"
    static constexpr uint64_t kIfdEntrySize   = 12;
    static constexpr uint32_t kInlineSlotSize = 4;

    struct FieldSpec final {
        uint16_t tag;
        IfdKind ifd;
        TiffType type;
        FieldKind kind;
        std::string_view name;
        std::string_view label;
    };

    // Emission order of the extracted fields.
    static constexpr std::array<FieldSpec, 5> kFieldSpecs = { {
        { tags::kDateTime, IfdKind::Ifd0, TiffType::Ascii, FieldKind::DateTime,
          "DateTime", "Image DateTime (0th IFD)" },
        { tags::kDateTimeOriginal, IfdKind::Exif, TiffType::Ascii,
          FieldKind::DateTime, "DateTimeOriginal",
          "DateTimeOriginal (Exif IFD)" },
        { tags::kDateTimeDigitized, IfdKind::Exif, TiffType::Ascii,
          FieldKind::DateTime, "DateTimeDigitized",
          "DateTimeDigitized (Exif IFD)" },
        { tags::kGpsDateStamp, IfdKind::Gps, TiffType::Ascii, FieldKind::Date,
          "GPSDateStamp", "GPSDateStamp (GPS IFD)" },
        { tags::kGpsTimeStamp, IfdKind::Gps, TiffType::Rational,
          FieldKind::Time, "GPSTimeStamp", "GPSTimeStamp (GPS IFD)" },
    } };

    static constexpr uint16_t type_code(TiffType type) noexcept
    {
        return static_cast<uint16_t>(type);
    }

    static bool is_pointer_tag(uint16_t tag) noexcept
    {
        return tag == tags::kExifIfdPointer || tag == tags::kGpsIfdPointer;
    }

    static bool in_range(std::span<const std::byte> bytes, uint64_t offset,
                         uint64_t size) noexcept
    {
        return offset <= bytes.size() && size <= bytes.size() - offset;
    }

    static AsciiValue decode_ascii(std::span<const std::byte> bytes,
                                   uint64_t offset, uint32_t count)
    {
        AsciiValue v;
        for (uint32_t i = 0; i < count; ++i) {
            const uint8_t c = u8(bytes[offset + i]);
            if (c == 0) {
                break;
            }
            v.text.push_back(static_cast<char>(c));
        }
        return v;
    }

    static bool decode_rationals(const TiffHeader& header,
                                 std::span<const std::byte> bytes,
                                 uint64_t offset, uint32_t count,
                                 RationalValue* out)
    {
        out->parts.clear();
        out->parts.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            const uint64_t base = offset + static_cast<uint64_t>(i) * 8U;
            URational r;
            if (!read_tiff_u32(header.order, bytes, base + 0, &r.numer)
                || !read_tiff_u32(header.order, bytes, base + 4, &r.denom)) {
                return false;
            }
            out->parts.push_back(r);
        }
        return true;
    }

    static IfdReadResult fail(IfdReadResult result) noexcept
    {
        result.status = DateParseStatus::HeaderError;
        return result;
    }

    static const IfdEntry* find_entry(const std::vector<IfdEntry>& entries,
                                      uint16_t tag) noexcept
    {
        // Later duplicates win.
        const IfdEntry* found = nullptr;
        for (const IfdEntry& e : entries) {
            if (e.tag == tag) {
                found = &e;
            }
        }
        return found;
    }

    static void collect_fields(const std::vector<IfdEntry>& entries,
                               IfdKind ifd, ByteOrder order,
                               std::vector<DateField>* out)
    {
        for (const FieldSpec& spec : kFieldSpecs) {
            if (spec.ifd != ifd) {
                continue;
            }
            const IfdEntry* e = find_entry(entries, spec.tag);
            if (!e || e->type != type_code(spec.type)) {
                continue;
            }
            DateField f;
            f.label        = spec.label;
            f.name         = spec.name;
            f.ifd          = ifd;
            f.tag          = e->tag;
            f.type         = e->type;
            f.count        = e->count;
            f.value_offset = static_cast<uint32_t>(e->value_offset);
            f.value        = e->value;
            f.kind         = spec.kind;
            f.order        = order;
            out->push_back(std::move(f));
        }
    }

    static uint32_t pointer_target(const std::vector<IfdEntry>& entries,
                                   uint16_t tag) noexcept
    {
        const IfdEntry* e = find_entry(entries, tag);
        if (!e) {
            return 0;
        }
        const DirectoryPointer* ptr = std::get_if<DirectoryPointer>(&e->value);
        return ptr ? ptr->offset : 0U;
    }

}  // namespace

DateParseStatus
read_tiff_header(std::span<const std::byte> bytes, uint64_t tiff_offset,
                 TiffHeader* out) noexcept
{
    if (!in_range(bytes, tiff_offset, 8)) {
        return DateParseStatus::HeaderError;
    }

    uint16_t bom = 0;
    (void)read_u16be(bytes, tiff_offset, &bom);
    ByteOrder order = ByteOrder::LittleEndian;
    if (bom == kOrderLittle) {
        order = ByteOrder::LittleEndian;
    } else if (bom == kOrderBig) {
        order = ByteOrder::BigEndian;
    } else {
        return DateParseStatus::HeaderError;
    }

    uint16_t magic = 0;
    uint32_t first = 0;
    if (!read_tiff_u16(order, bytes, tiff_offset + 2, &magic)
        || !read_tiff_u32(order, bytes, tiff_offset + 4, &first)) {
        return DateParseStatus::HeaderError;
    }
    if (magic != kTiffMagic) {
        return DateParseStatus::HeaderError;
    }

    out->order     = order;
    out->offset    = tiff_offset;
    out->first_ifd = first;
    return DateParseStatus::Ok;
}


IfdReadResult
read_ifd(std::span<const std::byte> bytes, const TiffHeader& header,
         uint64_t ifd_offset, std::vector<IfdEntry>* out)
{
    IfdReadResult result;

    uint16_t entry_count = 0;
    if (!read_tiff_u16(header.order, bytes, ifd_offset, &entry_count)) {
        return fail(result);
    }
    const uint64_t table_off   = ifd_offset + 2;
    const uint64_t table_bytes = static_cast<uint64_t>(entry_count)
                                 * kIfdEntrySize;
    // Entry table plus the trailing next-IFD offset.
    if (!in_range(bytes, table_off, table_bytes + 4)) {
        return fail(result);
    }

    out->reserve(out->size() + entry_count);
    for (uint32_t i = 0; i < entry_count; ++i) {
        const uint64_t entry_off = table_off
                                   + static_cast<uint64_t>(i) * kIfdEntrySize;
        const uint64_t slot_off  = entry_off + 8;

        IfdEntry entry;
        (void)read_tiff_u16(header.order, bytes, entry_off + 0, &entry.tag);
        (void)read_tiff_u16(header.order, bytes, entry_off + 2, &entry.type);
        (void)read_tiff_u32(header.order, bytes, entry_off + 4, &entry.count);
        entry.value_offset = slot_off;

        uint32_t slot = 0;
        (void)read_tiff_u32(header.order, bytes, slot_off, &slot);

        if (entry.type == type_code(TiffType::Ascii)) {
            if (entry.count > kInlineSlotSize) {
                entry.value_offset = header.offset + slot;
            }
            if (!in_range(bytes, entry.value_offset, entry.count)) {
                return fail(result);
            }
            entry.value = decode_ascii(bytes, entry.value_offset, entry.count);
        } else if (entry.type == type_code(TiffType::Rational)) {
            entry.value_offset = header.offset + slot;
            if (!in_range(bytes, entry.value_offset,
                          static_cast<uint64_t>(entry.count) * 8U)) {
                return fail(result);
            }
            RationalValue v;
            if (!decode_rationals(header, bytes, entry.value_offset,
                                  entry.count, &v)) {
                return fail(result);
            }
            entry.value = std::move(v);
        } else if (is_pointer_tag(entry.tag)
                   && entry.type == type_code(TiffType::Long)) {
            entry.value = DirectoryPointer { slot };
        } else if (is_pointer_tag(entry.tag)
                   && entry.type == type_code(TiffType::Short)) {
            uint16_t ptr = 0;
            (void)read_tiff_u16(header.order, bytes, slot_off, &ptr);
            entry.value = DirectoryPointer { ptr };
        }

        if (entry.value_offset > UINT32_MAX) {
            return fail(result);
        }
        out->push_back(std::move(entry));
        result.entries_read += 1;
    }

    (void)read_tiff_u32(header.order, bytes, table_off + table_bytes,
                        &result.next_ifd);
    return result;
}


DirectoryReadResult
read_date_fields(std::span<const std::byte> bytes, uint64_t tiff_offset,
                 std::vector<DateField>* out)
{
    DirectoryReadResult result;
    out->clear();

    TiffHeader header;
    result.status = read_tiff_header(bytes, tiff_offset, &header);
    if (result.status != DateParseStatus::Ok) {
        return result;
    }
    result.order = header.order;

    std::vector<DateField> fields;

    std::vector<IfdEntry> ifd0;
    const IfdReadResult r0 = read_ifd(bytes, header,
                                      header.offset + header.first_ifd, &ifd0);
    if (r0.status != DateParseStatus::Ok) {
        result.status = r0.status;
        return result;
    }
    result.ifds_read += 1;
    result.entries_read += r0.entries_read;
    collect_fields(ifd0, IfdKind::Ifd0, header.order, &fields);

    struct SubIfd final {
        uint16_t pointer_tag;
        IfdKind kind;
    };
    static constexpr std::array<SubIfd, 2> kSubIfds = { {
        { tags::kExifIfdPointer, IfdKind::Exif },
        { tags::kGpsIfdPointer, IfdKind::Gps },
    } };

    for (const SubIfd& sub : kSubIfds) {
        const uint32_t target = pointer_target(ifd0, sub.pointer_tag);
        if (target == 0U) {
            continue;
        }
        std::vector<IfdEntry> entries;
        const IfdReadResult r = read_ifd(bytes, header, header.offset + target,
                                         &entries);
        if (r.status != DateParseStatus::Ok) {
            result.status = r.status;
            return result;
        }
        result.ifds_read += 1;
        result.entries_read += r.entries_read;
        collect_fields(entries, sub.kind, header.order, &fields);
    }

    *out = std::move(fields);
    return result;
}


DirectoryReadResult
extract_date_fields(std::span<const std::byte> jpeg_bytes,
                    std::vector<DateField>* out)
{
    out->clear();

    DirectoryReadResult result;
    const JpegScanResult scan = scan_jpeg_exif(jpeg_bytes);
    if (scan.status != DateParseStatus::Ok) {
        result.status = scan.status;
        return result;
    }
    return read_date_fields(jpeg_bytes, scan.tiff_offset, out);
}

}  // namespace exifdate
