#include "exifdate/date_field.h"

namespace exifdate {

std::string_view
ifd_name(IfdKind ifd) noexcept
{
    switch (ifd) {
    case IfdKind::Ifd0: return "0th";
    case IfdKind::Exif: return "Exif";
    case IfdKind::Gps: return "GPS";
    }
    return "unknown";
}


std::string_view
field_kind_name(FieldKind kind) noexcept
{
    switch (kind) {
    case FieldKind::Date: return "date";
    case FieldKind::Time: return "time";
    case FieldKind::DateTime: return "datetime";
    }
    return "unknown";
}


std::string_view
parse_status_name(DateParseStatus status) noexcept
{
    switch (status) {
    case DateParseStatus::Ok: return "ok";
    case DateParseStatus::FormatError: return "format_error";
    case DateParseStatus::SegmentError: return "segment_error";
    case DateParseStatus::HeaderError: return "header_error";
    }
    return "unknown";
}


double
rational_quotient(URational r) noexcept
{
    if (r.denom == 0U) {
        return 0.0;
    }
    return static_cast<double>(r.numer) / static_cast<double>(r.denom);
}


std::vector<double>
rational_quotients(const RationalValue& value)
{
    std::vector<double> out;
    out.reserve(value.parts.size());
    for (const URational& r : value.parts) {
        out.push_back(rational_quotient(r));
    }
    return out;
}


bool
is_gps_utc_field(const DateField& field) noexcept
{
    if (field.ifd != IfdKind::Gps) {
        return false;
    }
    return field.tag == tags::kGpsDateStamp || field.tag == tags::kGpsTimeStamp;
}

}  // namespace exifdate
