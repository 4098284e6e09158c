#include "exifdate/tz_normalize.h"

#include <cmath>
#include <cstdio>
#include <utility>
#include <variant>

namespace exifdate {
namespace {

    static bool is_digit(char c) noexcept
    {
        return c >= '0' && c <= '9';
    }

    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v'
               || c == '\f';
    }

    // Reads exactly `n` digits at `pos`.
    static bool read_digits(std::string_view s, size_t pos, size_t n,
                            int* out) noexcept
    {
        if (pos + n > s.size()) {
            return false;
        }
        int v = 0;
        for (size_t i = 0; i < n; ++i) {
            const char c = s[pos + i];
            if (!is_digit(c)) {
                return false;
            }
            v = v * 10 + (c - '0');
        }
        *out = v;
        return true;
    }

    static bool expect(std::string_view s, size_t pos, char c) noexcept
    {
        return pos < s.size() && s[pos] == c;
    }

    // `YYYY<sep>MM<sep>DD` at `pos`; `*end` is set past the day.
    static bool match_date_at(std::string_view s, size_t pos, char sep,
                              CivilDate* out, size_t* end) noexcept
    {
        CivilDate d;
        if (!read_digits(s, pos, 4, &d.year) || !expect(s, pos + 4, sep)
            || !read_digits(s, pos + 5, 2, &d.month)
            || !expect(s, pos + 7, sep)
            || !read_digits(s, pos + 8, 2, &d.day)) {
            return false;
        }
        *out = d;
        *end = pos + 10;
        return true;
    }

    // `HH:MM[:SS]` at `pos` with two-digit components.
    static bool match_exif_time_at(std::string_view s, size_t pos,
                                   CivilTime* out) noexcept
    {
        CivilTime t;
        if (!read_digits(s, pos, 2, &t.hour) || !expect(s, pos + 2, ':')
            || !read_digits(s, pos + 3, 2, &t.minute)) {
            return false;
        }
        if (expect(s, pos + 5, ':')) {
            int sec = 0;
            if (read_digits(s, pos + 6, 2, &sec)) {
                t.second = sec;
            }
        }
        *out = t;
        return true;
    }

    // One or two digits, then end of string or ':'.
    static bool read_clock_part(std::string_view s, size_t* pos,
                                int* out) noexcept
    {
        size_t n = 0;
        int v    = 0;
        while (*pos + n < s.size() && is_digit(s[*pos + n]) && n < 3) {
            v = v * 10 + (s[*pos + n] - '0');
            n += 1;
        }
        if (n == 0 || n > 2) {
            return false;
        }
        *pos += n;
        *out = v;
        return true;
    }

    static void to_tm(const CivilDateTime& c, std::tm* tm) noexcept
    {
        *tm         = std::tm {};
        tm->tm_year = c.date.year - 1900;
        tm->tm_mon  = c.date.month - 1;
        tm->tm_mday = c.date.day;
        tm->tm_hour = c.time.hour;
        tm->tm_min  = c.time.minute;
        tm->tm_sec  = c.time.second;
    }

    static CivilDateTime from_tm(const std::tm& tm) noexcept
    {
        CivilDateTime c;
        c.date.year   = tm.tm_year + 1900;
        c.date.month  = tm.tm_mon + 1;
        c.date.day    = tm.tm_mday;
        c.time.hour   = tm.tm_hour;
        c.time.minute = tm.tm_min;
        c.time.second = tm.tm_sec;
        return c;
    }

    static bool utc_seconds(std::tm* tm, std::time_t* out) noexcept
    {
#if defined(_WIN32)
        const std::time_t t = _mkgmtime(tm);
#else
        const std::time_t t = timegm(tm);
#endif
        if (t == static_cast<std::time_t>(-1)) {
            return false;
        }
        *out = t;
        return true;
    }

    static bool local_tm(std::time_t t, std::tm* out) noexcept
    {
#if defined(_WIN32)
        return localtime_s(out, &t) == 0;
#else
        return localtime_r(&t, out) != nullptr;
#endif
    }

    static bool utc_tm(std::time_t t, std::tm* out) noexcept
    {
#if defined(_WIN32)
        return gmtime_s(out, &t) == 0;
#else
        return gmtime_r(&t, out) != nullptr;
#endif
    }

    static const AsciiValue* ascii_of(const DateField& f) noexcept
    {
        return std::get_if<AsciiValue>(&f.value);
    }

    static const DateField* find_gps_field(std::span<const DateField> fields,
                                           uint16_t tag) noexcept
    {
        for (const DateField& f : fields) {
            if (f.ifd == IfdKind::Gps && f.tag == tag) {
                return &f;
            }
        }
        return nullptr;
    }

    // Whole part of a clock component; false outside [0, limit).
    static bool clock_part_of(double q, int limit, int* out) noexcept
    {
        if (!(q >= 0.0) || q >= static_cast<double>(limit)) {
            return false;
        }
        *out = static_cast<int>(std::floor(q));
        return true;
    }

    static bool clock_of(double h, double m, double s, CivilTime* out) noexcept
    {
        CivilTime t;
        if (!clock_part_of(h, 24, &t.hour) || !clock_part_of(m, 60, &t.minute)
            || !clock_part_of(s, 60, &t.second)) {
            return false;
        }
        *out = t;
        return true;
    }

    // Whole hour/minute/second of a 3-part rational; fractions are dropped.
    static bool gps_time_of(const DateField& f, CivilTime* out) noexcept
    {
        const RationalValue* r = std::get_if<RationalValue>(&f.value);
        if (!r || r->parts.size() != 3) {
            return false;
        }
        return clock_of(rational_quotient(r->parts[0]),
                        rational_quotient(r->parts[1]),
                        rational_quotient(r->parts[2]), out);
    }

    static bool datetime_date(const DateField& f, CivilDate* out) noexcept
    {
        if (f.kind != FieldKind::DateTime) {
            return false;
        }
        const AsciiValue* a = ascii_of(f);
        return a && find_exif_date(a->text, out);
    }

    static CivilDate local_date_of(std::time_t now) noexcept
    {
        if (now == 0) {
            now = std::time(nullptr);
        }
        std::tm tm {};
        if (!local_tm(now, &tm)) {
            return CivilDate { 1970, 1, 1 };
        }
        return from_tm(tm).date;
    }

    static GpsTime to_gps_time(const CivilTime& t) noexcept
    {
        return GpsTime { static_cast<uint32_t>(t.hour),
                         static_cast<uint32_t>(t.minute),
                         static_cast<uint32_t>(t.second) };
    }

}  // namespace

bool
find_exif_date(std::string_view s, CivilDate* out) noexcept
{
    for (size_t pos = 0; pos + 10 <= s.size(); ++pos) {
        size_t end = 0;
        if (match_date_at(s, pos, ':', out, &end)) {
            return true;
        }
    }
    return false;
}


bool
find_exif_datetime(std::string_view s, CivilDateTime* out) noexcept
{
    for (size_t pos = 0; pos + 10 <= s.size(); ++pos) {
        CivilDateTime dt;
        size_t end = 0;
        if (!match_date_at(s, pos, ':', &dt.date, &end)) {
            continue;
        }
        while (end < s.size() && is_space(s[end])) {
            end += 1;
        }
        if (!match_exif_time_at(s, end, &dt.time)) {
            continue;
        }
        *out = dt;
        return true;
    }
    return false;
}


bool
parse_input_date(std::string_view s, CivilDate* out) noexcept
{
    size_t end = 0;
    CivilDate d;
    if (!match_date_at(s, 0, '-', &d, &end) || end != s.size()) {
        return false;
    }
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31) {
        return false;
    }
    *out = d;
    return true;
}


bool
parse_input_time(std::string_view s, CivilTime* out) noexcept
{
    CivilTime t;
    size_t pos = 0;
    if (!read_clock_part(s, &pos, &t.hour) || !expect(s, pos, ':')) {
        return false;
    }
    pos += 1;
    if (!read_clock_part(s, &pos, &t.minute)) {
        return false;
    }
    if (pos < s.size()) {
        if (!expect(s, pos, ':')) {
            return false;
        }
        pos += 1;
        if (!read_clock_part(s, &pos, &t.second) || pos != s.size()) {
            return false;
        }
    }
    if (t.hour > 23 || t.minute > 59 || t.second > 59) {
        return false;
    }
    *out = t;
    return true;
}


bool
parse_input_datetime(std::string_view s, CivilDateTime* out) noexcept
{
    const size_t sep = s.find('T');
    CivilDateTime dt;
    if (!parse_input_date(s.substr(0, sep), &dt.date)) {
        return false;
    }
    if (sep != std::string_view::npos
        && !parse_input_time(s.substr(sep + 1), &dt.time)) {
        return false;
    }
    *out = dt;
    return true;
}


std::string
format_exif_date(const CivilDate& d)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d:%02d:%02d", d.year, d.month, d.day);
    return std::string(buf);
}


std::string
format_exif_datetime(const CivilDateTime& dt)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d:%02d:%02d %02d:%02d:%02d",
                  dt.date.year, dt.date.month, dt.date.day, dt.time.hour,
                  dt.time.minute, dt.time.second);
    return std::string(buf);
}


std::string
format_input_date(const CivilDate& d)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return std::string(buf);
}


std::string
format_input_time(const CivilTime& t)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", t.hour, t.minute,
                  t.second);
    return std::string(buf);
}


std::string
format_input_datetime(const CivilDateTime& dt)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  dt.date.year, dt.date.month, dt.date.day, dt.time.hour,
                  dt.time.minute, dt.time.second);
    return std::string(buf);
}


std::string
to_input_datetime(std::string_view exif)
{
    CivilDateTime dt;
    if (!find_exif_datetime(exif, &dt)) {
        return std::string();
    }
    return format_input_datetime(dt);
}


std::string
to_input_date(std::string_view exif)
{
    CivilDate d;
    if (!find_exif_date(exif, &d)) {
        return std::string();
    }
    return format_input_date(d);
}


std::string
to_input_time(std::span<const double> hms)
{
    if (hms.size() != 3) {
        return std::string();
    }
    CivilTime t;
    if (!clock_of(hms[0], hms[1], hms[2], &t)) {
        return std::string();
    }
    return format_input_time(t);
}


std::string
from_input_datetime(std::string_view input)
{
    CivilDateTime dt;
    if (!parse_input_datetime(input, &dt)) {
        return std::string();
    }
    return format_exif_datetime(dt);
}


std::string
from_input_date(std::string_view input)
{
    CivilDate d;
    if (!parse_input_date(input, &d)) {
        return std::string();
    }
    return format_exif_date(d);
}


bool
from_input_time(std::string_view input, GpsTime* out) noexcept
{
    CivilTime t;
    if (!parse_input_time(input, &t)) {
        return false;
    }
    *out = to_gps_time(t);
    return true;
}


bool
utc_to_local(const CivilDateTime& utc, CivilDateTime* local) noexcept
{
    std::tm tm {};
    to_tm(utc, &tm);
    std::time_t t = 0;
    if (!utc_seconds(&tm, &t)) {
        return false;
    }
    std::tm out {};
    if (!local_tm(t, &out)) {
        return false;
    }
    *local = from_tm(out);
    return true;
}


bool
local_to_utc(const CivilDateTime& local, CivilDateTime* utc) noexcept
{
    std::tm tm {};
    to_tm(local, &tm);
    tm.tm_isdst         = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    std::tm out {};
    if (!utc_tm(t, &out)) {
        return false;
    }
    *utc = from_tm(out);
    return true;
}


CivilDate
gps_reference_date(std::span<const DateField> fields, const DateField& field,
                   const NormalizeOptions& options)
{
    CivilDate d;

    const DateField* gps_date = find_gps_field(fields, tags::kGpsDateStamp);
    if (gps_date) {
        const AsciiValue* a = ascii_of(*gps_date);
        if (a && find_exif_date(a->text, &d)) {
            return d;
        }
    }
    for (const DateField& f : fields) {
        if (f.ifd == field.ifd && datetime_date(f, &d)) {
            return d;
        }
    }
    for (const DateField& f : fields) {
        if (datetime_date(f, &d)) {
            return d;
        }
    }
    return local_date_of(options.now);
}


CivilDateTime
gps_utc_instant(std::span<const DateField> fields, const DateField& field,
                const NormalizeOptions& options)
{
    CivilDateTime utc;
    utc.date = gps_reference_date(fields, field, options);

    const DateField* time_field = (field.kind == FieldKind::Time)
                                      ? &field
                                      : find_gps_field(fields,
                                                       tags::kGpsTimeStamp);
    if (time_field) {
        (void)gps_time_of(*time_field, &utc.time);
    }
    return utc;
}


std::string
display_value(const DateField& field, std::span<const DateField> fields,
              const NormalizeOptions& options)
{
    switch (field.kind) {
    case FieldKind::DateTime: {
        const AsciiValue* a = ascii_of(field);
        return a ? to_input_datetime(a->text) : std::string();
    }
    case FieldKind::Date: {
        const AsciiValue* a = ascii_of(field);
        CivilDate own;
        if (!a || !find_exif_date(a->text, &own)) {
            return std::string();
        }
        if (!is_gps_utc_field(field)) {
            return format_input_date(own);
        }
        CivilDateTime utc = gps_utc_instant(fields, field, options);
        utc.date          = own;
        CivilDateTime local;
        if (!utc_to_local(utc, &local)) {
            return std::string();
        }
        return format_input_date(local.date);
    }
    case FieldKind::Time: {
        CivilTime own;
        if (!gps_time_of(field, &own)) {
            return std::string();
        }
        if (!is_gps_utc_field(field)) {
            return format_input_time(own);
        }
        const CivilDateTime utc = gps_utc_instant(fields, field, options);
        CivilDateTime local;
        if (!utc_to_local(utc, &local)) {
            return std::string();
        }
        return format_input_time(local.time);
    }
    }
    return std::string();
}


FieldEdit
encode_edit(const DateField& field, std::span<const DateField> fields,
            std::string_view input, const NormalizeOptions& options)
{
    switch (field.kind) {
    case FieldKind::DateTime: {
        std::string exif = from_input_datetime(input);
        if (exif.empty()) {
            return FieldEdit {};
        }
        return FieldEdit { std::move(exif) };
    }
    case FieldKind::Date: {
        CivilDate entered;
        if (!parse_input_date(input, &entered)) {
            return FieldEdit {};
        }
        if (!is_gps_utc_field(field)) {
            return FieldEdit { format_exif_date(entered) };
        }
        CivilDateTime utc = gps_utc_instant(fields, field, options);
        const AsciiValue* a = ascii_of(field);
        CivilDate own;
        if (a && find_exif_date(a->text, &own)) {
            utc.date = own;
        }
        CivilDateTime local;
        if (!utc_to_local(utc, &local)) {
            return FieldEdit {};
        }
        local.date = entered;
        CivilDateTime back;
        if (!local_to_utc(local, &back)) {
            return FieldEdit {};
        }
        return FieldEdit { format_exif_date(back.date) };
    }
    case FieldKind::Time: {
        CivilTime entered;
        if (!parse_input_time(input, &entered)) {
            return FieldEdit {};
        }
        if (!is_gps_utc_field(field)) {
            return FieldEdit { to_gps_time(entered) };
        }
        const CivilDateTime utc = gps_utc_instant(fields, field, options);
        CivilDateTime local;
        if (!utc_to_local(utc, &local)) {
            return FieldEdit {};
        }
        local.time = entered;
        CivilDateTime back;
        if (!local_to_utc(local, &back)) {
            return FieldEdit {};
        }
        return FieldEdit { to_gps_time(back.time) };
    }
    }
    return FieldEdit {};
}


GpsPairEdit
encode_gps_pair(std::span<const DateField> fields, std::string_view date_input,
                std::string_view time_input, const NormalizeOptions& options)
{
    GpsPairEdit out;
    const DateField* date_field = find_gps_field(fields, tags::kGpsDateStamp);
    const DateField* time_field = find_gps_field(fields, tags::kGpsTimeStamp);
    const DateField* anchor     = time_field ? time_field : date_field;
    if (!anchor) {
        return out;
    }

    CivilDate entered_date;
    CivilTime entered_time;
    const bool has_date = date_field
                          && parse_input_date(date_input, &entered_date);
    const bool has_time = time_field
                          && parse_input_time(time_input, &entered_time);
    if (!has_date && !has_time) {
        return out;
    }

    CivilDateTime local;
    if (!utc_to_local(gps_utc_instant(fields, *anchor, options), &local)) {
        return out;
    }
    if (has_date) {
        local.date = entered_date;
    }
    if (has_time) {
        local.time = entered_time;
    }
    CivilDateTime utc;
    if (!local_to_utc(local, &utc)) {
        return out;
    }
    if (date_field) {
        out.date = format_exif_date(utc.date);
    }
    if (time_field) {
        out.time = to_gps_time(utc.time);
    }
    return out;
}

}  // namespace exifdate
