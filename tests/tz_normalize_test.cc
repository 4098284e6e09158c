#include "exifdate/tz_normalize.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <string>
#include <variant>
#include <vector>

namespace exifdate {
namespace {

    // Pins the process zone for the lifetime of the object.
    class ScopedTz final {
    public:
        explicit ScopedTz(const char* tz)
        {
            const char* prev = std::getenv("TZ");
            if (prev) {
                had_prev_ = true;
                prev_     = prev;
            }
            setenv("TZ", tz, 1);
            tzset();
        }

        ~ScopedTz()
        {
            if (had_prev_) {
                setenv("TZ", prev_.c_str(), 1);
            } else {
                unsetenv("TZ");
            }
            tzset();
        }

    private:
        bool had_prev_ = false;
        std::string prev_;
    };


    static DateField ascii_field(IfdKind ifd, uint16_t tag, FieldKind kind,
                                 const char* text)
    {
        DateField f;
        f.ifd   = ifd;
        f.tag   = tag;
        f.type  = static_cast<uint16_t>(TiffType::Ascii);
        f.count = 20;
        f.value = AsciiValue { text };
        f.kind  = kind;
        return f;
    }


    static DateField gps_date(const char* text)
    {
        DateField f = ascii_field(IfdKind::Gps, tags::kGpsDateStamp,
                                  FieldKind::Date, text);
        f.name  = "GPSDateStamp";
        f.count = 11;
        return f;
    }


    static DateField gps_time(uint32_t h, uint32_t m, uint32_t s)
    {
        DateField f;
        f.name  = "GPSTimeStamp";
        f.ifd   = IfdKind::Gps;
        f.tag   = tags::kGpsTimeStamp;
        f.type  = static_cast<uint16_t>(TiffType::Rational);
        f.count = 3;
        f.value = RationalValue { { { h, 1 }, { m, 1 }, { s, 1 } } };
        f.kind  = FieldKind::Time;
        return f;
    }


    static CivilDateTime civil(int y, int mo, int d, int h, int mi, int s)
    {
        CivilDateTime dt;
        dt.date = CivilDate { y, mo, d };
        dt.time = CivilTime { h, mi, s };
        return dt;
    }


    TEST(TzNormalize, ConvertsBetweenExifAndInputForms)
    {
        EXPECT_EQ(to_input_datetime("2024:03:15 14:30:45"),
                  "2024-03-15T14:30:45");
        EXPECT_EQ(to_input_datetime("2024:03:15 14:30"), "2024-03-15T14:30:00");
        EXPECT_EQ(to_input_datetime("  2024:03:15 14:30:45 "),
                  "2024-03-15T14:30:45");
        EXPECT_EQ(to_input_datetime("    :  :     :  :  "), "");
        EXPECT_EQ(to_input_date("2024:03:15"), "2024-03-15");
        EXPECT_EQ(to_input_date("2024-03-15"), "");

        EXPECT_EQ(from_input_datetime("2024-03-15T14:30:46"),
                  "2024:03:15 14:30:46");
        EXPECT_EQ(from_input_datetime("2024-03-15T14:30"),
                  "2024:03:15 14:30:00");
        EXPECT_EQ(from_input_datetime("2024-03-15"), "2024:03:15 00:00:00");
        EXPECT_EQ(from_input_datetime("2024-13-15T14:30"), "");
        EXPECT_EQ(from_input_datetime("garbage"), "");
        EXPECT_EQ(from_input_date("2024-03-15"), "2024:03:15");
        EXPECT_EQ(from_input_date("2024-03-15T00:00"), "");
    }


    TEST(TzNormalize, ParsesClockInput)
    {
        GpsTime t {};
        ASSERT_TRUE(from_input_time("13:00:00", &t));
        EXPECT_EQ(t, (GpsTime { 13, 0, 0 }));
        ASSERT_TRUE(from_input_time("7:05", &t));
        EXPECT_EQ(t, (GpsTime { 7, 5, 0 }));

        EXPECT_FALSE(from_input_time("24:00", &t));
        EXPECT_FALSE(from_input_time("12:60", &t));
        EXPECT_FALSE(from_input_time("12:00:60", &t));
        EXPECT_FALSE(from_input_time("123:00", &t));
        EXPECT_FALSE(from_input_time("12", &t));
        EXPECT_FALSE(from_input_time("12:00:", &t));
        EXPECT_FALSE(from_input_time("", &t));

        const std::vector<double> hms = { 12.0, 30.0, 0.5 };
        EXPECT_EQ(to_input_time(hms), "12:30:00");
        EXPECT_EQ(to_input_time(std::vector<double> { 1.0, 2.0 }), "");
    }


    TEST(TzNormalize, UtcToLocalUsesHostZone)
    {
        ScopedTz tz("JST-9");
        CivilDateTime local;
        ASSERT_TRUE(utc_to_local(civil(2024, 3, 15, 20, 0, 0), &local));
        EXPECT_EQ(local, civil(2024, 3, 16, 5, 0, 0));

        CivilDateTime utc;
        ASSERT_TRUE(local_to_utc(civil(2024, 3, 16, 5, 0, 0), &utc));
        EXPECT_EQ(utc, civil(2024, 3, 15, 20, 0, 0));
    }


    TEST(TzNormalize, LocalToUtcHonoursDaylightSaving)
    {
        ScopedTz tz("PST8PDT,M3.2.0,M11.1.0");
        CivilDateTime utc;
        ASSERT_TRUE(local_to_utc(civil(2024, 7, 1, 5, 0, 0), &utc));
        EXPECT_EQ(utc, civil(2024, 7, 1, 12, 0, 0));
        ASSERT_TRUE(local_to_utc(civil(2024, 1, 1, 4, 0, 0), &utc));
        EXPECT_EQ(utc, civil(2024, 1, 1, 12, 0, 0));

        CivilDateTime local;
        ASSERT_TRUE(utc_to_local(civil(2024, 7, 1, 12, 0, 0), &local));
        EXPECT_EQ(local, civil(2024, 7, 1, 5, 0, 0));
    }


    TEST(TzNormalize, ShowsGpsFieldsInLocalTime)
    {
        ScopedTz tz("JST-9");
        const std::vector<DateField> fields = { gps_time(20, 0, 0),
                                                gps_date("2024:03:15") };
        NormalizeOptions options;

        EXPECT_EQ(display_value(fields[0], fields, options), "05:00:00");
        EXPECT_EQ(display_value(fields[1], fields, options), "2024-03-16");
    }


    TEST(TzNormalize, EncodesGpsEditsBackToUtc)
    {
        ScopedTz tz("JST-9");
        const std::vector<DateField> fields = { gps_time(20, 0, 0),
                                                gps_date("2024:03:15") };
        NormalizeOptions options;

        // Unchanged values reproduce the stored UTC values.
        FieldEdit e = encode_edit(fields[0], fields, "05:00:00", options);
        ASSERT_TRUE(std::holds_alternative<GpsTime>(e));
        EXPECT_EQ(std::get<GpsTime>(e), (GpsTime { 20, 0, 0 }));

        e = encode_edit(fields[1], fields, "2024-03-16", options);
        ASSERT_TRUE(std::holds_alternative<std::string>(e));
        EXPECT_EQ(std::get<std::string>(e), "2024:03:15");

        e = encode_edit(fields[0], fields, "06:15", options);
        ASSERT_TRUE(std::holds_alternative<GpsTime>(e));
        EXPECT_EQ(std::get<GpsTime>(e), (GpsTime { 21, 15, 0 }));

        e = encode_edit(fields[1], fields, "2024-03-20", options);
        ASSERT_TRUE(std::holds_alternative<std::string>(e));
        EXPECT_EQ(std::get<std::string>(e), "2024:03:19");

        e = encode_edit(fields[0], fields, "25:00", options);
        EXPECT_TRUE(std::holds_alternative<std::monostate>(e));
        e = encode_edit(fields[1], fields, "", options);
        EXPECT_TRUE(std::holds_alternative<std::monostate>(e));
    }


    TEST(TzNormalize, RejectsOutOfRangeGpsTime)
    {
        ScopedTz tz("UTC0");
        DateField oversized = gps_time(0, 0, 0);
        oversized.value     = RationalValue {
            { { 4294967295U, 1 }, { 0, 1 }, { 0, 1 } }
        };
        const std::vector<DateField> fields = { oversized,
                                                gps_date("2024:03:15") };
        NormalizeOptions options;

        EXPECT_EQ(display_value(fields[0], fields, options), "");
        // The date pairs with midnight when the stored time is unusable.
        EXPECT_EQ(display_value(fields[1], fields, options), "2024-03-15");

        const std::vector<DateField> minute_60 = { gps_time(12, 60, 0) };
        EXPECT_EQ(display_value(minute_60[0], minute_60, options), "");

        EXPECT_EQ(to_input_time(std::vector<double> { 4294967295.0, 0.0, 0.0 }),
                  "");
        EXPECT_EQ(to_input_time(std::vector<double> { 23.0, 59.0, 59.9 }),
                  "23:59:59");
        EXPECT_EQ(to_input_time(std::vector<double> { -1.0, 0.0, 0.0 }), "");
    }


    TEST(TzNormalize, PairsGpsDateAndTimeInput)
    {
        ScopedTz tz("JST-9");
        const std::vector<DateField> fields = { gps_time(20, 0, 0),
                                                gps_date("2024:03:15") };
        NormalizeOptions options;

        // Local 2024-03-17 08:00 JST is 2024-03-16 23:00 UTC.
        GpsPairEdit e = encode_gps_pair(fields, "2024-03-17", "08:00", options);
        ASSERT_TRUE(std::holds_alternative<std::string>(e.date));
        EXPECT_EQ(std::get<std::string>(e.date), "2024:03:16");
        ASSERT_TRUE(std::holds_alternative<GpsTime>(e.time));
        EXPECT_EQ(std::get<GpsTime>(e.time), (GpsTime { 23, 0, 0 }));

        // Date alone keeps the displayed local time (05:00).
        e = encode_gps_pair(fields, "2024-03-20", "", options);
        EXPECT_EQ(std::get<std::string>(e.date), "2024:03:19");
        EXPECT_EQ(std::get<GpsTime>(e.time), (GpsTime { 20, 0, 0 }));

        e = encode_gps_pair(fields, "", "", options);
        EXPECT_TRUE(std::holds_alternative<std::monostate>(e.date));
        EXPECT_TRUE(std::holds_alternative<std::monostate>(e.time));
        e = encode_gps_pair(fields, "bad", "25:00", options);
        EXPECT_TRUE(std::holds_alternative<std::monostate>(e.date));
        EXPECT_TRUE(std::holds_alternative<std::monostate>(e.time));
    }


    TEST(TzNormalize, GpsTimeFallsBackToDateTimeOriginal)
    {
        ScopedTz tz("JST-9");
        const std::vector<DateField> fields = {
            ascii_field(IfdKind::Exif, tags::kDateTimeOriginal,
                        FieldKind::DateTime, "2024:03:15 10:00:00"),
            gps_time(23, 30, 0),
        };
        NormalizeOptions options;

        EXPECT_EQ(gps_reference_date(fields, fields[1], options),
                  (CivilDate { 2024, 3, 15 }));
        EXPECT_EQ(display_value(fields[1], fields, options), "08:30:00");

        const FieldEdit e = encode_edit(fields[1], fields, "08:30:00", options);
        ASSERT_TRUE(std::holds_alternative<GpsTime>(e));
        EXPECT_EQ(std::get<GpsTime>(e), (GpsTime { 23, 30, 0 }));
    }


    TEST(TzNormalize, ReferenceDatePriority)
    {
        ScopedTz tz("UTC0");
        const DateField time = gps_time(1, 2, 3);
        NormalizeOptions options;
        // 2024-03-15T00:00:00Z
        options.now = 1710460800;

        EXPECT_EQ(gps_reference_date(std::vector<DateField> { time }, time,
                                     options),
                  (CivilDate { 2024, 3, 15 }));

        const std::vector<DateField> with_datetime = {
            ascii_field(IfdKind::Ifd0, tags::kDateTime, FieldKind::DateTime,
                        "2001:02:03 04:05:06"),
            time,
        };
        EXPECT_EQ(gps_reference_date(with_datetime, time, options),
                  (CivilDate { 2001, 2, 3 }));

        // A GPS date that does not parse falls through to the next candidate.
        const std::vector<DateField> with_bad_gps_date = {
            ascii_field(IfdKind::Ifd0, tags::kDateTime, FieldKind::DateTime,
                        "2001:02:03 04:05:06"),
            time,
            gps_date("bad"),
        };
        EXPECT_EQ(gps_reference_date(with_bad_gps_date, time, options),
                  (CivilDate { 2001, 2, 3 }));

        const std::vector<DateField> with_gps_date = {
            ascii_field(IfdKind::Ifd0, tags::kDateTime, FieldKind::DateTime,
                        "2001:02:03 04:05:06"),
            time,
            gps_date("2010:10:10"),
        };
        EXPECT_EQ(gps_reference_date(with_gps_date, time, options),
                  (CivilDate { 2010, 10, 10 }));

        const CivilDateTime instant = gps_utc_instant(with_gps_date, time,
                                                      options);
        EXPECT_EQ(instant, civil(2010, 10, 10, 1, 2, 3));
    }


    TEST(TzNormalize, DateTimeFieldsIgnoreHostZone)
    {
        ScopedTz tz("EST5");
        const DateField f = ascii_field(IfdKind::Ifd0, tags::kDateTime,
                                        FieldKind::DateTime,
                                        "2024:03:15 14:30:45");
        const std::vector<DateField> fields = { f };
        NormalizeOptions options;

        EXPECT_EQ(display_value(f, fields, options), "2024-03-15T14:30:45");
        const FieldEdit e = encode_edit(f, fields, "2024-03-15T14:30:46",
                                        options);
        ASSERT_TRUE(std::holds_alternative<std::string>(e));
        EXPECT_EQ(std::get<std::string>(e), "2024:03:15 14:30:46");

        EXPECT_TRUE(std::holds_alternative<std::monostate>(
            encode_edit(f, fields, "not a date", options)));
    }


    TEST(TzNormalize, RoundTripsLocalEditsAcrossZones)
    {
        for (const char* zone : { "UTC0", "JST-9", "EST5", "PST8PDT,M3.2.0,M11.1.0" }) {
            ScopedTz tz(zone);
            const std::vector<DateField> fields = { gps_time(3, 45, 10),
                                                    gps_date("2024:06:30") };
            NormalizeOptions options;

            const std::string shown_time = display_value(fields[0], fields,
                                                         options);
            const std::string shown_date = display_value(fields[1], fields,
                                                         options);
            ASSERT_FALSE(shown_time.empty()) << zone;
            ASSERT_FALSE(shown_date.empty()) << zone;

            const FieldEdit t = encode_edit(fields[0], fields, shown_time,
                                            options);
            const FieldEdit d = encode_edit(fields[1], fields, shown_date,
                                            options);
            ASSERT_TRUE(std::holds_alternative<GpsTime>(t)) << zone;
            ASSERT_TRUE(std::holds_alternative<std::string>(d)) << zone;
            EXPECT_EQ(std::get<GpsTime>(t), (GpsTime { 3, 45, 10 })) << zone;
            EXPECT_EQ(std::get<std::string>(d), "2024:06:30") << zone;
        }
    }

}  // namespace
}  // namespace exifdate
