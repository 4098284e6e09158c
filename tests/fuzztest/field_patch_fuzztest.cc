#include "exifdate/field_patch.h"
#include "exifdate/tz_normalize.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace exifdate {

static void
ascii_patch_stays_in_range(const std::vector<uint8_t>& buffer,
                           uint32_t offset, uint32_t count,
                           const std::string& text)
{
    std::vector<std::byte> original(buffer.size());
    for (size_t i = 0; i < buffer.size(); ++i) {
        original[i] = std::byte { buffer[i] };
    }

    FixedByteArena working;
    working.assign(original);
    const PatchResult r = patch_ascii(working, offset, count, text);

    ASSERT_EQ(working.size(), original.size());
    const bool touched = r.status == PatchStatus::Written
                         || r.status == PatchStatus::Truncated;
    for (size_t i = 0; i < original.size(); ++i) {
        const bool inside = touched && i >= offset
                            && i < static_cast<uint64_t>(offset) + count;
        if (!inside) {
            ASSERT_EQ(working.bytes()[i], original[i]);
        }
    }
    if (touched) {
        ASSERT_EQ(working.bytes()[offset + count - 1], std::byte { 0 });
    }
}


static void
clock_input_round_trips(uint8_t hour, uint8_t minute, uint8_t second)
{
    CivilTime t;
    t.hour   = hour;
    t.minute = minute;
    t.second = second;
    const std::string text = format_input_time(t);

    GpsTime parsed {};
    const bool ok    = from_input_time(text, &parsed);
    const bool valid = hour < 24 && minute < 60 && second < 60;
    ASSERT_EQ(ok, valid);
    if (ok) {
        ASSERT_EQ(parsed[0], hour);
        ASSERT_EQ(parsed[1], minute);
        ASSERT_EQ(parsed[2], second);
    }
}


FUZZ_TEST(FieldPatchFuzz, ascii_patch_stays_in_range)
    .WithDomains(fuzztest::VectorOf(fuzztest::Arbitrary<uint8_t>())
                     .WithMaxSize(256),
                 fuzztest::InRange<uint32_t>(0, 300),
                 fuzztest::InRange<uint32_t>(0, 64),
                 fuzztest::Arbitrary<std::string>());

FUZZ_TEST(FieldPatchFuzz, clock_input_round_trips)
    .WithDomains(fuzztest::InRange<uint8_t>(0, 99),
                 fuzztest::InRange<uint8_t>(0, 99),
                 fuzztest::InRange<uint8_t>(0, 99));

}  // namespace exifdate
