/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/calendar/serialization/CalendarTime.hpp"
#include "nanots/serialization/MarshalError.hpp"
#include "nanots/serialization/msgpack_util.hpp"

#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <ctime>

//-------------------------------------------------------------------------

using namespace nanots;

using namespace testing;

//-------------------------------------------------------------------------

struct ExtFormTestParams
{
    int64_t sec;
    int64_t nsec;
    uint32_t refSize;
};

void PrintTo(const ExtFormTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.sec = {}, .nsec = {}, .refSize = {}}}", params.sec, params.nsec, params.refSize);
}

struct ExtFormTest : TestWithParam<ExtFormTestParams> {};

TEST_P(ExtFormTest, PicksSmallestForm)
{
    const auto [sec, nsec, refSize] = GetParam();
    serialization::BinaryStream stream;
    msgpack::pack(stream, CalendarTime::fromUnix(sec, nsec));
    msgpack::object_handle oh = msgpack::unpack(stream.data(), stream.size());
    msgpack::object deserialized = oh.get();
    ASSERT_EQ(deserialized.type, msgpack::type::EXT);
    EXPECT_EQ(deserialized.via.ext.type(), -1);
    EXPECT_EQ(deserialized.via.ext.size, refSize);

    const auto ts = deserialized.as<timespec>();
    const auto ref = CalendarTime::fromUnix(sec, nsec);
    EXPECT_EQ(ts.tv_sec, ref.unixSeconds());
    EXPECT_EQ(ts.tv_nsec, ref.nanosecond());
}

INSTANTIATE_TEST_SUITE_P(
    CalendarTimeSerializationTests,
    ExtFormTest,
    Values(
        ExtFormTestParams{.sec = 0, .nsec = 0, .refSize = 4},
        ExtFormTestParams{.sec = (1ll << 32) - 1, .nsec = 0, .refSize = 4},
        ExtFormTestParams{.sec = 1ll << 32, .nsec = 0, .refSize = 8},
        ExtFormTestParams{.sec = 0, .nsec = 1, .refSize = 8},
        ExtFormTestParams{.sec = (1ll << 34) - 1, .nsec = 999'999'999, .refSize = 8},
        ExtFormTestParams{.sec = 1ll << 34, .nsec = 0, .refSize = 12},
        ExtFormTestParams{.sec = -1, .nsec = 0, .refSize = 12},
        ExtFormTestParams{.sec = -62'135'596'800, .nsec = 0, .refSize = 12}
    ));

//-------------------------------------------------------------------------

TEST(CalendarTimeSerializationTest, BinaryBytes)
{
    EXPECT_THAT(
        CalendarTime::fromUnix(1'609'459'200, 0).marshalBinary(),
        ElementsAre(0xd6, 0xff, 0x5f, 0xee, 0x66, 0x00));
    EXPECT_THAT(
        CalendarTime::fromUnix(1'609'459'200, 1).marshalBinary(),
        ElementsAre(0xd8, 0xff, 0x00, 0x00, 0x00, 0x04, 0x5f, 0xee, 0x66, 0x00));
    EXPECT_THAT(
        CalendarTime::fromUnix(-1, 5).marshalBinary(),
        ElementsAre(
            0xc7, 0x0c, 0xff,
            0x00, 0x00, 0x00, 0x05,
            0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff));
}

//-------------------------------------------------------------------------

TEST(CalendarTimeSerializationTest, HumanReadable)
{
    const auto t = CalendarTime::fromUnix(1'609'459'200, 100'000'000);
    serialization::HumanReadableStream stream;
    msgpack::pack(stream, t);
    msgpack::object_handle oh = msgpack::unpack(stream.data(), stream.size());
    msgpack::object deserialized = oh.get();
    EXPECT_EQ(deserialized.as<std::string>(), "2021-01-01T00:00:00.1Z");
}

//-------------------------------------------------------------------------

struct MarshalTextTestParams
{
    CalendarTime value;
    std::string refValue;
};

void PrintTo(const MarshalTextTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.value = {}, .refValue = {}}}", params.value, params.refValue);
}

struct MarshalTextTest : TestWithParam<MarshalTextTestParams> {};

TEST_P(MarshalTextTest, Text)
{
    const auto& [value, refValue] = GetParam();
    EXPECT_EQ(value.marshalText(), refValue);
}

TEST_P(MarshalTextTest, JSON)
{
    const auto& [value, refValue] = GetParam();
    EXPECT_EQ(value.marshalJSON(), fmt::format("\"{}\"", refValue));
}

INSTANTIATE_TEST_SUITE_P(
    CalendarTimeSerializationTests,
    MarshalTextTest,
    Values(
        MarshalTextTestParams{
            .value = CalendarTime::fromUnix(1'609'459'200, 123'456'789),
            .refValue = "2021-01-01T00:00:00.123456789Z"
        },
        MarshalTextTestParams{
            .value = CalendarTime::fromUnix(1'609'459'200, 0),
            .refValue = "2021-01-01T00:00:00Z"
        },
        MarshalTextTestParams{
            .value = CalendarTime::fromUnix(-1, 120'000'000),
            .refValue = "1969-12-31T23:59:59.12Z"
        },
        MarshalTextTestParams{
            .value = CalendarTime{},
            .refValue = "0001-01-01T00:00:00Z"
        },
        MarshalTextTestParams{
            .value = CalendarTime::fromDate(0, 1, 1, 0, 0, 0, 0, &Location::utc()),
            .refValue = "0000-01-01T00:00:00Z"
        },
        MarshalTextTestParams{
            .value = CalendarTime::fromDate(9999, 12, 31, 23, 59, 59, 999'999'999, &Location::utc()),
            .refValue = "9999-12-31T23:59:59.999999999Z"
        }
    ));

//-------------------------------------------------------------------------

TEST(CalendarTimeSerializationTest, MarshalInZone)
{
    Location berlin;
    try {
        berlin = Location::load("Europe/Berlin");
    }
    catch (const std::runtime_error&) {
        GTEST_SKIP() << "time zone database unavailable";
    }
    const auto t = CalendarTime::fromUnix(1'609'459'200, 0).in(berlin);
    EXPECT_EQ(t.marshalText(), "2021-01-01T01:00:00+01:00");
}

//-------------------------------------------------------------------------

struct MarshalRangeTest : TestWithParam<int> {};

TEST_P(MarshalRangeTest, ThrowsOutsideFourDigitYears)
{
    const auto t = CalendarTime::fromDate(GetParam(), 1, 1, 0, 0, 0, 0, &Location::utc());
    EXPECT_THROW(static_cast<void>(t.marshalText()), MarshalError);
    EXPECT_THROW(static_cast<void>(t.marshalJSON()), MarshalError);

    serialization::HumanReadableStream stream;
    EXPECT_THROW(msgpack::pack(stream, t), MarshalError);
}

INSTANTIATE_TEST_SUITE_P(
    CalendarTimeSerializationTests,
    MarshalRangeTest,
    Values(-1, 10'000, 32'767, -32'767));

TEST(CalendarTimeSerializationTest, BinaryHasNoYearLimit)
{
    const auto t = CalendarTime::fromDate(10'000, 1, 1, 0, 0, 0, 0, &Location::utc());
    EXPECT_EQ(t.marshalBinary().size(), 15u);
}

//-------------------------------------------------------------------------
