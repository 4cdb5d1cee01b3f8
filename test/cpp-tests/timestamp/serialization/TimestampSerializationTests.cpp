/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/serialization/MarshalError.hpp"
#include "nanots/serialization/json_util.hpp"
#include "nanots/serialization/msgpack_util.hpp"
#include "nanots/timestamp/serialization/Timestamp.hpp"

#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <rapidjson/document.h>

//-------------------------------------------------------------------------

using namespace nanots;

using namespace testing;

//-------------------------------------------------------------------------

struct TimestampSerializationTest : TestWithParam<Timestamp>
{
    virtual void SetUp() override
    {
        refValue = GetParam();
    }

    Timestamp refValue;
};

//-------------------------------------------------------------------------

TEST_P(TimestampSerializationTest, BinaryMatchesTime)
{
    EXPECT_EQ(refValue.marshalBinary(), refValue.toTime().marshalBinary());

    serialization::BinaryStream stream;
    msgpack::pack(stream, refValue);
    EXPECT_EQ(stream.bytes(), refValue.marshalBinary());
}

TEST_P(TimestampSerializationTest, TextMatchesTime)
{
    EXPECT_EQ(refValue.marshalText(), refValue.toTime().marshalText());
    EXPECT_EQ(refValue.marshalJSON(), refValue.toTime().marshalJSON());

    serialization::HumanReadableStream stream;
    msgpack::pack(stream, refValue);
    msgpack::object_handle oh = msgpack::unpack(stream.data(), stream.size());
    msgpack::object deserialized = oh.get();
    EXPECT_EQ(deserialized.as<std::string>(), refValue.marshalText());
}

INSTANTIATE_TEST_SUITE_P(
    TimestampSerializationTests,
    TimestampSerializationTest,
    Values(
        Timestamp{},
        Timestamp{1},
        Timestamp{-1},
        Timestamp::fromUnix(1'609'459'200, 123'456'789),
        kMaxTimestamp,
        kMinTimestamp
    ));

//-------------------------------------------------------------------------

TEST(TimestampMarshalTest, Text)
{
    EXPECT_EQ(Timestamp{}.marshalText(), "0001-01-01T00:00:00Z");
    EXPECT_EQ(
        Timestamp::fromUnix(1'609'459'200, 123'456'789).marshalText(),
        "2021-01-01T00:00:00.123456789Z");
    EXPECT_EQ(kMaxTimestamp.marshalJSON(), "\"2262-04-11T23:47:16.854775807Z\"");
    EXPECT_EQ(kMinTimestamp.marshalText(), "1677-09-21T00:12:43.145224192Z");
}

TEST(TimestampMarshalTest, Binary)
{
    EXPECT_THAT(
        Timestamp::fromUnix(1'609'459'200, 0).marshalBinary(),
        ElementsAre(0xd6, 0xff, 0x5f, 0xee, 0x66, 0x00));
    EXPECT_EQ(Timestamp{}.marshalBinary().size(), 15u);
}

//-------------------------------------------------------------------------

TEST(TimestampMarshalTest, JsonSerializeAsMember)
{
    rapidjson::Document doc;
    doc.SetObject();
    Timestamp::fromUnix(1'609'459'200, 500'000'000).jsonSerialize(doc, "timestamp");
    ASSERT_TRUE(doc.HasMember("timestamp"));
    EXPECT_STREQ(doc["timestamp"].GetString(), "2021-01-01T00:00:00.5Z");
    EXPECT_EQ(json::json2str(doc), R"({"timestamp":"2021-01-01T00:00:00.5Z"})");
}

TEST(TimestampMarshalTest, JsonSerializeInPlace)
{
    rapidjson::Document doc;
    Timestamp::fromUnix(-1, 0).jsonSerialize(doc);
    ASSERT_TRUE(doc.IsString());
    EXPECT_STREQ(doc.GetString(), "1969-12-31T23:59:59Z");
}

//-------------------------------------------------------------------------
