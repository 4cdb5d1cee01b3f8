/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/timestamp/Timestamp.hpp"

#include "nanots/clock/Clock.hpp"
#include "nanots/serialization/json_util.hpp"

#include <rapidjson/document.h>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------

namespace
{

inline constexpr CalendarTime kEpoch = CalendarTime::unixEpoch();

}  // namespace

//-------------------------------------------------------------------------

Timestamp Timestamp::fromTime(const CalendarTime& t) noexcept
{
    // The zero instant lies in year 1, far outside of the representable range.
    if (t.isZero()) return Timestamp{};
    return Timestamp{t.sub(kEpoch).count()};
}

//-------------------------------------------------------------------------

Timestamp Timestamp::now() noexcept
{
    return fromTime(CalendarTime::now());
}

//-------------------------------------------------------------------------

Timestamp Timestamp::now(IClock& clock)
{
    return fromTime(clock.now());
}

//-------------------------------------------------------------------------

Timestamp Timestamp::fromUnix(int64_t sec, int64_t nsec) noexcept
{
    return fromTime(CalendarTime::fromUnix(sec, nsec));
}

//-------------------------------------------------------------------------

Timestamp Timestamp::zero() noexcept
{
    return fromTime(kEpoch);
}

//-------------------------------------------------------------------------

Timestamp Timestamp::addDate(int years, int months, int days, const Location* loc) const
{
    const auto offset = CalendarTime::fromDate(1970 + years, 1 + months, 1 + days, 0, 0, 0, 0, loc);
    return addTS(fromTime(offset));
}

//-------------------------------------------------------------------------

Timestamp::duration Timestamp::subTime(const CalendarTime& t) const noexcept
{
    return toTime().sub(t);
}

//-------------------------------------------------------------------------

bool Timestamp::afterTime(const CalendarTime& t) const noexcept
{
    return toTime().after(t);
}

bool Timestamp::beforeTime(const CalendarTime& t) const noexcept
{
    return toTime().before(t);
}

bool Timestamp::equalTime(const CalendarTime& t) const noexcept
{
    return toTime().equal(t);
}

//-------------------------------------------------------------------------

CalendarTime Timestamp::truncateTime(duration d) const noexcept
{
    return toTime().truncate(d);
}

//-------------------------------------------------------------------------

CalendarTime Timestamp::toTime() const noexcept
{
    if (isZero()) return CalendarTime{};
    return kEpoch.add(toDuration());
}

//-------------------------------------------------------------------------

CalendarTime Timestamp::in(const Location& loc) const noexcept
{
    return toTime().in(loc);
}

//-------------------------------------------------------------------------

int64_t Timestamp::unixSeconds() const noexcept
{
    return toTime().unixSeconds();
}

int64_t Timestamp::unixNano() const noexcept
{
    return toTime().unixNano();
}

//-------------------------------------------------------------------------

std::string Timestamp::toString() const
{
    return toTime().toString();
}

//-------------------------------------------------------------------------

std::string Timestamp::format(std::string_view layout) const
{
    return toTime().format(layout);
}

//-------------------------------------------------------------------------

std::vector<uint8_t> Timestamp::marshalBinary() const
{
    return toTime().marshalBinary();
}

std::string Timestamp::marshalJSON() const
{
    return toTime().marshalJSON();
}

std::string Timestamp::marshalText() const
{
    return toTime().marshalText();
}

//-------------------------------------------------------------------------

void Timestamp::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        const std::string text = marshalText();
        json.SetString(
            text.c_str(), static_cast<rapidjson::SizeType>(text.size()), json.GetAllocator());
    };
    nanots::json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

bool outOfRange(const CalendarTime& t) noexcept
{
    const auto d = t.sub(kEpoch);
    return !t.isZero() && (d <= kMinTimestamp.toDuration() || d >= kMaxTimestamp.toDuration());
}

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
