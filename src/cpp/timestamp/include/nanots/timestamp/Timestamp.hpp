/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "nanots/calendar/CalendarTime.hpp"
#include "nanots/util/wrapping.hpp"

#include <fmt/format.h>
#include <rapidjson/fwd.h>

#include <chrono>
#include <compare>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace nanots
{

class IClock;

//-------------------------------------------------------------------------
// Instant stored as signed nanoseconds since 1970-01-01T00:00:00 UTC.
//
// The numeric zero stands for the zero (unset) CalendarTime, so the Unix epoch
// itself and the unset instant are indistinguishable once converted. Any value
// is a valid instant; arithmetic wraps modulo 2^64.

class alignas(8) Timestamp
{
public:
    using rep = int64_t;
    using duration = std::chrono::nanoseconds;

    constexpr Timestamp() noexcept = default;
    constexpr explicit Timestamp(rep ns) noexcept : m_ns{ns} {}

    /**
     * Converts t, mapping the zero CalendarTime to 0. Instants outside the
     * representable range saturate to kMinTimestamp or kMaxTimestamp; use
     * outOfRange() first where that matters.
     */
    [[nodiscard]] static Timestamp fromTime(const CalendarTime& t) noexcept;
    [[nodiscard]] static Timestamp now() noexcept;
    [[nodiscard]] static Timestamp now(IClock& clock);
    [[nodiscard]] static Timestamp fromUnix(int64_t sec, int64_t nsec) noexcept;
    [[nodiscard]] static Timestamp zero() noexcept;

    [[nodiscard]] static constexpr Timestamp fromDuration(duration d) noexcept
    {
        return Timestamp{d.count()};
    }

    [[nodiscard]] constexpr rep value() const noexcept { return m_ns; }
    [[nodiscard]] constexpr duration toDuration() const noexcept { return duration{m_ns}; }
    [[nodiscard]] constexpr bool isZero() const noexcept { return m_ns == 0; }

    [[nodiscard]] constexpr Timestamp add(duration d) const noexcept
    {
        return Timestamp{util::wrappingAdd(m_ns, d.count())};
    }

    [[nodiscard]] constexpr Timestamp addTS(Timestamp other) const noexcept
    {
        return Timestamp{util::wrappingAdd(m_ns, other.m_ns)};
    }

    /**
     * Adds the offset of the calendar date 1970+years / 1+months / 1+days
     * (midnight in loc) from the epoch. Throws std::invalid_argument if loc
     * is null.
     */
    [[nodiscard]] Timestamp addDate(int years, int months, int days, const Location* loc) const;

    [[nodiscard]] constexpr duration sub(Timestamp other) const noexcept
    {
        return duration{util::wrappingSub(m_ns, other.m_ns)};
    }

    // Unreliable when t lies outside the representable range.
    [[nodiscard]] duration subTime(const CalendarTime& t) const noexcept;

    [[nodiscard]] constexpr bool after(Timestamp other) const noexcept { return m_ns > other.m_ns; }
    [[nodiscard]] constexpr bool before(Timestamp other) const noexcept { return m_ns < other.m_ns; }
    [[nodiscard]] constexpr bool equal(Timestamp other) const noexcept { return m_ns == other.m_ns; }
    [[nodiscard]] constexpr bool equalTS(Timestamp other) const noexcept { return equal(other); }

    [[nodiscard]] bool afterTime(const CalendarTime& t) const noexcept;
    [[nodiscard]] bool beforeTime(const CalendarTime& t) const noexcept;
    [[nodiscard]] bool equalTime(const CalendarTime& t) const noexcept;

    // Floor to a multiple of d relative to the epoch; d <= 0 is a no-op.
    [[nodiscard]] constexpr Timestamp truncate(duration d) const noexcept
    {
        const rep step = d.count();
        if (step <= 0) return *this;
        const rep q = m_ns / step + ((m_ns % step) >> 63);
        return Timestamp{util::wrappingMul(q, step)};
    }

    [[nodiscard]] CalendarTime truncateTime(duration d) const noexcept;

    [[nodiscard]] CalendarTime toTime() const noexcept;
    [[nodiscard]] CalendarTime in(const Location& loc) const noexcept;
    [[nodiscard]] const Location& location() const noexcept { return Location::utc(); }

    [[nodiscard]] int64_t unixSeconds() const noexcept;
    [[nodiscard]] int64_t unixNano() const noexcept;

    [[nodiscard]] std::string toString() const;
    [[nodiscard]] std::string format(std::string_view layout) const;

    [[nodiscard]] std::vector<uint8_t> marshalBinary() const;
    [[nodiscard]] std::string marshalJSON() const;
    [[nodiscard]] std::string marshalText() const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] friend constexpr bool operator==(Timestamp, Timestamp) noexcept = default;
    [[nodiscard]] friend constexpr auto operator<=>(Timestamp, Timestamp) noexcept = default;

private:
    rep m_ns{};
};

//-------------------------------------------------------------------------

inline constexpr Timestamp kMaxTimestamp{std::numeric_limits<Timestamp::rep>::max()};
inline constexpr Timestamp kMinTimestamp{std::numeric_limits<Timestamp::rep>::min()};

// True when t is not the zero instant and its offset from the epoch reaches
// either extreme, the extremes themselves included.
[[nodiscard]] bool outOfRange(const CalendarTime& t) noexcept;

[[nodiscard]] inline constexpr Timestamp durationToTimestamp(Timestamp::duration d) noexcept
{
    return Timestamp::fromDuration(d);
}

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<nanots::Timestamp>
{
    fmt::string_view layout;

    constexpr auto parse(format_parse_context& ctx)
    {
        auto it = ctx.begin();
        auto end = it;
        while (end != ctx.end() && *end != '}') ++end;
        layout = fmt::string_view{it, static_cast<size_t>(end - it)};
        return end;
    }

    template<typename FormatContext>
    auto format(nanots::Timestamp ts, FormatContext& ctx) const
    {
        if (layout.size() == 0) {
            return fmt::format_to(ctx.out(), "{}", ts.toString());
        }
        return fmt::format_to(
            ctx.out(), "{}", ts.format(std::string_view{layout.data(), layout.size()}));
    }
};

//-------------------------------------------------------------------------
