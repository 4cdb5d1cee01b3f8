/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "nanots/calendar/Location.hpp"

#include <date/date.h>
#include <fmt/format.h>

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------
// Calendar instant with nanosecond precision over a range of roughly
// +/- 292 billion years. The default-constructed value is the zero (unset)
// instant, 0001-01-01 00:00:00 UTC, and is distinct from the Unix epoch.
//
// Equality and ordering compare instants only; the Location affects
// rendering, not identity.

class CalendarTime
{
public:
    using duration = std::chrono::nanoseconds;

    static constexpr date::sys_seconds kZeroSeconds{
        date::sys_days{date::year{1} / date::January / 1}};

    CalendarTime() noexcept = default;

    [[nodiscard]] static CalendarTime now() noexcept;
    [[nodiscard]] static CalendarTime fromUnix(int64_t sec, int64_t nsec) noexcept;
    [[nodiscard]] static CalendarTime fromSysTime(date::sys_time<duration> tp) noexcept;

    /**
     * Instant corresponding to the given wall clock fields in loc. Fields
     * outside their usual ranges are normalized, so month 13 is January of
     * the next year and day 0 the last day of the previous month. A local
     * time that occurs twice resolves to the earlier instant, and one that
     * falls in a gap resolves to the transition itself. Throws
     * std::invalid_argument if loc is null.
     */
    [[nodiscard]] static CalendarTime fromDate(
        int year, int month, int day, int hour, int min, int sec, int nsec, const Location* loc);

    [[nodiscard]] static constexpr CalendarTime unixEpoch() noexcept
    {
        return CalendarTime{date::sys_seconds{}, duration{}, Location{}};
    }

    [[nodiscard]] bool isZero() const noexcept;

    /**
     * t - u, saturated to the nanoseconds range. The result is
     * duration::max() or duration::min() when the true difference
     * does not fit.
     */
    [[nodiscard]] duration sub(const CalendarTime& u) const noexcept;
    [[nodiscard]] CalendarTime add(duration d) const noexcept;

    [[nodiscard]] CalendarTime utc() const noexcept;
    [[nodiscard]] CalendarTime in(const Location& loc) const noexcept;

    // Rounds down to a multiple of d since the zero instant; d <= 0 is a no-op.
    [[nodiscard]] CalendarTime truncate(duration d) const noexcept;

    [[nodiscard]] bool before(const CalendarTime& u) const noexcept;
    [[nodiscard]] bool after(const CalendarTime& u) const noexcept;
    [[nodiscard]] bool equal(const CalendarTime& u) const noexcept;

    [[nodiscard]] int64_t unixSeconds() const noexcept { return m_sec.time_since_epoch().count(); }
    [[nodiscard]] int64_t unixNano() const noexcept;
    [[nodiscard]] int32_t nanosecond() const noexcept { return static_cast<int32_t>(m_nsec.count()); }
    [[nodiscard]] const Location& location() const noexcept { return m_loc; }

    [[nodiscard]] std::string toString() const;
    [[nodiscard]] std::string format(std::string_view layout) const;

    [[nodiscard]] std::vector<uint8_t> marshalBinary() const;
    [[nodiscard]] std::string marshalJSON() const;
    [[nodiscard]] std::string marshalText() const;

    [[nodiscard]] friend bool operator==(const CalendarTime& lhs, const CalendarTime& rhs) noexcept
    {
        return lhs.equal(rhs);
    }

    [[nodiscard]] friend std::strong_ordering operator<=>(
        const CalendarTime& lhs, const CalendarTime& rhs) noexcept
    {
        if (const auto cmp = lhs.m_sec <=> rhs.m_sec; cmp != 0) return cmp;
        return lhs.m_nsec <=> rhs.m_nsec;
    }

private:
    constexpr CalendarTime(date::sys_seconds sec, duration nsec, Location loc) noexcept
        : m_sec{sec}, m_nsec{nsec}, m_loc{loc}
    {}

    date::sys_seconds m_sec{kZeroSeconds};
    duration m_nsec{};
    Location m_loc{};
};

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<nanots::CalendarTime>
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
    auto format(const nanots::CalendarTime& t, FormatContext& ctx) const
    {
        if (layout.size() == 0) {
            return fmt::format_to(ctx.out(), "{}", t.toString());
        }
        return fmt::format_to(
            ctx.out(), "{}", t.format(std::string_view{layout.data(), layout.size()}));
    }
};

//-------------------------------------------------------------------------
