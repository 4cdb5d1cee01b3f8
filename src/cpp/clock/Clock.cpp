/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/clock/Clock.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] int64_t checkedUnixNano(const CalendarTime& t, const char* ctx)
{
    static const CalendarTime s_first =
        CalendarTime::fromUnix(0, std::numeric_limits<int64_t>::min());
    static const CalendarTime s_last =
        CalendarTime::fromUnix(0, std::numeric_limits<int64_t>::max());

    if (t.before(s_first) || t.after(s_last)) {
        throw std::invalid_argument{fmt::format(
            "{}: start {} outside of [{}, {}]", ctx, t, s_first, s_last)};
    }
    return t.unixNano();
}

}  // namespace

//-------------------------------------------------------------------------

CalendarTime SystemClock::now()
{
    return CalendarTime::now();
}

//-------------------------------------------------------------------------

ManualClock::ManualClock(CalendarTime start, duration step)
    : m_unixNano{checkedUnixNano(start, std::source_location::current().function_name())},
      m_step{step}
{}

//-------------------------------------------------------------------------

CalendarTime ManualClock::now()
{
    return CalendarTime::fromUnix(0, m_unixNano.fetch_add(m_step.count()));
}

//-------------------------------------------------------------------------

void ManualClock::advance(duration d) noexcept
{
    m_unixNano.fetch_add(d.count());
}

//-------------------------------------------------------------------------

void ManualClock::reset(CalendarTime start)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const int64_t next = checkedUnixNano(start, ctx);
    const int64_t prev = m_unixNano.exchange(next);
    if (next < prev) {
        spdlog::debug("ManualClock rewound from {} to {}", CalendarTime::fromUnix(0, prev), start);
    }
}

//-------------------------------------------------------------------------

CalendarTime ManualClock::peek() const noexcept
{
    return CalendarTime::fromUnix(0, m_unixNano.load());
}

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
