/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "nanots/calendar/CalendarTime.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------

class IClock
{
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual CalendarTime now() = 0;

protected:
    IClock() = default;
};

//-------------------------------------------------------------------------

class SystemClock : public IClock
{
public:
    [[nodiscard]] CalendarTime now() override;
};

//-------------------------------------------------------------------------
// Deterministic clock for tests and replays. Each read returns the current
// instant and then moves it forward by step, so concurrent readers never
// observe the same instant unless step is zero. The instant is held as int64
// nanoseconds since the Unix epoch; a start outside of that range throws
// std::invalid_argument.

class ManualClock : public IClock
{
public:
    using duration = std::chrono::nanoseconds;

    explicit ManualClock(
        CalendarTime start = CalendarTime::unixEpoch(), duration step = duration{1});

    [[nodiscard]] CalendarTime now() override;

    void advance(duration d) noexcept;
    void reset(CalendarTime start);

    [[nodiscard]] CalendarTime peek() const noexcept;
    [[nodiscard]] duration step() const noexcept { return m_step; }

private:
    std::atomic<int64_t> m_unixNano;
    duration m_step;
};

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
