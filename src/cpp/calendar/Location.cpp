/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/calendar/Location.hpp"

#include <string>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------

const Location& Location::utc() noexcept
{
    static constexpr Location s_utc{};
    return s_utc;
}

//-------------------------------------------------------------------------

Location Location::load(std::string_view name)
{
    if (name.empty() || name == "UTC") {
        return utc();
    }
    return Location{date::locate_zone(std::string{name})};
}

//-------------------------------------------------------------------------

std::string_view Location::name() const noexcept
{
    if (isUTC()) return "UTC";
    return m_zone->name();
}

//-------------------------------------------------------------------------

Location::Offset Location::lookup(date::sys_seconds t) const
{
    if (isUTC()) {
        return {.offset = std::chrono::seconds{0}, .abbrev = "UTC"};
    }
    const date::sys_info info = m_zone->get_info(t);
    return {.offset = info.offset, .abbrev = info.abbrev};
}

//-------------------------------------------------------------------------

date::sys_seconds Location::toSys(date::local_seconds t) const
{
    if (isUTC()) {
        return date::sys_seconds{t.time_since_epoch()};
    }
    // Nonexistent local times map to the transition instant.
    return m_zone->to_sys(t, date::choose::earliest);
}

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
