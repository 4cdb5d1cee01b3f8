/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <date/date.h>
#include <date/tz.h>

#include <chrono>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------
// Time zone used to interpret calendar fields. The default-constructed
// Location is the built-in UTC, which needs no time zone database; any other
// Location refers to a zone owned by the date library's tzdb.

class Location
{
public:
    struct Offset
    {
        std::chrono::seconds offset{};
        std::string abbrev;
    };

    constexpr Location() noexcept = default;
    constexpr explicit Location(const date::time_zone* zone) noexcept : m_zone{zone} {}

    [[nodiscard]] static const Location& utc() noexcept;
    [[nodiscard]] static Location load(std::string_view name);

    [[nodiscard]] constexpr bool isUTC() const noexcept { return m_zone == nullptr; }
    [[nodiscard]] constexpr const date::time_zone* zone() const noexcept { return m_zone; }
    [[nodiscard]] std::string_view name() const noexcept;

    [[nodiscard]] Offset lookup(date::sys_seconds t) const;
    [[nodiscard]] date::sys_seconds toSys(date::local_seconds t) const;

    [[nodiscard]] constexpr bool operator==(const Location& other) const noexcept = default;

private:
    const date::time_zone* m_zone{};
};

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
