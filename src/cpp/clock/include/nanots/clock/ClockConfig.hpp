/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "nanots/clock/Clock.hpp"
#include "nanots/util/wrapping.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------

enum class Timescale { s, ms, us, ns };

inline constexpr auto kTimescaleCount = magic_enum::enum_count<Timescale>();

inline constexpr std::array<int64_t, kTimescaleCount> timescaleFactor{
    1'000'000'000,
    1'000'000,
    1'000,
    1
};

// Nanoseconds per unit of ts.
[[nodiscard]] inline constexpr int64_t timescaleToFactor(Timescale ts) noexcept
{
    return timescaleFactor[std::to_underlying(ts)];
}

[[nodiscard]] inline constexpr std::chrono::nanoseconds scaled(int64_t count, Timescale ts) noexcept
{
    return std::chrono::nanoseconds{util::wrappingMul(count, timescaleToFactor(ts))};
}

//-------------------------------------------------------------------------

enum class ClockType { system, manual };

//-------------------------------------------------------------------------

struct ClockConfig
{
    ClockType type{};
    int64_t start{}, step{1};
    Timescale scale{Timescale::ns};

    ClockConfig() noexcept = default;
    ClockConfig(ClockType type, int64_t start, int64_t step, Timescale scale) noexcept;

    /**
     * Reads a <Clock type="..." start="..." step="..." timescale="..."/> node.
     * The type is mandatory; an unknown or missing timescale falls back to ns.
     */
    [[nodiscard]] static ClockConfig fromXML(pugi::xml_node node);
};

[[nodiscard]] std::unique_ptr<IClock> makeClock(const ClockConfig& config);

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<nanots::Timescale>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(nanots::Timescale ts, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(ts));
    }
};

template<>
struct fmt::formatter<nanots::ClockType>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(nanots::ClockType type, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(type));
    }
};

//-------------------------------------------------------------------------
