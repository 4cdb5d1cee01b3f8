/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/clock/ClockConfig.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------

ClockConfig::ClockConfig(ClockType type, int64_t start, int64_t step, Timescale scale) noexcept
    : type{type}, start{start}, step{step}, scale{scale}
{}

//-------------------------------------------------------------------------

ClockConfig ClockConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto timescaleFallback = [] {
        static constexpr auto fallback = Timescale::ns;
        spdlog::warn("Unknown or missing attribute 'timescale', falling back to '{}'", fallback);
        return std::make_optional(fallback);
    };

    const auto typeAttr = node.attribute("type");
    const auto type = magic_enum::enum_cast<ClockType>(typeAttr.as_string());
    if (!type.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: unknown or missing attribute 'type' = '{}'", ctx, typeAttr.as_string())};
    }

    return ClockConfig{
        type.value(),
        node.attribute("start").as_llong(0),
        node.attribute("step").as_llong(1),
        magic_enum::enum_cast<Timescale>(
            node.attribute("timescale").as_string()).or_else(timescaleFallback).value()};
}

//-------------------------------------------------------------------------

std::unique_ptr<IClock> makeClock(const ClockConfig& config)
{
    if (config.type == ClockType::system) {
        spdlog::info("Using {} clock", config.type);
        return std::make_unique<SystemClock>();
    }

    const auto start = CalendarTime::unixEpoch().add(scaled(config.start, config.scale));
    const auto step = scaled(config.step, config.scale);
    spdlog::info(
        "Using {} clock starting at {} with step {}{}",
        config.type,
        start,
        config.step,
        config.scale);
    return std::make_unique<ManualClock>(start, step);
}

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
