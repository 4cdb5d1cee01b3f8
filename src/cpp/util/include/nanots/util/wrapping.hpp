/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------
// Two's complement arithmetic on int64_t that wraps modulo 2^64 instead of
// overflowing into undefined behaviour.

namespace nanots::util
{

//-------------------------------------------------------------------------

[[nodiscard]] inline constexpr int64_t wrappingAdd(int64_t lhs, int64_t rhs) noexcept
{
    return static_cast<int64_t>(static_cast<uint64_t>(lhs) + static_cast<uint64_t>(rhs));
}

[[nodiscard]] inline constexpr int64_t wrappingSub(int64_t lhs, int64_t rhs) noexcept
{
    return static_cast<int64_t>(static_cast<uint64_t>(lhs) - static_cast<uint64_t>(rhs));
}

[[nodiscard]] inline constexpr int64_t wrappingMul(int64_t lhs, int64_t rhs) noexcept
{
    return static_cast<int64_t>(static_cast<uint64_t>(lhs) * static_cast<uint64_t>(rhs));
}

//-------------------------------------------------------------------------

[[nodiscard]] inline constexpr int64_t floorDiv(int64_t num, int64_t den) noexcept
{
    const int64_t q = num / den;
    return (num % den != 0 && (num < 0) != (den < 0)) ? q - 1 : q;
}

[[nodiscard]] inline constexpr int64_t floorMod(int64_t num, int64_t den) noexcept
{
    const int64_t r = num % den;
    return (r != 0 && (r < 0) != (den < 0)) ? r + den : r;
}

//-------------------------------------------------------------------------

}  // namespace nanots::util

//-------------------------------------------------------------------------
