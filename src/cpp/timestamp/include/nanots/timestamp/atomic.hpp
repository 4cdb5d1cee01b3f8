/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "nanots/timestamp/Timestamp.hpp"

#include <atomic>
#include <type_traits>

//-------------------------------------------------------------------------
// Sequentially consistent access to a Timestamp shared between threads. Every
// access to such a location must go through these functions.

namespace nanots
{

//-------------------------------------------------------------------------

static_assert(std::is_trivially_copyable_v<Timestamp>);
static_assert(std::atomic_ref<Timestamp>::is_always_lock_free);
static_assert(alignof(Timestamp) >= std::atomic_ref<Timestamp>::required_alignment);

//-------------------------------------------------------------------------

inline void atomicStore(Timestamp& ts, Timestamp v) noexcept
{
    std::atomic_ref{ts}.store(v);
}

[[nodiscard]] inline Timestamp atomicLoad(Timestamp& ts) noexcept
{
    return std::atomic_ref{ts}.load();
}

// Returns the value replaced by v.
inline Timestamp atomicSwap(Timestamp& ts, Timestamp v) noexcept
{
    return std::atomic_ref{ts}.exchange(v);
}

// Stores newv only if ts currently holds oldv; returns whether it did.
inline bool atomicCompareAndSwap(Timestamp& ts, Timestamp oldv, Timestamp newv) noexcept
{
    return std::atomic_ref{ts}.compare_exchange_strong(oldv, newv);
}

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
