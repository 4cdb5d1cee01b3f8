/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "nanots/calendar/CalendarTime.hpp"
#include "nanots/serialization/msgpack_util.hpp"

#include <concepts>
#include <ctime>

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct pack<nanots::CalendarTime>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const nanots::CalendarTime& v) const
    {
        if constexpr (std::same_as<Stream, nanots::serialization::HumanReadableStream>) {
            o.pack(v.marshalText());
        }
        else if constexpr (std::same_as<Stream, nanots::serialization::BinaryStream>) {
            o.pack(timespec{.tv_sec = v.unixSeconds(), .tv_nsec = v.nanosecond()});
        }
        else {
            static_assert(sizeof(Stream) == 0, "Unrecognized Stream type");
        }
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
