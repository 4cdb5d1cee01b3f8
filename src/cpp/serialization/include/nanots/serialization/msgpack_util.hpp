/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <msgpack.hpp>

#include <cstdint>
#include <vector>

//-------------------------------------------------------------------------

namespace nanots::serialization
{

//-------------------------------------------------------------------------

class HumanReadableStream
{
    msgpack::sbuffer m_underlying;

public:
    explicit HumanReadableStream(size_t initByteSize = MSGPACK_SBUFFER_INIT_SIZE)
        : m_underlying{initByteSize}
    {}

    [[nodiscard]] const char* data() const noexcept { return m_underlying.data(); }
    [[nodiscard]] size_t size() const noexcept { return m_underlying.size(); }

    void write(const char* buf, size_t len) { m_underlying.write(buf, len); }
};

class BinaryStream
{
    msgpack::sbuffer m_underlying;

public:
    explicit BinaryStream(size_t initByteSize = MSGPACK_SBUFFER_INIT_SIZE)
        : m_underlying{initByteSize}
    {}

    [[nodiscard]] const char* data() const noexcept { return m_underlying.data(); }
    [[nodiscard]] size_t size() const noexcept { return m_underlying.size(); }

    void write(const char* buf, size_t len) { m_underlying.write(buf, len); }

    [[nodiscard]] std::vector<uint8_t> bytes() const
    {
        const auto* first = reinterpret_cast<const uint8_t*>(data());
        return std::vector<uint8_t>(first, first + size());
    }
};

//-------------------------------------------------------------------------

}  // namespace nanots::serialization

//-------------------------------------------------------------------------
