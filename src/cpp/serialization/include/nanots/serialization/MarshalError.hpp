/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace nanots
{

class MarshalError : public std::runtime_error
{
public:
    MarshalError(const std::string& message) : std::runtime_error(message) {}
    MarshalError(const MarshalError& exception) = default;
    MarshalError(MarshalError&& exception) = default;
};

}  // namespace nanots

//-------------------------------------------------------------------------
