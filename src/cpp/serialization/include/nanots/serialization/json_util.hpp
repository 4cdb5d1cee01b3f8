/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <rapidjson/document.h>

#include <functional>
#include <string>

//-------------------------------------------------------------------------

namespace nanots::json
{

//-------------------------------------------------------------------------

[[nodiscard]] std::string json2str(const rapidjson::Value& json);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

//-------------------------------------------------------------------------

}  // namespace nanots::json

//-------------------------------------------------------------------------
