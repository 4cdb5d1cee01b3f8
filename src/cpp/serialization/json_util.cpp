/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/serialization/json_util.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

//-------------------------------------------------------------------------

namespace nanots::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer writer{buffer};
    json.Accept(writer);
    return buffer.GetString();
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace nanots::json

//-------------------------------------------------------------------------
