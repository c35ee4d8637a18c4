/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/serialization/json_util.hpp"

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

//-------------------------------------------------------------------------

namespace lobsim::json
{

//-------------------------------------------------------------------------

namespace
{

template<typename OutputStream>
void write(const rapidjson::Value& json, OutputStream& os, const FormatOptions& formatOptions)
{
    if (formatOptions.indent.has_value()) {
        rapidjson::PrettyWriter writer{os};
        writer.SetIndent(
            formatOptions.indent->indentChar, formatOptions.indent->indentCharCount);
        writer.SetMaxDecimalPlaces(formatOptions.decimals);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{os};
        writer.SetMaxDecimalPlaces(formatOptions.decimals);
        json.Accept(writer);
    }
}

}  // namespace

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    rapidjson::StringBuffer buffer;
    write(json, buffer, formatOptions);
    return buffer.GetString();
}

//-------------------------------------------------------------------------

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions)
{
    rapidjson::OStreamWrapper osw{ofs};
    write(json, osw, formatOptions);
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) {
        serializer(json);
        return;
    }
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace lobsim::json

//-------------------------------------------------------------------------
