/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/serialization/json_util.hpp"

#include <concepts>
#include <memory>

//-------------------------------------------------------------------------

namespace lobsim
{

class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    JsonSerializable() noexcept = default;
};

}  // namespace lobsim

//-------------------------------------------------------------------------

namespace lobsim::json
{

template<typename T>
concept IsJsonSerializable =
    std::derived_from<std::remove_cvref_t<T>, JsonSerializable>;

[[nodiscard]] std::string jsonSerializable2str(
    const IsJsonSerializable auto& serializable, const FormatOptions& formatOptions = {})
{
    rapidjson::Document json;
    serializable.jsonSerialize(json);
    return json2str(json, formatOptions);
}

}  // namespace lobsim::json

//-------------------------------------------------------------------------
