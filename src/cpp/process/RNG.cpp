/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/process/RNG.hpp"

//-------------------------------------------------------------------------

namespace lobsim::process
{

//-------------------------------------------------------------------------

RNG::RNG(uint64_t seed) noexcept
    : std::mt19937{static_cast<std::mt19937::result_type>(seed)}, m_seed{seed}
{}

//-------------------------------------------------------------------------

std::mt19937::result_type RNG::operator()()
{
    ++m_callCount;
    return std::mt19937::operator()();
}

//-------------------------------------------------------------------------

void RNG::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("callCount", rapidjson::Value{m_callCount}, allocator);
        json.AddMember("seed", rapidjson::Value{m_seed}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lobsim::process

//-------------------------------------------------------------------------
