/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/serialization/JsonSerializable.hpp"

#include <random>

//-------------------------------------------------------------------------

namespace lobsim::process
{

//-------------------------------------------------------------------------

class RNG : public std::mt19937, public JsonSerializable
{
public:
    explicit RNG(uint64_t seed = std::mt19937::default_seed) noexcept;

    std::mt19937::result_type operator()();

    [[nodiscard]] uint64_t seed() const noexcept { return m_seed; }
    [[nodiscard]] uint64_t callCount() const noexcept { return m_callCount; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    uint64_t m_callCount{};
    uint64_t m_seed;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::process

//-------------------------------------------------------------------------
