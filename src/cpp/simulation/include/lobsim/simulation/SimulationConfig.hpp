/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::simulation
{

//-------------------------------------------------------------------------

// Which traders are asked for an order within one step.
enum class ActivationMode : uint32_t
{
    SINGLE,
    PARTIAL,
    ALL
};

struct SimulationConfig
{
    Timestep steps{};
    uint64_t seed{};
    ActivationMode mode{ActivationMode::ALL};
    double activationRatio{0.1};

    [[nodiscard]] static SimulationConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace lobsim::simulation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lobsim::simulation::ActivationMode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lobsim::simulation::ActivationMode mode, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(mode));
    }
};

//-------------------------------------------------------------------------
