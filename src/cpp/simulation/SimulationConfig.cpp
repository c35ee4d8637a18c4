/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/simulation/SimulationConfig.hpp"

//-------------------------------------------------------------------------

namespace lobsim::simulation
{

//-------------------------------------------------------------------------

SimulationConfig SimulationConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_attribute attr;
    SimulationConfig config;

    if (attr = node.attribute("steps"); attr.empty() || attr.as_llong() <= 0) {
        throw std::invalid_argument(fmt::format(
            "{}: attribute 'steps' should have a value greater than 0", ctx));
    }
    config.steps = attr.as_llong();

    config.seed = node.attribute("seed").as_ullong();

    if (attr = node.attribute("mode"); !attr.empty()) {
        const auto mode = magic_enum::enum_cast<ActivationMode>(
            attr.as_string(), magic_enum::case_insensitive);
        if (!mode.has_value()) {
            throw std::invalid_argument(fmt::format(
                "{}: unknown activation mode '{}'", ctx, attr.as_string()));
        }
        config.mode = mode.value();
    }

    if (attr = node.attribute("activationRatio"); !attr.empty()) {
        if (const double ratio = attr.as_double(); ratio <= 0.0 || ratio > 1.0) {
            throw std::invalid_argument(fmt::format(
                "{}: attribute 'activationRatio' should be in (0, 1], was {}", ctx, ratio));
        }
        config.activationRatio = attr.as_double();
    }

    return config;
}

//-------------------------------------------------------------------------

}  // namespace lobsim::simulation

//-------------------------------------------------------------------------
