/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/BookConfig.hpp"

#include <fmt/ranges.h>

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

BookConfig BookConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    BookConfig config;

    if (pugi::xml_attribute attr = node.attribute("sweepRejectPolicy")) {
        const auto policy = magic_enum::enum_cast<SweepRejectPolicy>(
            attr.as_string(), magic_enum::case_insensitive);
        if (!policy.has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: Unknown sweepRejectPolicy '{}', expected one of {}",
                ctx,
                attr.as_string(),
                fmt::join(magic_enum::enum_names<SweepRejectPolicy>(), ", "))};
        }
        config.sweepRejectPolicy = policy.value();
    }

    return config;
}

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
