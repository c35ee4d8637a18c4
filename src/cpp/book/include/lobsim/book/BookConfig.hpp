/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

enum class SweepRejectPolicy : uint32_t
{
    RESTORE,
    DISCARD
};

struct BookConfig
{
    // What happens to a resting order popped during a sweep whose price fails the bound.
    SweepRejectPolicy sweepRejectPolicy{SweepRejectPolicy::RESTORE};

    [[nodiscard]] static BookConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lobsim::book::SweepRejectPolicy>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lobsim::book::SweepRejectPolicy policy, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(policy));
    }
};

//-------------------------------------------------------------------------
