/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

struct MarketSnapshot
{
    double lastPrice{};
    double fundamentalPrice{};
    std::span<const double> logReturns{};
    std::optional<decimal_t> bestBid{};
    std::optional<decimal_t> bestAsk{};
};

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------
