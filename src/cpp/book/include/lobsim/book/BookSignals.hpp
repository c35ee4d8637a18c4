/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/book/Order.hpp"
#include "lobsim/book/Trade.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

struct BookSignals
{
    UnsyncSignal<void(Order::Ptr)> orderSubmitted;
    UnsyncSignal<void(Trade::Ptr)> trade;
    UnsyncSignal<void(Order::Ptr, Timestep)> cancel;
    UnsyncSignal<void(Order::Ptr)> unmatched;
    // (original market order, resubmitted limit order)
    UnsyncSignal<void(Order::Ptr, Order::Ptr)> remainderConverted;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
