/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/book/Order.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

class OrderFactory
{
public:
    OrderFactory() noexcept = default;

    [[nodiscard]] OrderID getCounterState() const noexcept { return m_idCounter; }

    // Ids are consumed only by orders that pass validation.
    [[nodiscard]] Order::Ptr makeOrder(const OrderRequest& request) const;

    [[nodiscard]] Order::Ptr makeLimitOrder(
        TraderId traderId,
        OrderDirection direction,
        Quantity quantity,
        decimal_t price,
        Timestep timestep,
        Timestep maxWaitTime = 0) const;

    [[nodiscard]] Order::Ptr makeMarketOrder(
        TraderId traderId,
        OrderDirection direction,
        Quantity quantity,
        std::optional<decimal_t> bound,
        Timestep timestep,
        Timestep maxWaitTime = 0) const;

private:
    mutable OrderID m_idCounter{};
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
