/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/OrderFactory.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

Order::Ptr OrderFactory::makeOrder(const OrderRequest& request) const
{
    Order::validate(request);
    return Order::Ptr{new Order(m_idCounter++, request)};
}

//-------------------------------------------------------------------------

Order::Ptr OrderFactory::makeLimitOrder(
    TraderId traderId,
    OrderDirection direction,
    Quantity quantity,
    decimal_t price,
    Timestep timestep,
    Timestep maxWaitTime) const
{
    return makeOrder(OrderRequest{
        .traderId = traderId,
        .direction = direction,
        .type = OrderType::LIMIT,
        .quantity = quantity,
        .timestep = timestep,
        .price = price,
        .maxWaitTime = maxWaitTime});
}

//-------------------------------------------------------------------------

Order::Ptr OrderFactory::makeMarketOrder(
    TraderId traderId,
    OrderDirection direction,
    Quantity quantity,
    std::optional<decimal_t> bound,
    Timestep timestep,
    Timestep maxWaitTime) const
{
    return makeOrder(OrderRequest{
        .traderId = traderId,
        .direction = direction,
        .type = OrderType::MARKET,
        .quantity = quantity,
        .timestep = timestep,
        .price = bound,
        .maxWaitTime = maxWaitTime});
}

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
