/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/OrderFactory.hpp"
#include "lobsim/book/OrderQueue.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace lobsim;
using namespace lobsim::book;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

template<typename Queue>
std::vector<OrderID> drain(Queue& queue)
{
    std::vector<OrderID> ids;
    while (!queue.empty()) {
        ids.push_back(queue.pop()->id());
    }
    return ids;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(OrderQueueTest, BidsPopHighestPriceThenLowestId)
{
    const OrderFactory factory;
    BuyQueue queue;

    for (auto price : {DEC(10.0), DEC(10.5), DEC(10.0), DEC(9.5), DEC(10.5)}) {
        queue.push(factory.makeLimitOrder(1, OrderDirection::BUY, 1, price, 0));
    }

    EXPECT_THAT(drain(queue), ElementsAre(1, 4, 0, 2, 3));
}

//-------------------------------------------------------------------------

TEST(OrderQueueTest, AsksPopLowestPriceThenLowestId)
{
    const OrderFactory factory;
    SellQueue queue;

    for (auto price : {DEC(10.0), DEC(10.5), DEC(10.0), DEC(9.5), DEC(10.5)}) {
        queue.push(factory.makeLimitOrder(1, OrderDirection::SELL, 1, price, 0));
    }

    EXPECT_THAT(drain(queue), ElementsAre(3, 0, 2, 1, 4));
}

//-------------------------------------------------------------------------

TEST(OrderQueueTest, EraseIfKeepsHeapOrder)
{
    const OrderFactory factory;
    SellQueue queue;

    for (int i = 0; i < 8; ++i) {
        queue.push(factory.makeLimitOrder(1, OrderDirection::SELL, 1, DEC(10.0) + decimal_t{i % 3}, 0));
    }

    EXPECT_EQ(queue.eraseIf([](const Order::Ptr& order) { return order->id() % 2 == 0; }), 4);
    EXPECT_EQ(queue.size(), 4);
    EXPECT_EQ(queue.eraseIf([](const Order::Ptr&) { return false; }), 0);

    // ids 1, 3, 5, 7 priced 11, 10, 12, 11
    EXPECT_THAT(drain(queue), ElementsAre(3, 1, 7, 5));
}

//-------------------------------------------------------------------------
