/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/Order.hpp"
#include "lobsim/book/OrderFactory.hpp"
#include "lobsim/serialization/JsonSerializable.hpp"
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

OrderRequest limitRequest(
    OrderDirection direction, Quantity quantity, decimal_t price, Timestep maxWaitTime = 10)
{
    return {
        .traderId = 1,
        .direction = direction,
        .type = OrderType::LIMIT,
        .quantity = quantity,
        .timestep = 0,
        .price = price,
        .maxWaitTime = maxWaitTime};
}

}  // namespace

//-------------------------------------------------------------------------

struct InvalidRequestTest : TestWithParam<OrderRequest> {};

TEST_P(InvalidRequestTest, Throws)
{
    EXPECT_THROW(Order(0, GetParam()), InvalidOrder);
}

INSTANTIATE_TEST_SUITE_P(
    OrderTest,
    InvalidRequestTest,
    Values(
        OrderRequest{.type = OrderType::LIMIT, .quantity = 0, .price = DEC(10.0)},
        OrderRequest{.type = OrderType::LIMIT, .quantity = -5, .price = DEC(10.0)},
        OrderRequest{.type = OrderType::LIMIT, .quantity = 5},
        OrderRequest{.type = OrderType::LIMIT, .quantity = 5, .price = DEC(0.0)},
        OrderRequest{.type = OrderType::LIMIT, .quantity = 5, .price = -DEC(1.5)},
        OrderRequest{.type = OrderType::MARKET, .quantity = 5, .price = DEC(0.0)},
        OrderRequest{
            .type = OrderType::LIMIT, .quantity = 5, .price = DEC(10.0), .maxWaitTime = -1},
        OrderRequest{
            .direction = static_cast<OrderDirection>(7),
            .type = OrderType::MARKET,
            .quantity = 5},
        OrderRequest{.type = static_cast<OrderType>(3), .quantity = 5, .price = DEC(10.0)}));

//-------------------------------------------------------------------------

TEST(OrderTest, InvalidOrderIsInvalidArgument)
{
    EXPECT_THROW(Order(0, OrderRequest{.quantity = 0}), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(OrderTest, MarketOrderWithoutBoundIsValid)
{
    const Order order{
        3, OrderRequest{.traderId = 9, .direction = OrderDirection::SELL, .type = OrderType::MARKET, .quantity = 5}};

    EXPECT_EQ(order.id(), 3);
    EXPECT_EQ(order.traderId(), 9);
    EXPECT_EQ(order.status(), OrderStatus::PENDING);
    EXPECT_FALSE(order.price().has_value());
    EXPECT_FALSE(order.executedPrice().has_value());
    EXPECT_FALSE(order.executedTimestep().has_value());
}

//-------------------------------------------------------------------------

TEST(OrderTest, PartialThenFinalFill)
{
    Order order{0, limitRequest(OrderDirection::BUY, 500, DEC(10.1))};

    order.execute(DEC(10.1), 3, 200);
    EXPECT_EQ(order.quantity(), 300);
    EXPECT_EQ(order.status(), OrderStatus::PENDING);
    EXPECT_THAT(order.executedPrice(), Optional(DEC(10.1)));
    EXPECT_THAT(order.executedTimestep(), Optional(3));

    order.execute(DEC(10.0), 4, 300);
    EXPECT_EQ(order.quantity(), 0);
    EXPECT_EQ(order.status(), OrderStatus::EXECUTED);
    EXPECT_THAT(order.executedPrice(), Optional(DEC(10.0)));
    EXPECT_THAT(order.executedTimestep(), Optional(4));
}

//-------------------------------------------------------------------------

TEST(OrderTest, IllegalFillsThrow)
{
    Order order{0, limitRequest(OrderDirection::SELL, 100, DEC(10.0))};

    EXPECT_THROW(order.execute(DEC(10.0), 0, 101), std::logic_error);
    EXPECT_THROW(order.execute(DEC(10.0), 0, 0), std::logic_error);
    EXPECT_EQ(order.quantity(), 100);

    order.execute(DEC(10.0), 0, 100);
    EXPECT_THROW(order.execute(DEC(10.0), 0, 1), std::logic_error);

    Order cancelled{1, limitRequest(OrderDirection::SELL, 100, DEC(10.0), 0)};
    ASSERT_TRUE(cancelled.checkTimeout(1));
    EXPECT_THROW(cancelled.execute(DEC(10.0), 1, 10), std::logic_error);
}

//-------------------------------------------------------------------------

TEST(OrderTest, CheckTimeout)
{
    Order order{0, limitRequest(OrderDirection::BUY, 10, DEC(5.0), 5)};

    EXPECT_FALSE(order.checkTimeout(0));
    EXPECT_FALSE(order.checkTimeout(5));
    EXPECT_EQ(order.status(), OrderStatus::PENDING);

    EXPECT_TRUE(order.checkTimeout(6));
    EXPECT_EQ(order.status(), OrderStatus::CANCELLED);

    EXPECT_TRUE(order.checkTimeout(6));
    EXPECT_TRUE(order.checkTimeout(100));
    EXPECT_EQ(order.status(), OrderStatus::CANCELLED);
}

//-------------------------------------------------------------------------

TEST(OrderTest, CheckTimeoutNeverCancelsExecuted)
{
    Order order{0, limitRequest(OrderDirection::BUY, 10, DEC(5.0), 0)};
    order.execute(DEC(5.0), 0, 10);

    EXPECT_FALSE(order.checkTimeout(1000));
    EXPECT_EQ(order.status(), OrderStatus::EXECUTED);
}

//-------------------------------------------------------------------------

TEST(OrderTest, IsExecutable)
{
    const Order buy{0, limitRequest(OrderDirection::BUY, 10, DEC(10.0))};
    const Order sell{1, limitRequest(OrderDirection::SELL, 10, DEC(10.0))};
    const Order market{2, OrderRequest{.type = OrderType::MARKET, .quantity = 1}};

    EXPECT_TRUE(buy.isExecutable(std::nullopt, DEC(10.0)));
    EXPECT_TRUE(buy.isExecutable(std::nullopt, DEC(9.9)));
    EXPECT_FALSE(buy.isExecutable(std::nullopt, DEC(10.1)));
    EXPECT_FALSE(buy.isExecutable(DEC(11.0), std::nullopt));

    EXPECT_TRUE(sell.isExecutable(DEC(10.0), std::nullopt));
    EXPECT_TRUE(sell.isExecutable(DEC(10.5), std::nullopt));
    EXPECT_FALSE(sell.isExecutable(DEC(9.9), std::nullopt));
    EXPECT_FALSE(sell.isExecutable(std::nullopt, DEC(9.0)));

    EXPECT_TRUE(market.isExecutable(std::nullopt, std::nullopt));
}

//-------------------------------------------------------------------------

TEST(OrderTest, TransitionTable)
{
    EXPECT_EQ(transition(OrderStatus::PENDING, OrderEvent::PARTIAL_FILL), OrderStatus::PENDING);
    EXPECT_EQ(transition(OrderStatus::PENDING, OrderEvent::FINAL_FILL), OrderStatus::EXECUTED);
    EXPECT_EQ(transition(OrderStatus::PENDING, OrderEvent::TIMEOUT), OrderStatus::CANCELLED);

    for (auto terminal : {OrderStatus::EXECUTED, OrderStatus::CANCELLED}) {
        for (auto event : magic_enum::enum_values<OrderEvent>()) {
            EXPECT_THROW((void)transition(terminal, event), std::logic_error);
        }
    }
}

//-------------------------------------------------------------------------

TEST(OrderTest, JsonSerialize)
{
    const Order order{
        4, OrderRequest{.traderId = 2, .direction = OrderDirection::SELL, .type = OrderType::MARKET, .quantity = 7, .timestep = 3}};

    rapidjson::Document json;
    order.jsonSerialize(json);

    EXPECT_EQ(json["orderId"].GetUint64(), 4);
    EXPECT_EQ(json["traderId"].GetInt(), 2);
    EXPECT_STREQ(json["direction"].GetString(), "SELL");
    EXPECT_STREQ(json["type"].GetString(), "MARKET");
    EXPECT_STREQ(json["status"].GetString(), "PENDING");
    EXPECT_EQ(json["quantity"].GetInt64(), 7);
    EXPECT_TRUE(json["price"].IsNull());
    EXPECT_TRUE(json["executedPrice"].IsNull());
}

//-------------------------------------------------------------------------

TEST(OrderFactoryTest, IdsAreMonotonic)
{
    const OrderFactory factory;

    const auto first = factory.makeLimitOrder(1, OrderDirection::BUY, 10, DEC(10.0), 0);
    const auto second = factory.makeMarketOrder(1, OrderDirection::SELL, 10, std::nullopt, 0);
    EXPECT_THROW((void)factory.makeLimitOrder(1, OrderDirection::BUY, 0, DEC(10.0), 0), InvalidOrder);
    const auto third = factory.makeMarketOrder(2, OrderDirection::BUY, 5, DEC(11.0), 1);

    EXPECT_EQ(first->id(), 0);
    EXPECT_EQ(second->id(), 1);
    EXPECT_EQ(third->id(), 2);
    EXPECT_EQ(factory.getCounterState(), 3);
    EXPECT_EQ(third->type(), OrderType::MARKET);
    EXPECT_THAT(third->price(), Optional(DEC(11.0)));
}

//-------------------------------------------------------------------------
