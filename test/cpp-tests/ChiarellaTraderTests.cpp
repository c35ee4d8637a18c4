/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/agent/ChiarellaTrader.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace lobsim;
using namespace lobsim::agent;
using namespace lobsim::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct ChiarellaTraderTest : Test
{
    ChiarellaTrader makeTrader(ChiarellaTrader::Weight weight)
    {
        return ChiarellaTrader{7, params, weight, Account{10000_dec, 50}, rng};
    }

    ChiarellaParams params{.noiseStd = 0.0, .referenceTauF = 10.0};
    process::RNG rng{42};
};

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, FundamentalistBuysBelowValue)
{
    auto trader = makeTrader({.F = 1.0, .C = 0.0, .N = 0.0});
    EXPECT_DOUBLE_EQ(trader.tau(), 5.0);

    const auto request = trader.generateOrder(
        12, MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 110.0});

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->traderId, 7);
    EXPECT_EQ(request->direction, book::OrderDirection::BUY);
    EXPECT_EQ(request->type, book::OrderType::LIMIT);
    EXPECT_THAT(request->price, Optional(DEC(102.32)));
    EXPECT_EQ(request->quantity, 20);
    EXPECT_EQ(request->timestep, 12);
    EXPECT_EQ(request->maxWaitTime, 5);
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, TakesSatisfyingAsk)
{
    auto trader = makeTrader({.F = 1.0, .C = 0.0, .N = 0.0});

    const auto request = trader.generateOrder(
        0,
        MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 110.0, .bestAsk = DEC(103.0)});

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->type, book::OrderType::MARKET);
    EXPECT_THAT(request->price, Optional(DEC(103.0)));
    EXPECT_EQ(request->quantity, 21);
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, FundamentalistSellsAboveValue)
{
    auto trader = makeTrader({.F = 1.0, .C = 0.0, .N = 0.0});

    const auto request = trader.generateOrder(
        0,
        MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 90.0, .bestBid = DEC(90.0)});

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->direction, book::OrderDirection::SELL);
    EXPECT_EQ(request->type, book::OrderType::LIMIT);
    EXPECT_THAT(request->price, Optional(DEC(97.3)));
    EXPECT_EQ(request->quantity, 10);
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, ChartistFollowsTrend)
{
    auto trader = makeTrader({.F = 0.0, .C = 1.0, .N = 0.0});
    const std::vector<double> logReturns{0.01, 0.02, 0.0, -0.01};

    const auto request = trader.generateOrder(
        0,
        MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 100.0, .logReturns = logReturns});

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(trader.horizon(), 10);
    EXPECT_EQ(request->direction, book::OrderDirection::BUY);
    EXPECT_THAT(request->price, Optional(DEC(102.43)));
    EXPECT_EQ(request->maxWaitTime, 10);
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, NoiseDrawsAreCounted)
{
    params.noiseStd = 0.01;
    auto trader = makeTrader({.F = 1.0, .C = 0.0, .N = 1.0});
    const auto before = rng.callCount();

    (void)trader.generateOrder(0, MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 110.0});

    EXPECT_GT(rng.callCount(), before);
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, PriceClampedToBand)
{
    auto trader = makeTrader({.F = 1.0, .C = 0.0, .N = 0.0});

    const auto request = trader.generateOrder(
        0, MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 200.0});

    ASSERT_TRUE(request.has_value());
    EXPECT_THAT(request->price, Optional(DEC(110.0)));
    EXPECT_EQ(request->quantity, 24);
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, SitsOutSmallDeviation)
{
    auto trader = makeTrader({.F = 1.0, .C = 0.0, .N = 0.0});

    EXPECT_FALSE(trader.generateOrder(
        0, MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 100.01}).has_value());
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, SitsOutDegeneratePrices)
{
    auto trader = makeTrader({.F = 1.0, .C = 1.0, .N = 1.0});

    EXPECT_FALSE(trader.generateOrder(0, MarketSnapshot{.lastPrice = 0.0, .fundamentalPrice = 100.0}));
    EXPECT_FALSE(trader.generateOrder(0, MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = -1.0}));
    EXPECT_FALSE(trader.generateOrder(
        0, MarketSnapshot{.lastPrice = std::nan(""), .fundamentalPrice = 100.0}));
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, SitsOutWithoutFunds)
{
    ChiarellaTrader trader{1, params, {.F = 1.0, .C = 0.0, .N = 0.0}, Account{0_dec, 100}, rng};

    EXPECT_FALSE(trader.generateOrder(
        0, MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 90.0}).has_value());
}

//-------------------------------------------------------------------------

TEST_F(ChiarellaTraderTest, RandomInitialisation)
{
    params.fundamentalSigma = 1.0;
    params.chartistSigma = 1.0;
    params.noiseSigma = 1.0;
    params.initialStockMax = 100;

    const ChiarellaTrader trader{3, params, 300.0, rng};
    process::RNG replay{42};
    const ChiarellaTrader twin{3, params, 300.0, replay};

    EXPECT_EQ(trader.id(), 3);
    EXPECT_EQ(rng.callCount(), replay.callCount());
    EXPECT_GE(rng.callCount(), 4);
    EXPECT_GE(trader.account().stock(), 10);
    EXPECT_LE(trader.account().stock(), 100);
    EXPECT_EQ(
        trader.account().cash(), util::double2decimal(300.0 * trader.account().stock()));
    EXPECT_GE(trader.weight().F, 0.0);
    EXPECT_GE(trader.weight().C, 0.0);
    EXPECT_GE(trader.weight().N, 0.0);
    EXPECT_DOUBLE_EQ(
        trader.tau(), params.referenceTauF / (1.0 + trader.weight().F / (1.0 + trader.weight().C)));
    EXPECT_DOUBLE_EQ(trader.weight().F, twin.weight().F);
    EXPECT_EQ(trader.account().stock(), twin.account().stock());
}

//-------------------------------------------------------------------------
