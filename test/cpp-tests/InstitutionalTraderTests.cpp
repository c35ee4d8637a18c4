/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/agent/InstitutionalTrader.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace lobsim;
using namespace lobsim::agent;
using namespace lobsim::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

// Fundamental and last price agree, so the expected price is the last price.
const MarketSnapshot kFlatMarket{.lastPrice = 100.0, .fundamentalPrice = 100.0};

}  // namespace

//-------------------------------------------------------------------------

struct InstitutionalTraderTest : Test
{
    InstitutionalTrader makeTrader(double riskAversion)
    {
        params.riskAversion = riskAversion;
        return InstitutionalTrader{
            9, params, {.F = 1.0, .C = 0.0, .N = 0.0}, Account{10000_dec, 50}, rng};
    }

    InstitutionalParams params{.strategy = {.noiseStd = 0.0, .referenceTauF = 10.0}};
    process::RNG rng{42};
};

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, SolvesIndifferenceAndMinimumPrices)
{
    auto trader = makeTrader(0.001);

    const auto quote = trader.quote(kFlatMarket);

    ASSERT_TRUE(quote.has_value());
    EXPECT_DOUBLE_EQ(quote->expectedPrice, 100.0);
    EXPECT_DOUBLE_EQ(quote->volatility, InstitutionalTrader::kDefaultVolatility);
    ASSERT_TRUE(quote->indifferencePriceConverged);
    ASSERT_TRUE(quote->minimumPriceConverged);
    EXPECT_NEAR(quote->indifferencePrice, 91.3, 0.5);
    EXPECT_NEAR(quote->minimumPrice, 75.9, 0.5);
    EXPECT_NEAR(trader.desiredHolding(quote->indifferencePrice, *quote), 50.0, 1e-3);
    EXPECT_NEAR(
        quote->minimumPrice * (trader.desiredHolding(quote->minimumPrice, *quote) - 50.0),
        10000.0,
        0.1);
    EXPECT_LT(quote->minimumPrice, quote->indifferencePrice);
    EXPECT_LT(quote->indifferencePrice, quote->expectedPrice);
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, OrdersStayBetweenMinimumAndExpectedPrice)
{
    auto trader = makeTrader(0.001);
    const auto quote = trader.quote(kFlatMarket);
    ASSERT_TRUE(quote.has_value());

    int buys{}, sells{};
    for (Timestep t = 0; t < 200; ++t) {
        const auto request = trader.generateOrder(t, kFlatMarket);
        if (!request.has_value()) continue;

        ASSERT_TRUE(request->price.has_value());
        const double price = util::decimal2double(request->price.value());
        EXPECT_EQ(request->traderId, 9);
        EXPECT_EQ(request->type, book::OrderType::LIMIT);
        EXPECT_EQ(request->timestep, t);
        EXPECT_EQ(request->maxWaitTime, trader.horizon());
        EXPECT_GE(request->quantity, 1);
        EXPECT_GE(price, quote->minimumPrice - 0.01);
        EXPECT_LE(price, quote->expectedPrice);
        if (request->direction == book::OrderDirection::BUY) {
            ++buys;
            EXPECT_LE(price, quote->indifferencePrice + 0.01);
            EXPECT_LE(price * static_cast<double>(request->quantity), 10000.0 + 1e-6);
        } else {
            ++sells;
            EXPECT_GE(price, quote->indifferencePrice - 0.01);
            EXPECT_LE(request->quantity, 50);
        }
    }
    EXPECT_GT(buys, 0);
    EXPECT_GT(sells, 0);
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, FailedRootFindFallsBack)
{
    // No price above the floor makes a holding of 50 desirable at this aversion.
    auto trader = makeTrader(1e6);

    std::optional<IndifferenceQuote> quote;
    ASSERT_NO_THROW(quote = trader.quote(kFlatMarket));
    ASSERT_TRUE(quote.has_value());
    EXPECT_FALSE(quote->indifferencePriceConverged);
    EXPECT_FALSE(quote->minimumPriceConverged);
    EXPECT_DOUBLE_EQ(quote->indifferencePrice, kFlatMarket.lastPrice);
    EXPECT_DOUBLE_EQ(quote->minimumPrice, InstitutionalTrader::kMinimumPrice);

    std::optional<book::OrderRequest> request;
    ASSERT_NO_THROW(request = trader.generateOrder(3, kFlatMarket));
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->direction, book::OrderDirection::SELL);
    EXPECT_THAT(request->quantity, AllOf(Ge(49), Le(50)));
    ASSERT_TRUE(request->price.has_value());
    EXPECT_GE(request->price.value(), DEC(0.01));
    EXPECT_LE(request->price.value(), DEC(100.0));
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, VolatilityFromRecentReturns)
{
    auto trader = makeTrader(0.001);
    ASSERT_EQ(trader.horizon(), 5);

    const std::vector<double> alternating{0.5, 0.01, -0.01, 0.01, -0.01, 0.01, -0.01};
    const std::vector<double> unchanged{0.0, 0.0, 0.0};

    const auto noisy = trader.quote(MarketSnapshot{
        .lastPrice = 100.0, .fundamentalPrice = 100.0, .logReturns = alternating});
    const auto flat = trader.quote(MarketSnapshot{
        .lastPrice = 100.0, .fundamentalPrice = 100.0, .logReturns = unchanged});

    ASSERT_TRUE(noisy.has_value());
    ASSERT_TRUE(flat.has_value());
    EXPECT_NEAR(noisy->volatility, std::sqrt(9.6e-5), 1e-9);
    EXPECT_DOUBLE_EQ(flat->volatility, InstitutionalTrader::kDefaultVolatility);
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, ExpectedPriceFollowsFundamental)
{
    auto trader = makeTrader(0.001);

    const auto quote = trader.quote(MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = 110.0});

    ASSERT_TRUE(quote.has_value());
    EXPECT_NEAR(quote->expectedPrice, 100.0 * std::sqrt(1.1), 1e-3);
    EXPECT_GT(quote->indifferencePrice, 91.3);
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, SitsOutDegeneratePrices)
{
    auto trader = makeTrader(0.001);

    EXPECT_FALSE(trader.quote(MarketSnapshot{.lastPrice = 0.0, .fundamentalPrice = 100.0}));
    EXPECT_FALSE(trader.generateOrder(0, MarketSnapshot{.lastPrice = 0.0, .fundamentalPrice = 100.0}));
    EXPECT_FALSE(trader.generateOrder(
        0, MarketSnapshot{.lastPrice = 100.0, .fundamentalPrice = std::nan("")}));
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, SitsOutWithoutStockOrCash)
{
    params.riskAversion = 1e6;
    InstitutionalTrader trader{
        2, params, {.F = 1.0, .C = 0.0, .N = 0.0}, Account{0_dec, 0}, rng};

    std::optional<book::OrderRequest> request;
    ASSERT_NO_THROW(request = trader.generateOrder(0, kFlatMarket));
    EXPECT_FALSE(request.has_value());
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, SameSeedSameOrders)
{
    auto trader = makeTrader(0.001);
    process::RNG replay{42};
    InstitutionalTrader twin{
        9, params, {.F = 1.0, .C = 0.0, .N = 0.0}, Account{10000_dec, 50}, replay};

    for (Timestep t = 0; t < 20; ++t) {
        const auto request = trader.generateOrder(t, kFlatMarket);
        const auto replayed = twin.generateOrder(t, kFlatMarket);
        ASSERT_EQ(request.has_value(), replayed.has_value());
        if (!request.has_value()) continue;
        EXPECT_EQ(request->direction, replayed->direction);
        EXPECT_EQ(request->quantity, replayed->quantity);
        EXPECT_EQ(request->price, replayed->price);
    }
    EXPECT_EQ(rng.callCount(), replay.callCount());
}

//-------------------------------------------------------------------------

TEST_F(InstitutionalTraderTest, RejectsNonPositiveRiskAversion)
{
    EXPECT_THROW(makeTrader(0.0), std::invalid_argument);
    EXPECT_THROW(makeTrader(-1.0), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(InstitutionalParamsTest, FromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(
        R"(<InstitutionalTrader sigmaF="1.0" sigmaC="0.5" sigmaN="0.2" tauF="50" riskAversion="0.25"/>)"));

    const auto params = InstitutionalParams::fromXML(doc.first_child());

    EXPECT_DOUBLE_EQ(params.riskAversion, 0.25);
    EXPECT_DOUBLE_EQ(params.strategy.fundamentalSigma, 1.0);
    EXPECT_DOUBLE_EQ(params.strategy.chartistSigma, 0.5);
    EXPECT_DOUBLE_EQ(params.strategy.noiseSigma, 0.2);
    EXPECT_DOUBLE_EQ(params.strategy.referenceTauF, 50.0);
}

//-------------------------------------------------------------------------

TEST(InstitutionalParamsTest, FromXMLErrors)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(<InstitutionalTrader sigmaF="1.0" sigmaC="0.5" sigmaN="0.2"/>)"));
    EXPECT_THROW(InstitutionalParams::fromXML(doc.first_child()), std::invalid_argument);

    ASSERT_TRUE(doc.load_string(
        R"(<InstitutionalTrader sigmaF="1.0" sigmaC="0.5" sigmaN="0.2" riskAversion="0"/>)"));
    EXPECT_THROW(InstitutionalParams::fromXML(doc.first_child()), std::invalid_argument);

    ASSERT_TRUE(doc.load_string(R"(<InstitutionalTrader sigmaC="0.5" sigmaN="0.2" riskAversion="1"/>)"));
    EXPECT_THROW(InstitutionalParams::fromXML(doc.first_child()), std::invalid_argument);
}

//-------------------------------------------------------------------------
