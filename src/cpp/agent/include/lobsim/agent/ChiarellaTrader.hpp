/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/agent/Trader.hpp"
#include "lobsim/process/RNG.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

struct ChiarellaParams
{
    // Scales of the exponential distributions the strategy weights are drawn from.
    double fundamentalSigma{};
    double chartistSigma{};
    double noiseSigma{};
    double noiseStd{0.01};
    double referenceTauF{200.0};
    Quantity initialStockMax{100};

    [[nodiscard]] static ChiarellaParams fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

/**
 * Mixed fundamentalist / chartist / noise trader.
 *
 * Each step the trader blends mean reversion towards the fundamental price, the mean of
 * the recent log returns and a Gaussian noise term into an expected return over its own
 * horizon, then quotes around the resulting expected price. When the opposite best price
 * already satisfies the expectation it sends a market order bounded by that price.
 */
class ChiarellaTrader : public Trader
{
public:
    struct Weight { double F, C, N; };

    ChiarellaTrader(
        TraderId id,
        const ChiarellaParams& params,
        double fundamentalPrice,
        process::RNG& rng);

    ChiarellaTrader(
        TraderId id,
        const ChiarellaParams& params,
        Weight weight,
        Account account,
        process::RNG& rng);

    [[nodiscard]] const Weight& weight() const noexcept { return m_weight; }
    [[nodiscard]] double tau() const noexcept { return m_tau; }
    [[nodiscard]] Timestep horizon() const noexcept { return static_cast<Timestep>(m_tau); }

    [[nodiscard]] virtual std::string_view typeName() const noexcept override
    {
        return "ChiarellaTrader";
    }

    [[nodiscard]] virtual std::optional<book::OrderRequest> generateOrder(
        Timestep timestep, const MarketSnapshot& snapshot) override;

    static constexpr double kMinDeviation = 0.0005;
    static constexpr double kPriceBand = 0.1;
    static constexpr double kOrderFraction = 0.2;

protected:
    struct ForecastResult
    {
        double price;
        std::span<const double> recentLogReturns;
    };

    // Draws the noise term. Empty for non-positive or non-finite prices.
    [[nodiscard]] std::optional<ForecastResult> forecast(const MarketSnapshot& snapshot);

    // The last horizon() returns, or all of them when fewer are available.
    [[nodiscard]] std::span<const double> recentLogReturns(
        std::span<const double> logReturns) const noexcept;

    process::RNG* m_rng;
    ChiarellaParams m_params;
    Weight m_weight;
    double m_tau;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------
