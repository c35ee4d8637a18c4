/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/agent/ChiarellaTrader.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

struct InstitutionalParams
{
    ChiarellaParams strategy{};
    double riskAversion{1.0};

    [[nodiscard]] static InstitutionalParams fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

struct IndifferenceQuote
{
    double expectedPrice{};
    double volatility{};
    double indifferencePrice{};
    bool indifferencePriceConverged{};
    double minimumPrice{};
    bool minimumPriceConverged{};
};

//-------------------------------------------------------------------------

/**
 * Mean-variance trader on top of the Chiarella forecast.
 *
 * The desired holding at price p is ln(E[p] / p) / (riskAversion * volatility * p). The
 * trader solves for the indifference price, where the desired holding equals its stock,
 * and for the minimum price it can afford to move to, samples a limit price uniformly
 * between the minimum and the expected price and trades the gap between its desired and
 * actual holdings. A root that cannot be found falls back to the last price for the
 * indifference price and to the price floor for the minimum price.
 */
class InstitutionalTrader : public ChiarellaTrader
{
public:
    InstitutionalTrader(
        TraderId id,
        const InstitutionalParams& params,
        double fundamentalPrice,
        process::RNG& rng);

    InstitutionalTrader(
        TraderId id,
        const InstitutionalParams& params,
        Weight weight,
        Account account,
        process::RNG& rng);

    [[nodiscard]] double riskAversion() const noexcept { return m_riskAversion; }

    [[nodiscard]] virtual std::string_view typeName() const noexcept override
    {
        return "InstitutionalTrader";
    }

    [[nodiscard]] virtual std::optional<book::OrderRequest> generateOrder(
        Timestep timestep, const MarketSnapshot& snapshot) override;

    [[nodiscard]] std::optional<IndifferenceQuote> quote(const MarketSnapshot& snapshot);

    [[nodiscard]] double desiredHolding(double price, const IndifferenceQuote& quote) const noexcept;

    static constexpr double kDefaultVolatility = 0.02;
    static constexpr double kMinimumPrice = 0.01;
    static constexpr double kMinPositionChange = 0.01;

private:
    struct OptimizationResult
    {
        double value;
        bool converged;
    };

    [[nodiscard]] OptimizationResult calculateIndifferencePrice(
        const IndifferenceQuote& quote, double lastPrice, double stock) const;
    [[nodiscard]] OptimizationResult calculateMinimumPrice(
        const IndifferenceQuote& quote, double lastPrice, double stock, double cash) const;

    double m_riskAversion;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------
