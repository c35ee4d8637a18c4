/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/agent/InstitutionalTrader.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <unsupported/Eigen/NonLinearOptimization>

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

namespace
{

template<typename Residual>
struct ScalarFunctor
{
    Residual residual;

    int inputs() const noexcept { return 1; }
    int values() const noexcept { return 1; }

    int operator()(const Eigen::VectorXd& x, Eigen::VectorXd& fvec) const
    {
        fvec[0] = residual(x[0]);
        return 0;
    }
};

// Root of the residual within [lower, upper], if the solver reaches one there.
template<typename Residual>
std::optional<double> solve(
    Residual residual, double guess, double lower, double upper, double scale)
{
    ScalarFunctor<Residual> functor{residual};
    Eigen::HybridNonLinearSolver<ScalarFunctor<Residual>> solver{functor};
    Eigen::VectorXd x{1};
    x[0] = guess;
    // See https://docs.scipy.org/doc/scipy/reference/generated/scipy.optimize.fsolve.html.
    const auto status = solver.hybrd1(x, 1.49012e-8);
    const double root = x[0];
    if (status != Eigen::HybridNonLinearSolverSpace::RelativeErrorTooSmall
        || !std::isfinite(root)
        || root < lower
        || root > upper
        || !(std::abs(residual(root)) <= 1e-6 * (1.0 + std::abs(scale)))) {
        return std::nullopt;
    }
    return root;
}

double volatility(std::span<const double> logReturns)
{
    namespace bacc = boost::accumulators;
    bacc::accumulator_set<double, bacc::stats<bacc::tag::lazy_variance>> acc;
    for (double logReturn : logReturns) {
        acc(logReturn);
    }
    const double sigma = logReturns.empty() ? 0.0 : std::sqrt(bacc::variance(acc));
    return std::isfinite(sigma) && sigma > 0.0 ? sigma : InstitutionalTrader::kDefaultVolatility;
}

double checkRiskAversion(double riskAversion)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (!(riskAversion > 0.0)) {
        throw std::invalid_argument(fmt::format(
            "{}: risk aversion should be greater than 0.0, was {}", ctx, riskAversion));
    }
    return riskAversion;
}

}  // namespace

//-------------------------------------------------------------------------

InstitutionalParams InstitutionalParams::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    InstitutionalParams params;
    params.strategy = ChiarellaParams::fromXML(node);

    pugi::xml_attribute attr;
    if (attr = node.attribute("riskAversion"); attr.empty() || attr.as_double() <= 0.0) {
        throw std::invalid_argument(fmt::format(
            "{}: attribute 'riskAversion' should have a value greater than 0.0", ctx));
    }
    params.riskAversion = attr.as_double();

    return params;
}

//-------------------------------------------------------------------------

InstitutionalTrader::InstitutionalTrader(
    TraderId id,
    const InstitutionalParams& params,
    double fundamentalPrice,
    process::RNG& rng)
    : ChiarellaTrader{id, params.strategy, fundamentalPrice, rng},
      m_riskAversion{checkRiskAversion(params.riskAversion)}
{}

//-------------------------------------------------------------------------

InstitutionalTrader::InstitutionalTrader(
    TraderId id,
    const InstitutionalParams& params,
    Weight weight,
    Account account,
    process::RNG& rng)
    : ChiarellaTrader{id, params.strategy, weight, std::move(account), rng},
      m_riskAversion{checkRiskAversion(params.riskAversion)}
{}

//-------------------------------------------------------------------------

std::optional<book::OrderRequest> InstitutionalTrader::generateOrder(
    Timestep timestep, const MarketSnapshot& snapshot)
{
    const auto indifferenceQuote = quote(snapshot);
    if (!indifferenceQuote.has_value()) {
        return std::nullopt;
    }

    const double minimumPrice = indifferenceQuote->minimumPrice;
    const double maximumPrice = indifferenceQuote->expectedPrice;
    if (!(minimumPrice < maximumPrice)) {
        return std::nullopt;
    }

    const double sampledPrice =
        std::uniform_real_distribution<double>{minimumPrice, maximumPrice}(*m_rng);
    const double stock = static_cast<double>(m_account.stock());
    const double positionChange = desiredHolding(sampledPrice, *indifferenceQuote) - stock;
    if (!std::isfinite(positionChange) || std::abs(positionChange) < kMinPositionChange) {
        return std::nullopt;
    }

    const auto direction =
        positionChange > 0.0 ? book::OrderDirection::BUY : book::OrderDirection::SELL;
    const decimal_t price = util::double2price(sampledPrice);
    if (price <= decimal_t{}) {
        return std::nullopt;
    }

    const double affordable = direction == book::OrderDirection::BUY
        ? util::decimal2double(m_account.cash()) / util::decimal2double(price)
        : stock;
    const auto quantity = static_cast<Quantity>(std::min(std::abs(positionChange), affordable));
    if (quantity < 1) {
        return std::nullopt;
    }

    return book::OrderRequest{
        .traderId = m_id,
        .direction = direction,
        .type = book::OrderType::LIMIT,
        .quantity = quantity,
        .timestep = timestep,
        .price = price,
        .maxWaitTime = horizon()};
}

//-------------------------------------------------------------------------

std::optional<IndifferenceQuote> InstitutionalTrader::quote(const MarketSnapshot& snapshot)
{
    const auto forecastResult = forecast(snapshot);
    if (!forecastResult.has_value()
        || !std::isfinite(forecastResult->price)
        || forecastResult->price <= kMinimumPrice) {
        return std::nullopt;
    }

    IndifferenceQuote result{
        .expectedPrice = forecastResult->price,
        .volatility = volatility(forecastResult->recentLogReturns)};

    const double pt = snapshot.lastPrice;
    const double stock = static_cast<double>(m_account.stock());
    const double cash = util::decimal2double(m_account.cash());

    const auto [indifferencePrice, indifferenceConverged] =
        calculateIndifferencePrice(result, pt, stock);
    result.indifferencePrice = indifferenceConverged ? indifferencePrice : pt;
    result.indifferencePriceConverged = indifferenceConverged;

    const auto [minimumPrice, minimumConverged] = calculateMinimumPrice(result, pt, stock, cash);
    result.minimumPrice = minimumConverged ? minimumPrice : kMinimumPrice;
    result.minimumPriceConverged = minimumConverged;

    return result;
}

//-------------------------------------------------------------------------

double InstitutionalTrader::desiredHolding(
    double price, const IndifferenceQuote& quote) const noexcept
{
    return std::log(quote.expectedPrice / price) / (m_riskAversion * quote.volatility * price);
}

//-------------------------------------------------------------------------

InstitutionalTrader::OptimizationResult InstitutionalTrader::calculateIndifferencePrice(
    const IndifferenceQuote& quote, double lastPrice, double stock) const
{
    const auto root = solve(
        [&](double p) { return desiredHolding(p, quote) - stock; },
        lastPrice,
        kMinimumPrice,
        2.0 * quote.expectedPrice,
        stock);
    return {.value = root.value_or(lastPrice), .converged = root.has_value()};
}

//-------------------------------------------------------------------------

InstitutionalTrader::OptimizationResult InstitutionalTrader::calculateMinimumPrice(
    const IndifferenceQuote& quote, double lastPrice, double stock, double cash) const
{
    const auto root = solve(
        [&](double p) { return p * (desiredHolding(p, quote) - stock) - cash; },
        std::min(lastPrice, quote.expectedPrice),
        kMinimumPrice,
        quote.expectedPrice,
        cash);
    return {.value = root.value_or(kMinimumPrice), .converged = root.has_value()};
}

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------
