/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/agent/ChiarellaTrader.hpp"

#include <numeric>

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

namespace
{

double drawExponential(double scale, process::RNG& rng)
{
    if (scale <= 0.0) return 0.0;
    return std::exponential_distribution<double>{1.0 / scale}(rng);
}

Account drawAccount(const ChiarellaParams& params, double fundamentalPrice, process::RNG& rng)
{
    const double stockMax = static_cast<double>(params.initialStockMax);
    const auto stock = static_cast<Quantity>(
        std::uniform_real_distribution<double>{0.1 * stockMax, stockMax}(rng));
    return Account{util::double2decimal(fundamentalPrice * stock), stock};
}

}  // namespace

//-------------------------------------------------------------------------

ChiarellaParams ChiarellaParams::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_attribute attr;
    ChiarellaParams params;

    if (attr = node.attribute("sigmaF"); attr.empty() || attr.as_double() < 0.0) {
        throw std::invalid_argument(fmt::format(
            "{}: attribute 'sigmaF' should have a value of at least 0.0", ctx));
    }
    params.fundamentalSigma = attr.as_double();
    if (attr = node.attribute("sigmaC"); attr.empty() || attr.as_double() < 0.0) {
        throw std::invalid_argument(fmt::format(
            "{}: attribute 'sigmaC' should have a value of at least 0.0", ctx));
    }
    params.chartistSigma = attr.as_double();
    if (attr = node.attribute("sigmaN"); attr.empty() || attr.as_double() < 0.0) {
        throw std::invalid_argument(fmt::format(
            "{}: attribute 'sigmaN' should have a value of at least 0.0", ctx));
    }
    params.noiseSigma = attr.as_double();

    if (attr = node.attribute("noiseStd"); !attr.empty()) {
        if (attr.as_double() < 0.0) {
            throw std::invalid_argument(fmt::format(
                "{}: attribute 'noiseStd' should have a value of at least 0.0", ctx));
        }
        params.noiseStd = attr.as_double();
    }
    if (attr = node.attribute("tauF"); !attr.empty()) {
        if (attr.as_double() <= 0.0) {
            throw std::invalid_argument(fmt::format(
                "{}: attribute 'tauF' should have a value greater than 0.0", ctx));
        }
        params.referenceTauF = attr.as_double();
    }
    if (attr = node.attribute("initialStockMax"); !attr.empty()) {
        if (attr.as_llong() <= 0) {
            throw std::invalid_argument(fmt::format(
                "{}: attribute 'initialStockMax' should have a value greater than 0", ctx));
        }
        params.initialStockMax = attr.as_llong();
    }

    return params;
}

//-------------------------------------------------------------------------

ChiarellaTrader::ChiarellaTrader(
    TraderId id,
    const ChiarellaParams& params,
    double fundamentalPrice,
    process::RNG& rng)
    : ChiarellaTrader{
          id,
          params,
          [&] {
              // Sequenced before the account draw.
              Weight weight;
              weight.F = drawExponential(params.fundamentalSigma, rng);
              weight.C = drawExponential(params.chartistSigma, rng);
              weight.N = drawExponential(params.noiseSigma, rng);
              return weight;
          }(),
          drawAccount(params, fundamentalPrice, rng),
          rng}
{}

//-------------------------------------------------------------------------

ChiarellaTrader::ChiarellaTrader(
    TraderId id,
    const ChiarellaParams& params,
    Weight weight,
    Account account,
    process::RNG& rng)
    : Trader{id, std::move(account)},
      m_rng{&rng},
      m_params{params},
      m_weight{weight},
      m_tau{params.referenceTauF / (1.0 + weight.F / (1.0 + weight.C))}
{}

//-------------------------------------------------------------------------

std::optional<book::OrderRequest> ChiarellaTrader::generateOrder(
    Timestep timestep, const MarketSnapshot& snapshot)
{
    const auto forecastResult = forecast(snapshot);
    if (!forecastResult.has_value()) {
        return std::nullopt;
    }

    const double pt = snapshot.lastPrice;
    const Timestep tauI = horizon();
    const double expectedPrice = forecastResult->price;
    const double deviation = (expectedPrice - pt) / pt;

    if (!std::isfinite(deviation) || std::abs(deviation) < kMinDeviation) {
        return std::nullopt;
    }

    const auto direction = deviation > 0.0 ? book::OrderDirection::BUY : book::OrderDirection::SELL;
    const auto oppositeBest =
        direction == book::OrderDirection::BUY ? snapshot.bestAsk : snapshot.bestBid;

    auto type = book::OrderType::LIMIT;
    double price = expectedPrice * (direction == book::OrderDirection::BUY
        ? 1.0 - std::abs(deviation) * 0.5
        : 1.0 + std::abs(deviation) * 0.5);
    if (oppositeBest.has_value()) {
        const double best = util::decimal2double(oppositeBest.value());
        const bool satisfied = direction == book::OrderDirection::BUY
            ? best <= expectedPrice
            : best >= expectedPrice;
        if (satisfied) {
            type = book::OrderType::MARKET;
            price = best;
        }
    }

    price = std::clamp(price, pt * (1.0 - kPriceBand), pt * (1.0 + kPriceBand));
    const decimal_t quotedPrice = util::double2price(price);
    if (quotedPrice <= decimal_t{}) {
        return std::nullopt;
    }

    const double cash = util::decimal2double(m_account.cash());
    const double priceDiff = std::abs(util::decimal2double(quotedPrice) - pt) / pt;
    const auto baseQuantity = direction == book::OrderDirection::BUY
        ? static_cast<Quantity>(cash * kOrderFraction / pt)
        : static_cast<Quantity>(static_cast<double>(m_account.stock()) * kOrderFraction);
    const auto riskAdjusted =
        static_cast<Quantity>(static_cast<double>(baseQuantity) * (1.0 + priceDiff * 2.0));
    const Quantity quantity = std::min(riskAdjusted, static_cast<Quantity>(cash / pt));

    if (quantity < 1) {
        return std::nullopt;
    }

    return book::OrderRequest{
        .traderId = m_id,
        .direction = direction,
        .type = type,
        .quantity = quantity,
        .timestep = timestep,
        .price = quotedPrice,
        .maxWaitTime = tauI};
}

//-------------------------------------------------------------------------

std::optional<ChiarellaTrader::ForecastResult> ChiarellaTrader::forecast(
    const MarketSnapshot& snapshot)
{
    const double pt = snapshot.lastPrice;
    const double pf = snapshot.fundamentalPrice;
    if (!std::isfinite(pt) || !std::isfinite(pf) || pt <= 0.0 || pf <= 0.0) {
        return std::nullopt;
    }

    const auto recent = recentLogReturns(snapshot.logReturns);
    const double trend = recent.empty()
        ? 0.0
        : std::accumulate(recent.begin(), recent.end(), 0.0) / static_cast<double>(recent.size());
    const double eps = m_params.noiseStd > 0.0
        ? std::normal_distribution<double>{0.0, m_params.noiseStd}(*m_rng)
        : 0.0;
    const double expectedReturn =
        (m_weight.F / m_params.referenceTauF * std::log(pf / pt)
            + m_weight.C * trend
            + m_weight.N * eps)
        / (m_weight.F + m_weight.C + m_weight.N + 1e-6);

    return ForecastResult{
        .price = pt * std::exp(expectedReturn * static_cast<double>(horizon())),
        .recentLogReturns = recent};
}

//-------------------------------------------------------------------------

std::span<const double> ChiarellaTrader::recentLogReturns(
    std::span<const double> logReturns) const noexcept
{
    const auto tauI = static_cast<size_t>(horizon());
    return tauI > 0 && logReturns.size() >= tauI ? logReturns.last(tauI) : logReturns;
}

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------
