/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/agent/MarketSnapshot.hpp"
#include "lobsim/agent/Trader.hpp"
#include "lobsim/book/Book.hpp"
#include "lobsim/process/Process.hpp"
#include "lobsim/process/RNG.hpp"
#include "lobsim/serialization/JsonSerializable.hpp"
#include "lobsim/simulation/SimulationConfig.hpp"
#include "lobsim/simulation/SimulationException.hpp"
#include "lobsim/util/common.hpp"

#include <spdlog/spdlog.h>

#include <map>

//-------------------------------------------------------------------------

namespace lobsim::simulation
{

//-------------------------------------------------------------------------

/**
 * Step-driven market around a single book.
 *
 * Every step reaps timed out orders, advances the fundamental, lets the selected traders
 * submit at most one order each and records the last trade price. Trades are settled into
 * the traders' accounts as the book reports them.
 */
class Simulation : public JsonSerializable
{
public:
    Simulation(
        SimulationConfig config,
        book::BookConfig bookConfig,
        std::unique_ptr<process::Process> fundamental,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return m_config; }
    [[nodiscard]] book::Book::Ptr book() const noexcept { return m_book; }
    [[nodiscard]] const process::Process& fundamental() const noexcept { return *m_fundamental; }
    [[nodiscard]] process::RNG& rng() noexcept { return m_rng; }
    [[nodiscard]] Timestep currentTimestep() const noexcept { return m_currentTimestep; }
    [[nodiscard]] const std::vector<agent::Trader::Ptr>& traders() const noexcept { return m_traders; }
    [[nodiscard]] const std::vector<double>& priceHistory() const noexcept { return m_priceHistory; }
    [[nodiscard]] const std::vector<double>& logReturns() const noexcept { return m_logReturns; }
    [[nodiscard]] const std::vector<double>& fundamentalHistory() const noexcept
    {
        return m_fundamentalHistory;
    }
    [[nodiscard]] bool isFinished() const noexcept { return m_currentTimestep >= m_config.steps; }

    [[nodiscard]] agent::Trader* trader(TraderId id) const noexcept;

    void addTrader(agent::Trader::Ptr trader);

    void step();
    void simulate();

    [[nodiscard]] double lastPrice() const;
    [[nodiscard]] agent::MarketSnapshot makeSnapshot() const;

    // A limit request that would cross the opposite best becomes a market request bounded
    // by its limit price; everything else passes through.
    [[nodiscard]] static book::OrderRequest classifyCrossing(
        book::OrderRequest request,
        std::optional<decimal_t> bestBid,
        std::optional<decimal_t> bestAsk) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<Simulation> fromXML(
        pugi::xml_node node,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    [[nodiscard]] static std::unique_ptr<Simulation> fromConfig(
        const fs::path& path,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

private:
    [[nodiscard]] std::vector<agent::Trader*> selectTraders();
    void processTrader(agent::Trader& trader);
    void settle(const book::Trade& trade);
    void updatePriceHistory();

    SimulationConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    process::RNG m_rng;
    book::Book::Ptr m_book;
    std::unique_ptr<process::Process> m_fundamental;
    std::vector<agent::Trader::Ptr> m_traders;
    std::map<TraderId, agent::Trader*> m_traderIndex;
    Timestep m_currentTimestep{};
    std::vector<double> m_priceHistory;
    std::vector<double> m_logReturns;
    std::vector<double> m_fundamentalHistory;
    bs2::scoped_connection m_tradeFeed;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::simulation

//-------------------------------------------------------------------------
