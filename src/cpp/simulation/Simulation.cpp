/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/simulation/Simulation.hpp"

#include "lobsim/agent/ChiarellaTrader.hpp"
#include "lobsim/agent/InstitutionalTrader.hpp"
#include "lobsim/process/GBM.hpp"

#include <numeric>
#include <random>

//-------------------------------------------------------------------------

namespace lobsim::simulation
{

//-------------------------------------------------------------------------

Simulation::Simulation(
    SimulationConfig config,
    book::BookConfig bookConfig,
    std::unique_ptr<process::Process> fundamental,
    std::shared_ptr<spdlog::logger> logger)
    : m_config{config},
      m_logger{logger ? std::move(logger) : spdlog::default_logger()},
      m_rng{config.seed},
      m_book{std::make_shared<book::Book>(bookConfig, m_logger)},
      m_fundamental{std::move(fundamental)}
{
    if (m_fundamental == nullptr) {
        throw SimulationException(fmt::format(
            "{}: a fundamental price process is required",
            std::source_location::current().function_name()));
    }
    m_fundamentalHistory.push_back(m_fundamental->value());
    m_tradeFeed = m_book->signals().trade.connect([this](book::Trade::Ptr trade) { settle(*trade); });
}

//-------------------------------------------------------------------------

agent::Trader* Simulation::trader(TraderId id) const noexcept
{
    auto it = m_traderIndex.find(id);
    return it != m_traderIndex.end() ? it->second : nullptr;
}

//-------------------------------------------------------------------------

void Simulation::addTrader(agent::Trader::Ptr trader)
{
    if (trader == nullptr) {
        throw std::invalid_argument(fmt::format(
            "{}: cannot register a null trader", std::source_location::current().function_name()));
    }
    if (m_traderIndex.contains(trader->id())) {
        throw std::invalid_argument(fmt::format(
            "{}: trader id {} is already registered",
            std::source_location::current().function_name(),
            trader->id()));
    }
    m_traderIndex[trader->id()] = trader.get();
    m_traders.push_back(std::move(trader));
}

//-------------------------------------------------------------------------

void Simulation::step()
{
    m_book->cancelTimedOutOrders(m_currentTimestep);

    m_fundamental->update(m_currentTimestep);
    m_fundamentalHistory.push_back(m_fundamental->value());

    const auto tradesBefore = m_book->tradeLog().size();
    for (agent::Trader* trader : selectTraders()) {
        processTrader(*trader);
    }

    updatePriceHistory();

    const auto snapshot = m_book->snapshot();
    m_logger->debug(fmt::format(
        "Step {}: fundamental={:.4f} last={:.4f} trades={} bid={} ask={} depth={}/{}",
        m_currentTimestep,
        m_fundamental->value(),
        lastPrice(),
        m_book->tradeLog().size() - tradesBefore,
        snapshot.bestBid.has_value() ? fmt::format("{}", *snapshot.bestBid) : "-",
        snapshot.bestAsk.has_value() ? fmt::format("{}", *snapshot.bestAsk) : "-",
        snapshot.buyDepth,
        snapshot.sellDepth));

    ++m_currentTimestep;
}

//-------------------------------------------------------------------------

void Simulation::simulate()
{
    m_logger->info(fmt::format(
        "Simulation started: {} steps, {} traders, mode {}",
        m_config.steps,
        m_traders.size(),
        m_config.mode));

    while (!isFinished()) {
        step();
    }

    m_logger->info(fmt::format(
        "Simulation finished at step {}: {} trades, last price {:.4f}, book {}",
        m_currentTimestep,
        m_book->tradeLog().size(),
        lastPrice(),
        json::jsonSerializable2str(m_book->snapshot())));
}

//-------------------------------------------------------------------------

double Simulation::lastPrice() const
{
    if (!m_priceHistory.empty()) {
        return m_priceHistory.back();
    }
    const auto bid = m_book->bestBid();
    const auto ask = m_book->bestAsk();
    if (bid.has_value() && ask.has_value()) {
        return util::decimal2double((bid.value() + ask.value()) / decimal_t{2});
    }
    return m_fundamental->value();
}

//-------------------------------------------------------------------------

agent::MarketSnapshot Simulation::makeSnapshot() const
{
    return {
        .lastPrice = lastPrice(),
        .fundamentalPrice = m_fundamental->value(),
        .logReturns = m_logReturns,
        .bestBid = m_book->bestBid(),
        .bestAsk = m_book->bestAsk()};
}

//-------------------------------------------------------------------------

book::OrderRequest Simulation::classifyCrossing(
    book::OrderRequest request,
    std::optional<decimal_t> bestBid,
    std::optional<decimal_t> bestAsk) noexcept
{
    if (request.type != book::OrderType::LIMIT || !request.price.has_value()) {
        return request;
    }
    const decimal_t price = request.price.value();
    const bool crosses = request.direction == book::OrderDirection::BUY
        ? bestAsk.has_value() && price >= bestAsk.value()
        : bestBid.has_value() && price <= bestBid.value();
    if (crosses) {
        request.type = book::OrderType::MARKET;
    }
    return request;
}

//-------------------------------------------------------------------------

void Simulation::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("steps", rapidjson::Value{m_config.steps}, allocator);
        json.AddMember("seed", rapidjson::Value{m_config.seed}, allocator);
        json.AddMember(
            "mode",
            rapidjson::Value{magic_enum::enum_name(m_config.mode).data(), allocator},
            allocator);
        json.AddMember("currentTimestep", rapidjson::Value{m_currentTimestep}, allocator);
        json.AddMember(
            "tradeCount",
            rapidjson::Value{static_cast<uint64_t>(m_book->tradeLog().size())},
            allocator);
        json.AddMember("lastPrice", rapidjson::Value{lastPrice()}, allocator);
        json.AddMember("fundamentalPrice", rapidjson::Value{m_fundamental->value()}, allocator);
        m_book->snapshot().jsonSerialize(json, "book");
        m_fundamental->jsonSerialize(json, "fundamental");
        m_rng.jsonSerialize(json, "rng");
        rapidjson::Value tradersJson{rapidjson::kArrayType};
        for (const auto& trader : m_traders) {
            rapidjson::Document traderJson{&allocator};
            traderJson.SetObject();
            traderJson.AddMember("traderId", rapidjson::Value{trader->id()}, allocator);
            traderJson.AddMember(
                "type", rapidjson::Value{trader->typeName().data(), allocator}, allocator);
            trader->account().jsonSerialize(traderJson, "account");
            tradersJson.PushBack(traderJson, allocator);
        }
        json.AddMember("traders", tradersJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<Simulation> Simulation::fromXML(
    pugi::xml_node node, std::shared_ptr<spdlog::logger> logger)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto config = SimulationConfig::fromXML(node);
    const auto bookConfig = book::BookConfig::fromXML(node.child("Book"));

    pugi::xml_node fundamentalNode = node.child("Fundamental");
    if (!fundamentalNode) {
        throw std::invalid_argument(fmt::format("{}: missing node 'Fundamental'", ctx));
    }

    auto simulation = std::make_unique<Simulation>(
        config, bookConfig, process::GBM::fromXML(fundamentalNode), logger);

    TraderId nextId{};
    for (pugi::xml_node agentNode : node.child("Agents").children()) {
        const std::string_view name = agentNode.name();
        const auto instanceCount = agentNode.attribute("instanceCount").as_uint(1);
        const double fundamentalPrice = simulation->fundamental().value();
        if (name == "ChiarellaTrader") {
            const auto params = agent::ChiarellaParams::fromXML(agentNode);
            for (uint32_t i = 0; i < instanceCount; ++i) {
                simulation->addTrader(std::make_unique<agent::ChiarellaTrader>(
                    nextId++, params, fundamentalPrice, simulation->rng()));
            }
        } else if (name == "InstitutionalTrader") {
            const auto params = agent::InstitutionalParams::fromXML(agentNode);
            for (uint32_t i = 0; i < instanceCount; ++i) {
                simulation->addTrader(std::make_unique<agent::InstitutionalTrader>(
                    nextId++, params, fundamentalPrice, simulation->rng()));
            }
        } else {
            throw std::invalid_argument(fmt::format("{}: unknown agent type '{}'", ctx, name));
        }
    }

    return simulation;
}

//-------------------------------------------------------------------------

std::unique_ptr<Simulation> Simulation::fromConfig(
    const fs::path& path, std::shared_ptr<spdlog::logger> logger)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    if (pugi::xml_parse_result result = doc.load_file(path.c_str()); !result) {
        throw SimulationException(fmt::format(
            "{}: failed to load '{}': {}", ctx, path.generic_string(), result.description()));
    }
    pugi::xml_node node = doc.child("Simulation");
    if (!node) {
        throw SimulationException(fmt::format(
            "{}: '{}' has no 'Simulation' node", ctx, path.generic_string()));
    }

    auto simulation = fromXML(node, logger);
    simulation->m_logger->info(fmt::format("'{}' loaded successfully", path.generic_string()));
    return simulation;
}

//-------------------------------------------------------------------------

std::vector<agent::Trader*> Simulation::selectTraders()
{
    std::vector<agent::Trader*> selected;
    if (m_traders.empty()) return selected;

    switch (m_config.mode) {
        case ActivationMode::SINGLE: {
            std::uniform_int_distribution<size_t> pick{0, m_traders.size() - 1};
            selected.push_back(m_traders.at(pick(m_rng)).get());
            break;
        }
        case ActivationMode::PARTIAL: {
            const auto count = std::max<size_t>(
                1, static_cast<size_t>(m_traders.size() * m_config.activationRatio));
            std::vector<size_t> indices(m_traders.size());
            std::iota(indices.begin(), indices.end(), size_t{});
            std::shuffle(indices.begin(), indices.end(), m_rng);
            for (size_t i = 0; i < count; ++i) {
                selected.push_back(m_traders[indices[i]].get());
            }
            break;
        }
        case ActivationMode::ALL:
            for (const auto& trader : m_traders) {
                selected.push_back(trader.get());
            }
            break;
    }

    return selected;
}

//-------------------------------------------------------------------------

void Simulation::processTrader(agent::Trader& trader)
{
    const auto snapshot = makeSnapshot();
    const auto request = trader.generateOrder(m_currentTimestep, snapshot);
    if (!request.has_value()) return;

    const auto classified = classifyCrossing(request.value(), snapshot.bestBid, snapshot.bestAsk);

    book::Order::Ptr order;
    try {
        order = m_book->orderFactory().makeOrder(classified);
    }
    catch (const book::InvalidOrder& e) {
        throw SimulationException(fmt::format(
            "{}: {} #{} produced an invalid order at step {}: {}",
            std::source_location::current().function_name(),
            trader.typeName(),
            trader.id(),
            m_currentTimestep,
            e.what()));
    }

    m_logger->debug(fmt::format("Trader {} submits {}", trader.id(), *order));
    m_book->submitOrder(order);
}

//-------------------------------------------------------------------------

void Simulation::settle(const book::Trade& trade)
{
    agent::Trader* buyer = trader(trade.buyerId());
    agent::Trader* seller = trader(trade.sellerId());
    if (buyer == nullptr || seller == nullptr) {
        m_logger->debug(fmt::format("Skipping settlement of {} with unregistered party", trade));
        return;
    }
    buyer->account().settleBuy(trade.quantity(), trade.price());
    seller->account().settleSell(trade.quantity(), trade.price());
}

//-------------------------------------------------------------------------

void Simulation::updatePriceHistory()
{
    const auto& tradeLog = m_book->tradeLog();
    if (tradeLog.empty()) return;
    m_priceHistory.push_back(util::decimal2double(tradeLog.back()->price()));
    if (m_priceHistory.size() >= 2) {
        const auto n = m_priceHistory.size();
        m_logReturns.push_back(std::log(m_priceHistory[n - 1] / m_priceHistory[n - 2]));
    }
}

//-------------------------------------------------------------------------

}  // namespace lobsim::simulation

//-------------------------------------------------------------------------
