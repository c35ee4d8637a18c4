/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/book/BookConfig.hpp"
#include "lobsim/book/BookSignals.hpp"
#include "lobsim/book/Order.hpp"
#include "lobsim/book/OrderFactory.hpp"
#include "lobsim/book/OrderQueue.hpp"
#include "lobsim/book/Trade.hpp"
#include "lobsim/book/TradeFactory.hpp"
#include "lobsim/serialization/JsonSerializable.hpp"
#include "lobsim/util/common.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

struct BookSnapshot : public JsonSerializable
{
    std::optional<decimal_t> bestBid{};
    std::optional<decimal_t> bestAsk{};
    size_t buyDepth{};
    size_t sellDepth{};

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

/**
 * Single-instrument price-time priority book.
 *
 * Limit orders always rest, even when they cross the opposite side. Market orders sweep
 * the opposite side at the resting prices, bounded by their optional limit, and any
 * priced remainder is resubmitted as a fresh limit order. Terminal orders may linger in
 * the queues as tombstones until they surface at the top or the reaper runs.
 *
 * Not thread-safe.
 */
class Book : public JsonSerializable
{
public:
    using Ptr = std::shared_ptr<Book>;

    explicit Book(
        BookConfig config = {},
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    [[nodiscard]] const BookConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const OrderFactory& orderFactory() const noexcept { return m_orderFactory; }
    [[nodiscard]] const TradeFactory& tradeFactory() const noexcept { return m_tradeFactory; }
    [[nodiscard]] const BuyQueue& buyQueue() const noexcept { return m_buyQueue; }
    [[nodiscard]] const SellQueue& sellQueue() const noexcept { return m_sellQueue; }
    [[nodiscard]] const std::vector<Trade::Ptr>& tradeLog() const noexcept { return m_tradeLog; }
    [[nodiscard]] BookSignals& signals() noexcept { return m_signals; }

    void submitOrder(Order::Ptr order);

    // Discard tombstones from the top of the side before peeking.
    [[nodiscard]] std::optional<decimal_t> bestBid();
    [[nodiscard]] std::optional<decimal_t> bestAsk();

    [[nodiscard]] BookSnapshot snapshot();

    std::vector<Order::Ptr> cancelTimedOutOrders(Timestep currentTimestep);

    void reset() noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    void placeLimitOrder(Order::Ptr order);
    void executeMarketOrder(Order::Ptr order);
    void convertRemainder(Order::Ptr order);

    template<typename Queue>
    void sweep(Order::Ptr order, Queue& queue);

    template<typename Queue>
    [[nodiscard]] static std::optional<decimal_t> peekBest(Queue& queue);

    template<typename Queue>
    void reap(Queue& queue, Timestep currentTimestep, std::vector<Order::Ptr>& cancelled);

    BookConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    OrderFactory m_orderFactory;
    TradeFactory m_tradeFactory;
    BookSignals m_signals;
    BuyQueue m_buyQueue;
    SellQueue m_sellQueue;
    std::vector<Trade::Ptr> m_tradeLog;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
