/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/Book.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

void BookSnapshot::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setOptionalMember(json, "bestBid", bestBid);
        json::setOptionalMember(json, "bestAsk", bestAsk);
        json.AddMember("buyDepth", rapidjson::Value{static_cast<uint64_t>(buyDepth)}, allocator);
        json.AddMember("sellDepth", rapidjson::Value{static_cast<uint64_t>(sellDepth)}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Book::Book(BookConfig config, std::shared_ptr<spdlog::logger> logger)
    : m_config{config},
      m_logger{logger ? std::move(logger) : spdlog::default_logger()}
{}

//-------------------------------------------------------------------------

void Book::submitOrder(Order::Ptr order)
{
    if (order == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot submit a null order", std::source_location::current().function_name())};
    }
    if (!order->isPending()) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot submit order #{} in state {}",
            std::source_location::current().function_name(),
            order->id(),
            order->status())};
    }

    m_signals.orderSubmitted(order);

    switch (order->type()) {
        case OrderType::LIMIT:
            placeLimitOrder(order);
            break;
        case OrderType::MARKET:
            executeMarketOrder(order);
            break;
    }
}

//-------------------------------------------------------------------------

std::optional<decimal_t> Book::bestBid()
{
    return peekBest(m_buyQueue);
}

//-------------------------------------------------------------------------

std::optional<decimal_t> Book::bestAsk()
{
    return peekBest(m_sellQueue);
}

//-------------------------------------------------------------------------

BookSnapshot Book::snapshot()
{
    BookSnapshot snapshot;
    snapshot.bestBid = bestBid();
    snapshot.bestAsk = bestAsk();
    snapshot.buyDepth = m_buyQueue.size();
    snapshot.sellDepth = m_sellQueue.size();
    return snapshot;
}

//-------------------------------------------------------------------------

std::vector<Order::Ptr> Book::cancelTimedOutOrders(Timestep currentTimestep)
{
    std::vector<Order::Ptr> cancelled;
    reap(m_buyQueue, currentTimestep, cancelled);
    reap(m_sellQueue, currentTimestep, cancelled);
    if (!cancelled.empty()) {
        m_logger->debug(fmt::format(
            "Step {}: cancelled {} timed out order(s)", currentTimestep, cancelled.size()));
    }
    return cancelled;
}

//-------------------------------------------------------------------------

void Book::reset() noexcept
{
    m_buyQueue.clear();
    m_sellQueue.clear();
    m_tradeLog.clear();
}

//-------------------------------------------------------------------------

void Book::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "sweepRejectPolicy",
            rapidjson::Value{magic_enum::enum_name(m_config.sweepRejectPolicy).data(), allocator},
            allocator);
        auto serializeSide = [&](const auto& queue) {
            rapidjson::Value side{rapidjson::kArrayType};
            for (const auto& order : queue) {
                if (!order->isPending()) continue;
                rapidjson::Document orderJson{&allocator};
                order->jsonSerialize(orderJson);
                side.PushBack(orderJson, allocator);
            }
            return side;
        };
        json.AddMember("bids", serializeSide(m_buyQueue), allocator);
        json.AddMember("asks", serializeSide(m_sellQueue), allocator);
        json.AddMember(
            "tradeCount", rapidjson::Value{static_cast<uint64_t>(m_tradeLog.size())}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Book::placeLimitOrder(Order::Ptr order)
{
    if (order->direction() == OrderDirection::BUY) {
        m_buyQueue.push(order);
    } else {
        m_sellQueue.push(order);
    }
}

//-------------------------------------------------------------------------

void Book::executeMarketOrder(Order::Ptr order)
{
    if (order->direction() == OrderDirection::BUY) {
        sweep(order, m_sellQueue);
    } else {
        sweep(order, m_buyQueue);
    }
}

//-------------------------------------------------------------------------

template<typename Queue>
void Book::sweep(Order::Ptr order, Queue& queue)
{
    if (!peekBest(queue).has_value()) {
        m_logger->debug(fmt::format(
            "No {} liquidity for market order #{}, skipping",
            order->direction() == OrderDirection::BUY ? "sell" : "buy",
            order->id()));
        m_signals.unmatched(order);
        return;
    }

    const std::optional<decimal_t> bound = order->price();
    const bool isBuy = order->direction() == OrderDirection::BUY;

    while (order->quantity() > 0 && !queue.empty()) {
        Order::Ptr resting = queue.pop();
        if (!resting->isPending()) continue;

        const decimal_t restingPrice = resting->price().value();

        if (bound.has_value()
            && (isBuy ? restingPrice > bound.value() : restingPrice < bound.value())) {
            if (m_config.sweepRejectPolicy == SweepRejectPolicy::RESTORE) {
                queue.push(resting);
            } else {
                m_logger->debug(fmt::format(
                    "Discarding resting order #{} at {} rejected by bound {} of order #{}",
                    resting->id(),
                    restingPrice,
                    bound.value(),
                    order->id()));
            }
            break;
        }

        const Quantity fillQuantity = std::min(order->quantity(), resting->quantity());
        order->execute(restingPrice, order->timestep(), fillQuantity);
        resting->execute(restingPrice, order->timestep(), fillQuantity);

        const auto trade = m_tradeFactory.makeRecord(
            order->timestep(),
            order->direction(),
            order->id(),
            resting->id(),
            isBuy ? order->traderId() : resting->traderId(),
            isBuy ? resting->traderId() : order->traderId(),
            fillQuantity,
            restingPrice);
        m_tradeLog.push_back(trade);
        m_signals.trade(trade);

        if (resting->isPending()) {
            queue.push(resting);
        }
    }

    if (order->quantity() > 0) {
        convertRemainder(order);
    }
}

//-------------------------------------------------------------------------

void Book::convertRemainder(Order::Ptr order)
{
    if (!order->price().has_value()) {
        m_logger->debug(fmt::format(
            "Dropping unpriced remainder {} of market order #{}", order->quantity(), order->id()));
        return;
    }

    const auto remainder = m_orderFactory.makeLimitOrder(
        order->traderId(),
        order->direction(),
        order->quantity(),
        order->price().value(),
        order->timestep(),
        order->maxWaitTime());

    m_logger->debug(fmt::format(
        "Market order #{} remainder {} resubmitted as limit order #{} at {}",
        order->id(),
        remainder->quantity(),
        remainder->id(),
        remainder->price().value()));

    m_signals.remainderConverted(order, remainder);
    submitOrder(remainder);
}

//-------------------------------------------------------------------------

template<typename Queue>
std::optional<decimal_t> Book::peekBest(Queue& queue)
{
    while (!queue.empty()) {
        const auto& top = queue.top();
        if (top->isPending() && top->quantity() > 0) {
            return top->price();
        }
        queue.pop();
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

template<typename Queue>
void Book::reap(Queue& queue, Timestep currentTimestep, std::vector<Order::Ptr>& cancelled)
{
    queue.eraseIf([&](const Order::Ptr& order) {
        const bool wasPending = order->isPending();
        if (!order->checkTimeout(currentTimestep)) return false;
        if (wasPending) {
            cancelled.push_back(order);
            m_signals.cancel(order, currentTimestep);
        }
        return true;
    });
}

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
