/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/Order.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

OrderStatus transition(OrderStatus from, OrderEvent event)
{
    switch (from) {
        case OrderStatus::PENDING:
            switch (event) {
                case OrderEvent::PARTIAL_FILL: return OrderStatus::PENDING;
                case OrderEvent::FINAL_FILL: return OrderStatus::EXECUTED;
                case OrderEvent::TIMEOUT: return OrderStatus::CANCELLED;
            }
            break;
        case OrderStatus::EXECUTED:
        case OrderStatus::CANCELLED:
            break;
    }
    throw std::logic_error(fmt::format(
        "{}: Illegal event {} in state {}",
        std::source_location::current().function_name(),
        magic_enum::enum_name(event),
        from));
}

//-------------------------------------------------------------------------

Order::Order(OrderID id, const OrderRequest& request)
    : m_id{id},
      m_traderId{request.traderId},
      m_direction{request.direction},
      m_type{request.type},
      m_timestep{request.timestep},
      m_maxWaitTime{request.maxWaitTime},
      m_quantity{request.quantity},
      m_price{request.price}
{
    validate(request);
}

//-------------------------------------------------------------------------

void Order::execute(decimal_t price, Timestep timestep, Quantity fillQuantity)
{
    if (isTerminal(m_status)) {
        throw std::logic_error(fmt::format(
            "{}: Cannot fill order #{} in terminal state {}",
            std::source_location::current().function_name(),
            m_id,
            m_status));
    }
    if (fillQuantity <= 0 || fillQuantity > m_quantity) {
        throw std::logic_error(fmt::format(
            "{}: Fill quantity {} out of range for order #{} with {} remaining",
            std::source_location::current().function_name(),
            fillQuantity,
            m_id,
            m_quantity));
    }
    m_executedPrice = price;
    m_executedTimestep = timestep;
    m_quantity -= fillQuantity;
    m_status = transition(
        m_status, m_quantity > 0 ? OrderEvent::PARTIAL_FILL : OrderEvent::FINAL_FILL);
}

//-------------------------------------------------------------------------

bool Order::checkTimeout(Timestep currentTimestep)
{
    if (m_status == OrderStatus::CANCELLED) return true;
    if (m_status == OrderStatus::EXECUTED) return false;
    if (currentTimestep - m_timestep <= m_maxWaitTime) return false;
    m_status = transition(m_status, OrderEvent::TIMEOUT);
    return true;
}

//-------------------------------------------------------------------------

bool Order::isExecutable(
    std::optional<decimal_t> bestBid, std::optional<decimal_t> bestAsk) const noexcept
{
    if (m_type == OrderType::MARKET) return true;
    if (m_direction == OrderDirection::BUY) {
        return bestAsk.has_value() && *m_price >= *bestAsk;
    }
    return bestBid.has_value() && *m_price <= *bestBid;
}

//-------------------------------------------------------------------------

void Order::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("orderId", rapidjson::Value{m_id}, allocator);
        json.AddMember("traderId", rapidjson::Value{m_traderId}, allocator);
        json.AddMember(
            "direction",
            rapidjson::Value{magic_enum::enum_name(m_direction).data(), allocator},
            allocator);
        json.AddMember(
            "type", rapidjson::Value{magic_enum::enum_name(m_type).data(), allocator}, allocator);
        json.AddMember("timestep", rapidjson::Value{m_timestep}, allocator);
        json.AddMember("maxWaitTime", rapidjson::Value{m_maxWaitTime}, allocator);
        json.AddMember("quantity", rapidjson::Value{m_quantity}, allocator);
        json::setOptionalMember(json, "price", m_price);
        json.AddMember(
            "status",
            rapidjson::Value{magic_enum::enum_name(m_status).data(), allocator},
            allocator);
        json::setOptionalMember(json, "executedPrice", m_executedPrice);
        json::setOptionalMember(json, "executedTimestep", m_executedTimestep);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Order::validate(const OrderRequest& request)
{
    const auto ctx = std::source_location::current().function_name();

    if (!magic_enum::enum_contains(request.direction)) {
        throw InvalidOrder{fmt::format(
            "{}: Unknown direction {}", ctx, std::to_underlying(request.direction))};
    }
    if (!magic_enum::enum_contains(request.type)) {
        throw InvalidOrder{fmt::format(
            "{}: Unknown order type {}", ctx, std::to_underlying(request.type))};
    }
    if (request.quantity <= 0) {
        throw InvalidOrder{fmt::format(
            "{}: Quantity should be positive, was {}", ctx, request.quantity)};
    }
    if (request.maxWaitTime < 0) {
        throw InvalidOrder{fmt::format(
            "{}: Max wait time should be non-negative, was {}", ctx, request.maxWaitTime)};
    }
    if (request.type == OrderType::LIMIT && !request.price.has_value()) {
        throw InvalidOrder{fmt::format("{}: Limit order requires a price", ctx)};
    }
    if (request.price.has_value() && request.price.value() <= decimal_t{}) {
        throw InvalidOrder{fmt::format(
            "{}: {} order price should be positive, was {}",
            ctx,
            request.type,
            request.price.value())};
    }
}

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
