/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/book/Order.hpp"
#include "lobsim/serialization/JsonSerializable.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

struct Trade : public JsonSerializable
{
    using Ptr = std::shared_ptr<Trade>;

    Trade(
        TradeID id,
        Timestep timestep,
        OrderDirection direction,
        OrderID aggressingOrderId,
        OrderID restingOrderId,
        TraderId buyerId,
        TraderId sellerId,
        Quantity quantity,
        decimal_t price) noexcept;

    [[nodiscard]] TradeID id() const noexcept { return m_id; }
    [[nodiscard]] Timestep timestep() const noexcept { return m_timestep; }
    [[nodiscard]] OrderDirection direction() const noexcept { return m_direction; }
    [[nodiscard]] OrderID aggressingOrderId() const noexcept { return m_aggressingOrderId; }
    [[nodiscard]] OrderID restingOrderId() const noexcept { return m_restingOrderId; }
    [[nodiscard]] TraderId buyerId() const noexcept { return m_buyerId; }
    [[nodiscard]] TraderId sellerId() const noexcept { return m_sellerId; }
    [[nodiscard]] Quantity quantity() const noexcept { return m_quantity; }
    [[nodiscard]] decimal_t price() const noexcept { return m_price; }

    [[nodiscard]] OrderID buyerOrderId() const noexcept
    {
        return m_direction == OrderDirection::BUY ? m_aggressingOrderId : m_restingOrderId;
    }

    [[nodiscard]] OrderID sellerOrderId() const noexcept
    {
        return m_direction == OrderDirection::SELL ? m_aggressingOrderId : m_restingOrderId;
    }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    template<typename... Args>
    requires std::constructible_from<Trade, Args...>
    [[nodiscard]] static Ptr create(Args&&... args) noexcept
    {
        return Trade::Ptr{new Trade(std::forward<Args>(args)...)};
    }

    TradeID m_id;
    Timestep m_timestep;
    OrderDirection m_direction;
    OrderID m_aggressingOrderId;
    OrderID m_restingOrderId;
    TraderId m_buyerId;
    TraderId m_sellerId;
    Quantity m_quantity;
    decimal_t m_price;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lobsim::book::Trade>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lobsim::book::Trade& trade, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "<Trade {} | step={} | buyer={} | seller={} | qty={} | price={}>",
            trade.id(),
            trade.timestep(),
            trade.buyerId(),
            trade.sellerId(),
            trade.quantity(),
            trade.price());
    }
};

//-------------------------------------------------------------------------
