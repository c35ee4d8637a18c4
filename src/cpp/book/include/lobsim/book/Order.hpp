/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/serialization/JsonSerializable.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

enum class OrderDirection : uint32_t
{
    BUY,
    SELL
};

enum class OrderType : uint32_t
{
    MARKET,
    LIMIT
};

enum class OrderStatus : uint32_t
{
    PENDING,
    EXECUTED,
    CANCELLED
};

enum class OrderEvent : uint32_t
{
    PARTIAL_FILL,
    FINAL_FILL,
    TIMEOUT
};

[[nodiscard]] constexpr OrderDirection opposite(OrderDirection dir) noexcept
{
    return dir == OrderDirection::BUY ? OrderDirection::SELL : OrderDirection::BUY;
}

[[nodiscard]] constexpr bool isTerminal(OrderStatus status) noexcept
{
    return status != OrderStatus::PENDING;
}

// Throws std::logic_error for events that are illegal in the given state.
[[nodiscard]] OrderStatus transition(OrderStatus from, OrderEvent event);

//-------------------------------------------------------------------------

class InvalidOrder : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

//-------------------------------------------------------------------------

struct OrderRequest
{
    TraderId traderId{};
    OrderDirection direction{OrderDirection::BUY};
    OrderType type{OrderType::LIMIT};
    Quantity quantity{};
    Timestep timestep{};
    std::optional<decimal_t> price{};
    Timestep maxWaitTime{};
};

//-------------------------------------------------------------------------

class Order : public JsonSerializable
{
public:
    using Ptr = std::shared_ptr<Order>;

    Order(OrderID id, const OrderRequest& request);

    [[nodiscard]] OrderID id() const noexcept { return m_id; }
    [[nodiscard]] TraderId traderId() const noexcept { return m_traderId; }
    [[nodiscard]] OrderDirection direction() const noexcept { return m_direction; }
    [[nodiscard]] OrderType type() const noexcept { return m_type; }
    [[nodiscard]] Timestep timestep() const noexcept { return m_timestep; }
    [[nodiscard]] Timestep maxWaitTime() const noexcept { return m_maxWaitTime; }
    [[nodiscard]] Quantity quantity() const noexcept { return m_quantity; }
    [[nodiscard]] std::optional<decimal_t> price() const noexcept { return m_price; }
    [[nodiscard]] OrderStatus status() const noexcept { return m_status; }
    [[nodiscard]] std::optional<decimal_t> executedPrice() const noexcept { return m_executedPrice; }
    [[nodiscard]] std::optional<Timestep> executedTimestep() const noexcept { return m_executedTimestep; }
    [[nodiscard]] bool isPending() const noexcept { return m_status == OrderStatus::PENDING; }

    void execute(decimal_t price, Timestep timestep, Quantity fillQuantity);
    bool checkTimeout(Timestep currentTimestep);

    [[nodiscard]] bool isExecutable(
        std::optional<decimal_t> bestBid, std::optional<decimal_t> bestAsk) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    static void validate(const OrderRequest& request);

private:
    OrderID m_id;
    TraderId m_traderId;
    OrderDirection m_direction;
    OrderType m_type;
    Timestep m_timestep;
    Timestep m_maxWaitTime;
    Quantity m_quantity;
    std::optional<decimal_t> m_price;
    OrderStatus m_status{OrderStatus::PENDING};
    std::optional<decimal_t> m_executedPrice{};
    std::optional<Timestep> m_executedTimestep{};
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lobsim::book::OrderDirection>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lobsim::book::OrderDirection dir, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(dir));
    }
};

template<>
struct fmt::formatter<lobsim::book::OrderType>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lobsim::book::OrderType type, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(type));
    }
};

template<>
struct fmt::formatter<lobsim::book::OrderStatus>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lobsim::book::OrderStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(status));
    }
};

template<>
struct fmt::formatter<lobsim::book::Order>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lobsim::book::Order& order, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "<Order {} | trader={} | type={} | dir={} | qty={} | price={} | status={} | step={}>",
            order.id(),
            order.traderId(),
            order.type(),
            order.direction(),
            order.quantity(),
            order.price().has_value() ? fmt::format("{}", *order.price()) : "MKT",
            order.status(),
            order.timestep());
    }
};

//-------------------------------------------------------------------------
