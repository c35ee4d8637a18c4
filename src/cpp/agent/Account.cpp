/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/agent/Account.hpp"

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

Account::Account(decimal_t cash, Quantity stock)
    : m_cash{cash}, m_stock{stock}
{
    if (m_cash < decimal_t{} || m_stock < 0) {
        throw std::invalid_argument(fmt::format(
            "{}: Negative holdings (cash={}, stock={})",
            std::source_location::current().function_name(),
            m_cash,
            m_stock));
    }
}

//-------------------------------------------------------------------------

void Account::settleBuy(Quantity quantity, decimal_t price) noexcept
{
    m_cash -= decimal_t{quantity} * price;
    m_stock += quantity;
    clamp();
}

//-------------------------------------------------------------------------

void Account::settleSell(Quantity quantity, decimal_t price) noexcept
{
    m_cash += decimal_t{quantity} * price;
    m_stock -= quantity;
    clamp();
}

//-------------------------------------------------------------------------

void Account::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("cash", rapidjson::Value{util::decimal2double(m_cash)}, allocator);
        json.AddMember("stock", rapidjson::Value{m_stock}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Account::clamp() noexcept
{
    m_cash = std::max(m_cash, decimal_t{});
    m_stock = std::max(m_stock, Quantity{});
}

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------
