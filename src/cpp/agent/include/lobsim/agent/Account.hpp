/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/serialization/JsonSerializable.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

class Account : public JsonSerializable
{
public:
    Account() noexcept = default;
    Account(decimal_t cash, Quantity stock);

    [[nodiscard]] decimal_t cash() const noexcept { return m_cash; }
    [[nodiscard]] Quantity stock() const noexcept { return m_stock; }

    [[nodiscard]] decimal_t wealth(decimal_t price) const noexcept
    {
        return m_cash + decimal_t{m_stock} * price;
    }

    // Both sides are floored at zero after each settlement.
    void settleBuy(Quantity quantity, decimal_t price) noexcept;
    void settleSell(Quantity quantity, decimal_t price) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    void clamp() noexcept;

    decimal_t m_cash{};
    Quantity m_stock{};
};

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lobsim::agent::Account>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lobsim::agent::Account& account, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{{cash={}, stock={}}}", account.cash(), account.stock());
    }
};

//-------------------------------------------------------------------------
