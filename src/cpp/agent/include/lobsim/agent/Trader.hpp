/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/agent/Account.hpp"
#include "lobsim/agent/MarketSnapshot.hpp"
#include "lobsim/book/Order.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::agent
{

//-------------------------------------------------------------------------

class Trader
{
public:
    using Ptr = std::unique_ptr<Trader>;

    virtual ~Trader() noexcept = default;

    [[nodiscard]] TraderId id() const noexcept { return m_id; }
    [[nodiscard]] auto&& account(this auto&& self) noexcept { return self.m_account; }

    [[nodiscard]] virtual std::string_view typeName() const noexcept = 0;

    // An empty result means the trader sits out this step.
    [[nodiscard]] virtual std::optional<book::OrderRequest> generateOrder(
        Timestep timestep, const MarketSnapshot& snapshot) = 0;

protected:
    Trader(TraderId id, Account account) noexcept
        : m_id{id}, m_account{std::move(account)}
    {}

    TraderId m_id;
    Account m_account;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::agent

//-------------------------------------------------------------------------
