/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/book/Trade.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

class TradeFactory
{
public:
    TradeFactory() noexcept = default;

    [[nodiscard]] TradeID getCounterState() const noexcept { return m_idCounter; }

    template<typename... Args>
    requires std::constructible_from<Trade, TradeID, Args...>
    [[nodiscard]] Trade::Ptr makeRecord(Args&&... args) const noexcept
    {
        return Trade::create(m_idCounter++, std::forward<Args>(args)...);
    }

private:
    mutable TradeID m_idCounter{};
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
