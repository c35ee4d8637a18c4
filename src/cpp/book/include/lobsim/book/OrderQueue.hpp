/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/book/Order.hpp"

#include <algorithm>
#include <concepts>
#include <vector>

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

// Heap comparators: true when lhs ranks strictly behind rhs.
struct BidPriority
{
    [[nodiscard]] bool operator()(const Order::Ptr& lhs, const Order::Ptr& rhs) const noexcept
    {
        const decimal_t lhsPrice = lhs->price().value_or(decimal_t{});
        const decimal_t rhsPrice = rhs->price().value_or(decimal_t{});
        if (lhsPrice != rhsPrice) return lhsPrice < rhsPrice;
        return lhs->id() > rhs->id();
    }
};

struct AskPriority
{
    [[nodiscard]] bool operator()(const Order::Ptr& lhs, const Order::Ptr& rhs) const noexcept
    {
        const decimal_t lhsPrice = lhs->price().value_or(decimal_t{});
        const decimal_t rhsPrice = rhs->price().value_or(decimal_t{});
        if (lhsPrice != rhsPrice) return lhsPrice > rhsPrice;
        return lhs->id() > rhs->id();
    }
};

//-------------------------------------------------------------------------

template<typename Priority>
requires std::predicate<Priority, const Order::Ptr&, const Order::Ptr&>
class OrderQueue
{
public:
    using container_type = std::vector<Order::Ptr>;
    using const_iterator = container_type::const_iterator;

    [[nodiscard]] const Order::Ptr& top() const { return m_heap.front(); }
    [[nodiscard]] size_t size() const noexcept { return m_heap.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_heap.empty(); }

    // Heap order, not priority order.
    [[nodiscard]] const_iterator begin() const noexcept { return m_heap.cbegin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_heap.cend(); }

    void push(Order::Ptr order)
    {
        m_heap.push_back(std::move(order));
        std::push_heap(m_heap.begin(), m_heap.end(), m_priority);
    }

    Order::Ptr pop()
    {
        std::pop_heap(m_heap.begin(), m_heap.end(), m_priority);
        Order::Ptr order = std::move(m_heap.back());
        m_heap.pop_back();
        return order;
    }

    template<std::predicate<const Order::Ptr&> Pred>
    size_t eraseIf(Pred pred)
    {
        const size_t erased = std::erase_if(m_heap, pred);
        if (erased > 0) {
            std::make_heap(m_heap.begin(), m_heap.end(), m_priority);
        }
        return erased;
    }

    void clear() noexcept { m_heap.clear(); }

private:
    container_type m_heap;
    [[no_unique_address]] Priority m_priority{};
};

using BuyQueue = OrderQueue<BidPriority>;
using SellQueue = OrderQueue<AskPriority>;

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
