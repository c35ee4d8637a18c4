/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/book/BookSignals.hpp"
#include "lobsim/util/common.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

class TradeLogger
{
public:
    TradeLogger(const fs::path& filepath, decltype(BookSignals::trade)& signal);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }
    [[nodiscard]] size_t recordCount() const noexcept { return m_recordCount; }

    static constexpr std::string_view s_header =
        "tradeId,timestep,buyerOrderId,sellerOrderId,buyerId,sellerId,price,quantity,direction";

private:
    void log(Trade::Ptr trade);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    size_t m_recordCount{};
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
