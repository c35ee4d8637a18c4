/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/TradeLogger.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

TradeLogger::TradeLogger(const fs::path& filepath, decltype(BookSignals::trade)& signal)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "TradeLogger",
        std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(s_header);
    m_logger->flush();

    m_feed = signal.connect([this](Trade::Ptr trade) { log(trade); });
}

//-------------------------------------------------------------------------

void TradeLogger::log(Trade::Ptr trade)
{
    m_logger->trace(fmt::format(
        "{},{},{},{},{},{},{},{},{}",
        trade->id(),
        trade->timestep(),
        trade->buyerOrderId(),
        trade->sellerOrderId(),
        trade->buyerId(),
        trade->sellerId(),
        trade->price(),
        trade->quantity(),
        trade->direction()));
    m_logger->flush();
    ++m_recordCount;
}

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
