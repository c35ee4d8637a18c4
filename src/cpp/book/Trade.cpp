/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/Trade.hpp"

//-------------------------------------------------------------------------

namespace lobsim::book
{

//-------------------------------------------------------------------------

Trade::Trade(
    TradeID id,
    Timestep timestep,
    OrderDirection direction,
    OrderID aggressingOrderId,
    OrderID restingOrderId,
    TraderId buyerId,
    TraderId sellerId,
    Quantity quantity,
    decimal_t price) noexcept
    : m_id{id},
      m_timestep{timestep},
      m_direction{direction},
      m_aggressingOrderId{aggressingOrderId},
      m_restingOrderId{restingOrderId},
      m_buyerId{buyerId},
      m_sellerId{sellerId},
      m_quantity{quantity},
      m_price{price}
{}

//-------------------------------------------------------------------------

void Trade::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("tradeId", rapidjson::Value{m_id}, allocator);
        json.AddMember("timestep", rapidjson::Value{m_timestep}, allocator);
        json.AddMember(
            "direction",
            rapidjson::Value{magic_enum::enum_name(m_direction).data(), allocator},
            allocator);
        json.AddMember("aggressingOrderId", rapidjson::Value{m_aggressingOrderId}, allocator);
        json.AddMember("restingOrderId", rapidjson::Value{m_restingOrderId}, allocator);
        json.AddMember("buyerId", rapidjson::Value{m_buyerId}, allocator);
        json.AddMember("sellerId", rapidjson::Value{m_sellerId}, allocator);
        json.AddMember("quantity", rapidjson::Value{m_quantity}, allocator);
        json.AddMember("price", rapidjson::Value{util::decimal2double(m_price)}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lobsim::book

//-------------------------------------------------------------------------
