/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/process/GBM.hpp"

//-------------------------------------------------------------------------

namespace lobsim::process
{

//-------------------------------------------------------------------------

GBM::GBM(double X0, double mu, double sigma, double dt, uint64_t seed) noexcept
    : m_rng{seed},
      m_X0{X0},
      m_mu{mu},
      m_sigma{sigma},
      m_dt{dt},
      m_gaussian{0.0, std::sqrt(dt)},
      m_value{X0}
{}

//-------------------------------------------------------------------------

void GBM::update(Timestep timestep)
{
    if (timestep <= m_lastUpdate) return;
    m_lastUpdate = timestep;
    m_t += m_dt;
    m_W += m_gaussian(m_rng);
    m_value = m_X0 * std::exp((m_mu - 0.5 * m_sigma * m_sigma) * m_t + m_sigma * m_W);
    m_valueSignal(m_value);
}

//-------------------------------------------------------------------------

void GBM::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("name", rapidjson::Value{"GBM", allocator}, allocator);
        m_rng.jsonSerialize(json, "rng");
        json.AddMember("X0", rapidjson::Value{m_X0}, allocator);
        json.AddMember("mu", rapidjson::Value{m_mu}, allocator);
        json.AddMember("sigma", rapidjson::Value{m_sigma}, allocator);
        json.AddMember("dt", rapidjson::Value{m_dt}, allocator);
        json.AddMember("t", rapidjson::Value{m_t}, allocator);
        json.AddMember("W", rapidjson::Value{m_W}, allocator);
        json.AddMember("value", rapidjson::Value{m_value}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<GBM> GBM::fromXML(pugi::xml_node node, uint64_t seedShift)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getNonNegativeAttribute = [&](const char* name, std::optional<double> fallback = {}) {
        pugi::xml_attribute attr = node.attribute(name);
        if (attr.empty() && fallback.has_value()) return fallback.value();
        if (double value = attr.as_double(); attr.empty() || value < 0.0) {
            throw std::invalid_argument(fmt::format(
                "{}: Attribute '{}' must be non-negative", ctx, name));
        } else {
            return value;
        }
    };

    const double X0 = getNonNegativeAttribute("X0");
    if (X0 == 0.0) {
        throw std::invalid_argument(fmt::format("{}: Attribute 'X0' must be positive", ctx));
    }

    const double mu = [&] {
        pugi::xml_attribute attr;
        if (attr = node.attribute("mu"); attr.empty()) {
            throw std::invalid_argument(fmt::format(
                "{}: Missing required attribute '{}'", ctx, "mu"));
        }
        return attr.as_double();
    }();

    const uint64_t seed = [&] {
        pugi::xml_attribute attr;
        if (attr = node.attribute("seed"); attr.empty()) {
            throw std::invalid_argument(fmt::format(
                "{}: Missing required attribute '{}'", ctx, "seed"));
        }
        return attr.as_ullong();
    }();

    return std::make_unique<GBM>(
        X0,
        mu,
        getNonNegativeAttribute("sigma"),
        getNonNegativeAttribute("dt", 1.0),
        seed + seedShift);
}

//-------------------------------------------------------------------------

}  // namespace lobsim::process

//-------------------------------------------------------------------------
