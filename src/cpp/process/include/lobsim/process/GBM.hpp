/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/process/Process.hpp"
#include "lobsim/process/RNG.hpp"
#include "lobsim/util/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace lobsim::process
{

//-------------------------------------------------------------------------

// X(t) = X0 * exp((mu - sigma^2 / 2) * t + sigma * W(t)), advanced by dt per update.
class GBM : public Process
{
public:
    GBM(double X0, double mu, double sigma, double dt, uint64_t seed) noexcept;

    virtual double value() const override { return m_value; }

    virtual void update(Timestep timestep) override;
    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] double X0() const noexcept { return m_X0; }
    [[nodiscard]] double mu() const noexcept { return m_mu; }
    [[nodiscard]] double sigma() const noexcept { return m_sigma; }
    [[nodiscard]] double dt() const noexcept { return m_dt; }
    [[nodiscard]] const RNG& rng() const noexcept { return m_rng; }

    [[nodiscard]] static std::unique_ptr<GBM> fromXML(pugi::xml_node node, uint64_t seedShift = 0);

private:
    RNG m_rng;
    double m_X0, m_mu, m_sigma, m_dt;
    double m_t{}, m_W{};
    std::normal_distribution<double> m_gaussian;
    double m_value;
    Timestep m_lastUpdate{-1};
};

//-------------------------------------------------------------------------

}  // namespace lobsim::process

//-------------------------------------------------------------------------
