/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/serialization/JsonSerializable.hpp"
#include "lobsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace lobsim::process
{

//-------------------------------------------------------------------------

class Process : public JsonSerializable
{
public:
    using ValueSignal = UnsyncSignal<void(double)>;

    virtual ~Process() noexcept = default;

    virtual void update(Timestep timestep) = 0;
    [[nodiscard]] virtual double value() const = 0;

    [[nodiscard]] auto&& valueSignal(this auto&& self) noexcept { return self.m_valueSignal; }

protected:
    Process() noexcept = default;

    ValueSignal m_valueSignal;
};

//-------------------------------------------------------------------------

}  // namespace lobsim::process

//-------------------------------------------------------------------------
