/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lobsim/decimal/decimal.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;

//-------------------------------------------------------------------------

namespace lobsim
{

using OrderID = uint64_t;
using TradeID = uint64_t;
using TraderId = int32_t;
using Timestep = int64_t;
using Quantity = int64_t;

template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using UnsyncSignal = bs2::signal_type<SlotType, bs2::keywords::mutex_type<bs2::dummy_mutex>>::type;

}  // namespace lobsim

//-------------------------------------------------------------------------
