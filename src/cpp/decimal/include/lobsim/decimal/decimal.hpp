/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <spanstream>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace lobsim
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace lobsim

//-------------------------------------------------------------------------

namespace lobsim::util
{

inline constexpr uint32_t kDefaultDecimalPlaces = 8;
inline constexpr uint32_t kPriceDecimalPlaces = 2;

[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

[[nodiscard]] inline decimal_t double2decimal(
    double val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return round(decimal_t{val}, decimalPlaces);
}

// Nearest price on the 10^-decimalPlaces grid, halves away from zero.
[[nodiscard]] inline decimal_t double2price(
    double val, uint32_t decimalPlaces = kPriceDecimalPlaces)
{
    using namespace BloombergLP::bdldfp;
    const auto factor = DecimalUtil::multiplyByPowerOf10(decimal_t{1}, decimalPlaces);
    return DecimalUtil::round(decimal_t{val} * factor) / factor;
}

}  // namespace lobsim::util

//-------------------------------------------------------------------------

namespace lobsim::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace lobsim::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lobsim::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lobsim::decimal_t val, FormatContext& ctx) const
    {
        using namespace lobsim::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
