#pragma once

/**
 * @file amount.hpp
 * @brief Token magnitudes, signed deltas and the wide arithmetic behind them
 *
 * Reserves, liquidity shares and swap amounts are unsigned 128-bit integers.
 * Session deltas are signed 128-bit integers. Every product that can exceed
 * 128 bits (reserve * amount, amount_a * amount_b) is evaluated in 256 bits
 * through Boost.Multiprecision and narrowed back only after the division.
 *
 * RANGE:
 * - Amount: 0 .. 2^128-1, but public entry points accept at most MAX_AMOUNT
 *   (= 2^127-1) so that any amount converts to a Delta without loss
 * - Delta:  -(2^127) .. 2^127-1
 *
 * USAGE:
 * @code
 *   Amount out = mul_div(amount_in, reserve_out, reserve_in + amount_in);
 *   Amount shares = isqrt_product(amount0, amount1);
 *   spdlog::info("reserve0={}", to_string(reserve0));
 * @endcode
 */

#include <cstdint>
#include <format>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include "core/platform.hpp"

namespace flash_amm::core {

using Amount = unsigned __int128;
using Delta = __int128;
using WideUint = boost::multiprecision::uint256_t;

inline constexpr Amount MAX_AMOUNT = static_cast<Amount>(std::numeric_limits<int64_t>::max()) << 64 |
                                     static_cast<Amount>(std::numeric_limits<uint64_t>::max());
inline constexpr Amount MAX_UINT128 = ~static_cast<Amount>(0);

// Build an Amount from a whole-token count and a decimal scale, e.g. units(1000, 18)
[[nodiscard]] constexpr Amount units(uint64_t whole, unsigned decimals = 0) noexcept {
    Amount value = whole;
    for (unsigned i = 0; i < decimals; ++i) {
        value *= 10;
    }
    return value;
}

[[nodiscard]] inline WideUint widen(Amount value) {
    WideUint wide = static_cast<uint64_t>(value >> 64);
    wide <<= 64;
    wide |= static_cast<uint64_t>(value);
    return wide;
}

// Narrow a 256-bit intermediate back to Amount. Callers guarantee the range.
[[nodiscard]] inline Amount narrow(const WideUint& wide) {
    if (wide > widen(MAX_UINT128)) {
        throw std::overflow_error("256-bit intermediate does not fit in 128 bits");
    }
    const WideUint mask = std::numeric_limits<uint64_t>::max();
    const auto lo = static_cast<uint64_t>(wide & mask);
    const auto hi = static_cast<uint64_t>(wide >> 64);
    return (static_cast<Amount>(hi) << 64) | lo;
}

// floor(a * b / c) without intermediate overflow. c must be non-zero.
[[nodiscard]] inline Amount mul_div(Amount a, Amount b, Amount c) {
    if (c == 0) {
        throw std::domain_error("mul_div by zero");
    }
    return narrow(widen(a) * widen(b) / widen(c));
}

// floor(sqrt(a * b)), evaluated in 256 bits
[[nodiscard]] inline Amount isqrt_product(Amount a, Amount b) {
    return narrow(boost::multiprecision::sqrt(widen(a) * widen(b)));
}

[[nodiscard]] constexpr bool fits_delta(Amount value) noexcept {
    return value <= MAX_AMOUNT;
}

[[nodiscard]] constexpr Delta to_delta(Amount value) noexcept {
    return static_cast<Delta>(value);
}

[[nodiscard]] constexpr Amount magnitude(Delta value) noexcept {
    return value < 0 ? static_cast<Amount>(-(value + 1)) + 1 : static_cast<Amount>(value);
}

[[nodiscard]] inline std::string to_string(Amount value) {
    if (value == 0)
        return "0";

    std::string result;
    while (value > 0) {
        result.insert(result.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    return result;
}

[[nodiscard]] inline std::string to_string(Delta value) {
    if (value < 0)
        return "-" + to_string(magnitude(value));
    return to_string(static_cast<Amount>(value));
}

}  // namespace flash_amm::core
