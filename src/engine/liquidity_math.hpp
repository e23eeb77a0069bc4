#pragma once

#include <cstdint>
#include <utility>

#include "core/amount.hpp"
#include "core/errors.hpp"

namespace flash_amm::engine {

using namespace flash_amm::core;

/**
 * @brief Pure share and valuation arithmetic behind add/remove liquidity
 */
namespace liquidity_math {

inline constexpr Amount RATE_SCALE = units(1, 18);
inline constexpr uint32_t BPS_DENOMINATOR = 10'000;

/**
 * @brief Shares for the first deposit of a pool: sqrt(a * b) - lock
 * @throws ConfigurationError DEGENERATE_INITIAL_DEPOSIT if sqrt(a * b) <= lock
 */
[[nodiscard]] inline Amount initial_shares(Amount amount0, Amount amount1, Amount permanent_lock) {
    const Amount root = isqrt_product(amount0, amount1);
    if (root <= permanent_lock) {
        throw ConfigurationError(ErrorCode::DEGENERATE_INITIAL_DEPOSIT,
                                 "sqrt(amount0 * amount1) = " + to_string(root) + " does not exceed lock " +
                                     to_string(permanent_lock));
    }
    return root - permanent_lock;
}

/**
 * @brief min(a0 * total / r0, a1 * total / r1), both ratios taken in 256 bits
 * @throws ConfigurationError AMOUNT_OUT_OF_RANGE if the minimum exceeds MAX_AMOUNT
 */
[[nodiscard]] inline Amount proportional_shares(Amount amount0,
                                                Amount amount1,
                                                Amount reserve0,
                                                Amount reserve1,
                                                Amount total_shares) {
    const WideUint by0 = widen(amount0) * widen(total_shares) / widen(reserve0);
    const WideUint by1 = widen(amount1) * widen(total_shares) / widen(reserve1);
    const WideUint shares = by0 < by1 ? by0 : by1;
    if (shares > widen(MAX_AMOUNT)) {
        throw ConfigurationError(ErrorCode::AMOUNT_OUT_OF_RANGE,
                                 "deposit would mint more than " + to_string(MAX_AMOUNT) + " shares");
    }
    return narrow(shares);
}

// (shares * r0 / total, shares * r1 / total)
[[nodiscard]] inline std::pair<Amount, Amount> withdrawal_amounts(Amount shares,
                                                                  Amount reserve0,
                                                                  Amount reserve1,
                                                                  Amount total_shares) {
    return {mul_div(shares, reserve0, total_shares), mul_div(shares, reserve1, total_shares)};
}

// asset1 per asset0, scaled by 1e18, from the inventory ratio
[[nodiscard]] inline Amount inventory_rate(Amount reserve0, Amount reserve1) {
    return reserve0 == 0 ? 0 : mul_div(reserve1, RATE_SCALE, reserve0);
}

// r0 + r1 / rate, everything in asset0 units
[[nodiscard]] inline Amount pool_value_in_asset0(Amount reserve0, Amount reserve1, Amount rate) {
    if (rate == 0) {
        return reserve0;
    }
    return narrow(widen(reserve0) + widen(reserve1) * widen(RATE_SCALE) / widen(rate));
}

// Protocol cut of the value gained since the baseline; 0 when there is no gain
[[nodiscard]] inline Amount protocol_fee(Amount value, Amount baseline, uint32_t fee_bps) {
    if (value <= baseline || fee_bps == 0) {
        return 0;
    }
    return mul_div(value - baseline, fee_bps, BPS_DENOMINATOR);
}

}  // namespace liquidity_math

}  // namespace flash_amm::engine
