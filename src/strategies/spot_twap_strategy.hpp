#pragma once

#include <cstdint>

#include "core/amount.hpp"
#include "core/payload.hpp"
#include "quoting/strategy.hpp"

namespace flash_amm::strategies {

using namespace flash_amm::core;
using namespace flash_amm::quoting;

/**
 * @brief Oracle-priced strategy blending spot and TWAP
 *
 * Reads default bridge 0, which must carry two 32-byte words: spot and
 * TWAP, each the price of one asset0 in asset1 scaled by 1e18. The blend
 * is 70% spot / 30% TWAP with a 0.2% fee. Missing or malformed data
 * yields 0.
 */
class SpotTwapStrategy final : public Strategy {
  public:
    static constexpr Amount PRICE_SCALE = units(1, 18);
    static constexpr uint32_t SPOT_WEIGHT = 70;
    static constexpr uint32_t TWAP_WEIGHT = 30;
    static constexpr uint32_t FEE_NUMERATOR = 998;
    static constexpr uint32_t FEE_DENOMINATOR = 1000;

    [[nodiscard]] Amount quote(const QuoteParams& params, const RoutedPayload& payload) const override {
        if (params.amount_in == 0 || !payload.defaults[0]) {
            return 0;
        }

        const PayloadReader reader(*payload.defaults[0]);
        if (!reader.has_words(2)) {
            return 0;
        }
        const auto spot = reader.amount_at(0);
        const auto twap = reader.amount_at(1);
        if (!spot || !twap) {
            return 0;
        }

        const WideUint price = (widen(*spot) * SPOT_WEIGHT + widen(*twap) * TWAP_WEIGHT) / 100;
        if (price == 0) {
            return 0;
        }

        // asset0 -> asset1 multiplies by the price, the reverse divides by it
        const WideUint gross = params.zero_for_one ? widen(params.amount_in) * price / widen(PRICE_SCALE)
                                                   : widen(params.amount_in) * widen(PRICE_SCALE) / price;
        const WideUint net = gross * FEE_NUMERATOR / FEE_DENOMINATOR;
        if (net > widen(MAX_AMOUNT)) {
            return 0;
        }
        return narrow(net);
    }
};

}  // namespace flash_amm::strategies
