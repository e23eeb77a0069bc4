#pragma once

#include <cstdint>
#include <stdexcept>

#include "core/amount.hpp"
#include "quoting/strategy.hpp"

namespace flash_amm::strategies {

using namespace flash_amm::core;
using namespace flash_amm::quoting;

/**
 * @brief x * y = k pricing against the pool's own reserves
 *
 *   out = in * r_out / (r_in + in) * (1000 - fee) / 1000
 *
 * Needs no bridge data. Returns 0 for an empty pool.
 */
class ConstantProductStrategy final : public Strategy {
  public:
    static constexpr uint32_t FEE_DENOMINATOR = 1000;

    explicit ConstantProductStrategy(uint32_t fee_per_mille = 3) : fee_per_mille_(fee_per_mille) {
        if (fee_per_mille_ >= FEE_DENOMINATOR) {
            throw std::invalid_argument("constant product fee must be below 1000 per mille");
        }
    }

    [[nodiscard]] Amount quote(const QuoteParams& params, const RoutedPayload&) const override {
        const Amount reserve_in = params.reserve_in();
        const Amount reserve_out = params.reserve_out();
        if (params.amount_in == 0 || reserve_in == 0 || reserve_out == 0) {
            return 0;
        }

        const WideUint raw = widen(params.amount_in) * widen(reserve_out) / (widen(reserve_in) + widen(params.amount_in));
        return narrow(raw * (FEE_DENOMINATOR - fee_per_mille_) / FEE_DENOMINATOR);
    }

    [[nodiscard]] uint32_t fee_per_mille() const noexcept {
        return fee_per_mille_;
    }

  private:
    uint32_t fee_per_mille_;
};

}  // namespace flash_amm::strategies
