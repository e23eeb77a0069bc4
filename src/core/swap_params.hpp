#pragma once

#include <cstdint>

#include "core/address.hpp"
#include "core/amount.hpp"

namespace flash_amm::core {

/**
 * @brief One swap as requested by a trader
 *
 * The asset pair selects the pool. zero_for_one is relative to canonical
 * order (asset0 < asset1) and decides which asset is sold, whatever order
 * asset_in / asset_out were given in.
 */
struct SwapParams {
    Address asset_in;
    Address asset_out;
    Address strategy;
    uint32_t marking{0};
    Amount amount_in{0};
    bool zero_for_one{true};
    Amount min_out{0};
};

}  // namespace flash_amm::core
