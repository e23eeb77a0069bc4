#pragma once

#include <cstdint>

#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/payload.hpp"

namespace flash_amm::quoting {

using namespace flash_amm::core;

/**
 * @brief What a data bridge is told about the quote being priced
 */
struct QuoteContext {
    Address asset0;
    Address asset1;
    Address strategy;
    Amount amount{0};
    Amount reserve0{0};
    Amount reserve1{0};
    uint16_t bucket_id{0};
    bool zero_for_one{true};
};

/**
 * @brief External market-data provider
 *
 * Read-only. A throw or an empty result means "no data" and never
 * propagates past the router.
 */
class DataBridge {
  public:
    virtual ~DataBridge() = default;

    [[nodiscard]] virtual Bytes get_data(const QuoteContext& context) const = 0;
};

}  // namespace flash_amm::quoting
