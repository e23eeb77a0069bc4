#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/payload.hpp"

namespace flash_amm::quoting {

using namespace flash_amm::core;

/**
 * @brief Structured pricing request for one pool
 *
 * Assets are in canonical order; zero_for_one says which one is sold.
 */
struct QuoteParams {
    Address asset0;
    Address asset1;
    Address strategy;
    uint32_t marking{0};
    Amount amount_in{0};
    bool zero_for_one{true};
    Amount reserve0{0};
    Amount reserve1{0};
    bool session_active{false};  // for the beneficiary, forwarded in TraderContext

    [[nodiscard]] constexpr Amount reserve_in() const noexcept {
        return zero_for_one ? reserve0 : reserve1;
    }

    [[nodiscard]] constexpr Amount reserve_out() const noexcept {
        return zero_for_one ? reserve1 : reserve0;
    }
};

/**
 * @brief Execution context appended when the enhanced-context bit is set
 */
struct TraderContext {
    uint64_t timestamp{0};
    uint64_t block_number{0};
    Amount gas_price{0};
    bool session_active{false};
};

/**
 * @brief Everything the router gathered for one quote
 *
 * Slot i of defaults holds default bridge i's payload when its marking bit
 * is set and the bridge produced data. A missing entry means "no data".
 */
struct RoutedPayload {
    std::array<std::optional<Bytes>, 4> defaults{};
    std::optional<Bytes> extra;
    std::optional<TraderContext> context;

    [[nodiscard]] std::size_t present_count() const noexcept {
        std::size_t count = extra ? 1 : 0;
        for (const auto& entry : defaults) {
            if (entry)
                ++count;
        }
        return count;
    }
};

/**
 * @brief Pluggable pricing logic
 *
 * quote() returns the output amount; 0 is the canonical "no price" signal.
 * Implementations may throw, the router treats that as 0.
 */
class Strategy {
  public:
    virtual ~Strategy() = default;

    [[nodiscard]] virtual Amount quote(const QuoteParams& params, const RoutedPayload& payload) const = 0;

    // Several buckets of one asset pair; override to share work across them
    [[nodiscard]] virtual std::vector<Amount> quote_batch(std::span<const QuoteParams> params,
                                                          std::span<const RoutedPayload> payloads) const {
        std::vector<Amount> out;
        out.reserve(params.size());
        for (std::size_t i = 0; i < params.size(); ++i) {
            out.push_back(quote(params[i], payloads[i]));
        }
        return out;
    }
};

}  // namespace flash_amm::quoting
