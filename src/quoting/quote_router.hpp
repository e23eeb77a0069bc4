#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <boost/container_hash/hash.hpp>
#include <boost/unordered/unordered_flat_map.hpp>

#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/environment.hpp"
#include "core/marking.hpp"
#include "core/payload.hpp"
#include "core/pool_id.hpp"
#include "quoting/bridge_registry.hpp"
#include "quoting/data_bridge.hpp"
#include "quoting/strategy.hpp"
#include "quoting/strategy_registry.hpp"

namespace flash_amm::quoting {

/**
 * @brief Per-call memo of bridge responses keyed by bridge handle and asset pair
 *
 * Lives for exactly one top-level call (a swap, or a whole batch swap) so
 * buckets and hops on the same pair cost one fetch per bridge. A hop on a
 * different pair fetches its own payload.
 */
class BridgeCache {
  public:
    /**
     * @brief Cached payload for @p handle on the pair of @p context, fetching through @p bridge on first use
     * @return std::nullopt when the bridge is missing, throws, or returns nothing
     */
    [[nodiscard]] const std::optional<Bytes>& fetch(const Address& handle,
                                                    const DataBridge* bridge,
                                                    const QuoteContext& context);

    [[nodiscard]] std::size_t fetch_count() const noexcept {
        return fetch_count_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return entries_.size();
    }

  private:
    struct Key {
        Address handle;
        Address asset0;
        Address asset1;

        [[nodiscard]] bool operator==(const Key&) const noexcept = default;
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            std::size_t seed = AddressHash{}(key.handle);
            boost::hash_combine(seed, AddressHash{}(key.asset0));
            boost::hash_combine(seed, AddressHash{}(key.asset1));
            return seed;
        }
    };

    boost::unordered_flat_map<Key, std::optional<Bytes>, KeyHash> entries_;
    std::size_t fetch_count_{0};
};

struct QuoteResult {
    Amount amount_out{0};
    PoolId pool_id;
};

/**
 * @brief Gathers bridge payloads and dispatches to the pool's strategy
 *
 * For each quote: decode the marking, fetch the selected default bridges
 * and the extra bridge through the cache, append the trader context when
 * the enhanced-context bit is set, then call the strategy.
 */
class QuoteRouter {
  public:
    QuoteRouter(const BridgeRegistry& bridges, const StrategyRegistry& strategies, const ExecutionEnvironment& env)
        : bridges_(bridges), strategies_(strategies), env_(env) {}

    /**
     * @brief Price one pool
     * @return amount_out == 0 when the strategy cannot price (or threw)
     * @throws ConfigurationError UNKNOWN_STRATEGY if no strategy is registered
     */
    [[nodiscard]] QuoteResult get_quote(const QuoteParams& params, BridgeCache& cache) const;

    /**
     * @brief Price several buckets of one asset pair and strategy in one dispatch
     *
     * All entries of @p params must share asset0, asset1 and strategy.
     */
    [[nodiscard]] std::vector<QuoteResult> get_quote_batch(std::span<const QuoteParams> params,
                                                           BridgeCache& cache) const;

    [[nodiscard]] RoutedPayload gather(const QuoteParams& params, BridgeCache& cache) const;

  private:
    [[nodiscard]] const Strategy& strategy_for(const Address& handle) const;

    const BridgeRegistry& bridges_;
    const StrategyRegistry& strategies_;
    const ExecutionEnvironment& env_;
};

}  // namespace flash_amm::quoting
