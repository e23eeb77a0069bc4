#include "quote_router.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace flash_amm::quoting {

const std::optional<Bytes>& BridgeCache::fetch(const Address& handle,
                                               const DataBridge* bridge,
                                               const QuoteContext& context) {
    const Key key{handle, context.asset0, context.asset1};
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }

    std::optional<Bytes> result;
    if (bridge == nullptr) {
        spdlog::debug("No bridge registered for handle {}", handle.short_hex());
    } else {
        ++fetch_count_;
        try {
            Bytes data = bridge->get_data(context);
            if (!data.empty()) {
                result = std::move(data);
            }
        } catch (const std::exception& e) {
            spdlog::debug("Bridge {} failed, treating as no data: {}", handle.short_hex(), e.what());
        }
    }

    return entries_.emplace(key, std::move(result)).first->second;
}

RoutedPayload QuoteRouter::gather(const QuoteParams& params, BridgeCache& cache) const {
    const Marking marking = MarkingCodec::decode(params.marking);

    const QuoteContext context{.asset0 = params.asset0,
                               .asset1 = params.asset1,
                               .strategy = params.strategy,
                               .amount = params.amount_in,
                               .reserve0 = params.reserve0,
                               .reserve1 = params.reserve1,
                               .bucket_id = marking.bucket_id,
                               .zero_for_one = params.zero_for_one};

    RoutedPayload payload;
    for (std::size_t i = 0; i < marking.bridge_flags.size(); ++i) {
        if (!marking.bridge_flags[i]) {
            continue;
        }
        if (auto handle = bridges_.default_handle(i)) {
            payload.defaults[i] = cache.fetch(*handle, bridges_.resolve(*handle), context);
        }
    }

    if (marking.has_extra_bridge()) {
        if (auto handle = bridges_.extra_handle(marking.extra_slot)) {
            payload.extra = cache.fetch(*handle, bridges_.resolve(*handle), context);
        }
    }

    if (marking.enhanced_context) {
        payload.context = TraderContext{.timestamp = env_.timestamp(),
                                        .block_number = env_.block_number(),
                                        .gas_price = env_.gas_price(),
                                        .session_active = params.session_active};
    }

    return payload;
}

QuoteResult QuoteRouter::get_quote(const QuoteParams& params, BridgeCache& cache) const {
    const Strategy& strategy = strategy_for(params.strategy);
    const PoolId pool_id = assemble(params.asset0, params.asset1, params.strategy, params.marking);
    const RoutedPayload payload = gather(params, cache);

    Amount amount_out = 0;
    try {
        amount_out = strategy.quote(params, payload);
    } catch (const std::exception& e) {
        spdlog::warn("Strategy {} failed on pool {}: {}", params.strategy.short_hex(), to_string(pool_id), e.what());
    }

    return QuoteResult{.amount_out = amount_out, .pool_id = pool_id};
}

std::vector<QuoteResult> QuoteRouter::get_quote_batch(std::span<const QuoteParams> params,
                                                      BridgeCache& cache) const {
    std::vector<QuoteResult> results;
    if (params.empty()) {
        return results;
    }

    const Strategy& strategy = strategy_for(params.front().strategy);

    std::vector<RoutedPayload> payloads;
    payloads.reserve(params.size());
    results.reserve(params.size());
    for (const auto& entry : params) {
        payloads.push_back(gather(entry, cache));
        results.push_back(QuoteResult{.amount_out = 0,
                                      .pool_id = assemble(entry.asset0, entry.asset1, entry.strategy, entry.marking)});
    }

    try {
        const std::vector<Amount> amounts = strategy.quote_batch(params, payloads);
        for (std::size_t i = 0; i < results.size() && i < amounts.size(); ++i) {
            results[i].amount_out = amounts[i];
        }
    } catch (const std::exception& e) {
        spdlog::warn("Strategy {} batch quote failed: {}", params.front().strategy.short_hex(), e.what());
    }

    return results;
}

const Strategy& QuoteRouter::strategy_for(const Address& handle) const {
    const Strategy* strategy = strategies_.find(handle);
    if (strategy == nullptr) {
        throw ConfigurationError(ErrorCode::UNKNOWN_STRATEGY, "no strategy registered for " + handle.to_hex());
    }
    return *strategy;
}

}  // namespace flash_amm::quoting
