#include "pool_manager.hpp"

#include <algorithm>
#include <array>
#include <string>

#include <spdlog/spdlog.h>

#include "core/errors.hpp"
#include "engine/liquidity_math.hpp"

namespace flash_amm::engine {

namespace {

void validate_amount(Amount amount, const char* what) {
    if (amount == 0) {
        throw ConfigurationError(ErrorCode::INVALID_AMOUNT, std::string(what) + " must be non-zero");
    }
    if (amount > MAX_AMOUNT) {
        throw ConfigurationError(ErrorCode::AMOUNT_OUT_OF_RANGE, std::string(what) + " exceeds 2^127 - 1");
    }
}

}  // namespace

PoolManager::PoolManager(const EngineSettings& settings,
                         ExecutionEnvironment& env,
                         AssetVault& vault,
                         const BridgeRegistry& bridges,
                         const StrategyRegistry& strategies,
                         const Address& custody)
    : settings_(settings),
      env_(env),
      vault_(vault),
      custody_(custody),
      strategies_(strategies),
      inventory_(journal_),
      shares_(journal_),
      flash_(journal_),
      router_(bridges, strategies, env),
      commit_reveal_(journal_, settings.commit_window_blocks) {
    if (settings_.protocol_fee_bps > 0) {
        configure_protocol_fee(settings_.treasury.value_or(Address{}), settings_.protocol_fee_bps);
    }
}

// Pool lifecycle

PoolId PoolManager::create_pool(const Address& caller,
                                const Address& asset_a,
                                const Address& asset_b,
                                const Address& strategy,
                                uint32_t marking) {
    TransactionScope tx(journal_);

    const PoolId pool = assemble(asset_a, asset_b, strategy, marking);
    if (!strategies_.contains(strategy)) {
        throw ConfigurationError(ErrorCode::UNKNOWN_STRATEGY, "no strategy registered for " + strategy.to_hex());
    }
    if (!inventory_.create(pool)) {
        throw ConfigurationError(ErrorCode::POOL_ALREADY_EXISTS, "pool " + to_string(pool) + " already exists");
    }

    tx.commit();
    spdlog::info("Pool created {} strategy={} by {}", to_string(pool), strategy.short_hex(), caller.short_hex());
    return pool;
}

LiquidityResult PoolManager::add_liquidity(const Address& caller,
                                           const Address& asset_a,
                                           const Address& asset_b,
                                           const Address& strategy,
                                           uint32_t marking,
                                           Amount amount_a,
                                           Amount amount_b) {
    validate_amount(amount_a, "amount_a");
    validate_amount(amount_b, "amount_b");

    TransactionScope tx(journal_);

    const PoolId pool = assemble(asset_a, asset_b, strategy, marking);
    require_pool(pool);
    auto lock = pool_guard_.acquire(pool);

    const bool a_is_asset0 = asset_a < asset_b;
    const Amount amount0 = a_is_asset0 ? amount_a : amount_b;
    const Amount amount1 = a_is_asset0 ? amount_b : amount_a;
    const Address beneficiary = beneficiary_for(caller);

    Amount minted = 0;
    if (inventory_.state(pool)->total_shares == 0) {
        minted = liquidity_math::initial_shares(amount0, amount1, settings_.permanent_lock);
        shares_.mint(pool, Address::native(), settings_.permanent_lock);
        inventory_.set_total_shares(pool, settings_.permanent_lock);
    } else {
        charge_protocol_fee(pool);

        const PoolState& state = *inventory_.state(pool);
        minted = liquidity_math::proportional_shares(amount0,
                                                     amount1,
                                                     state.reserves.reserve0,
                                                     state.reserves.reserve1,
                                                     state.total_shares);
        if (minted == 0) {
            throw LiquidityError(ErrorCode::INSUFFICIENT_LIQUIDITY_MINTED, "deposit too small to mint a share");
        }
    }

    inventory_.apply_delta(pool, to_delta(amount0), to_delta(amount1));
    inventory_.set_total_shares(pool, inventory_.state(pool)->total_shares + minted);
    shares_.mint(pool, beneficiary, minted);
    reset_fee_baseline(pool);

    const PoolKey key = disassemble(pool);
    flash_.add_delta(beneficiary, key.asset0, -to_delta(amount0));
    flash_.add_delta(beneficiary, key.asset1, -to_delta(amount1));
    const std::array<Address, 2> tokens{key.asset0, key.asset1};
    settle_if_idle(beneficiary, tokens);

    tx.commit();
    spdlog::info("Liquidity added to {}: {} / {} -> {} shares for {}",
                 to_string(pool),
                 to_string(amount0),
                 to_string(amount1),
                 to_string(minted),
                 beneficiary.short_hex());
    return LiquidityResult{.pool_id = pool, .shares = minted, .amount0 = amount0, .amount1 = amount1};
}

WithdrawalResult PoolManager::remove_liquidity(const Address& caller,
                                               const Address& asset_a,
                                               const Address& asset_b,
                                               const Address& strategy,
                                               uint32_t marking,
                                               Amount shares) {
    validate_amount(shares, "shares");

    TransactionScope tx(journal_);

    const PoolId pool = assemble(asset_a, asset_b, strategy, marking);
    const PoolState state = require_pool(pool);
    if (state.total_shares == 0) {
        throw LiquidityError(ErrorCode::NO_LIQUIDITY, "pool " + to_string(pool) + " has no liquidity");
    }
    auto lock = pool_guard_.acquire(pool);

    const Address beneficiary = beneficiary_for(caller);
    const auto [amount0, amount1] = liquidity_math::withdrawal_amounts(
        shares, state.reserves.reserve0, state.reserves.reserve1, state.total_shares);
    if (amount0 == 0 && amount1 == 0) {
        throw LiquidityError(ErrorCode::INSUFFICIENT_WITHDRAWAL, to_string(shares) + " shares round to nothing");
    }

    shares_.burn(pool, beneficiary, shares);
    inventory_.set_total_shares(pool, state.total_shares - shares);
    inventory_.apply_delta(pool, -to_delta(amount0), -to_delta(amount1));
    // Uncharged profit stays with the remaining shares until the next deposit
    inventory_.set_fee_baseline(pool, mul_div(state.fee_baseline, state.total_shares - shares, state.total_shares));

    const PoolKey key = disassemble(pool);
    flash_.add_delta(beneficiary, key.asset0, to_delta(amount0));
    flash_.add_delta(beneficiary, key.asset1, to_delta(amount1));
    const std::array<Address, 2> tokens{key.asset0, key.asset1};
    settle_if_idle(beneficiary, tokens);

    tx.commit();
    spdlog::info("Liquidity removed from {}: {} shares -> {} / {} for {}",
                 to_string(pool),
                 to_string(shares),
                 to_string(amount0),
                 to_string(amount1),
                 beneficiary.short_hex());
    return WithdrawalResult{.pool_id = pool, .amount0 = amount0, .amount1 = amount1};
}

// Swaps

SwapResult PoolManager::swap(const Address& caller, const SwapParams& params) {
    return swap_with_protection(caller, params, 0);
}

SwapResult PoolManager::swap_with_protection(const Address& caller,
                                             const SwapParams& params,
                                             uint32_t protection_word) {
    TransactionScope tx(journal_);

    const Address beneficiary = beneficiary_for(caller);
    const PoolId pool = assemble(params.asset_in, params.asset_out, params.strategy, params.marking);
    check_protection(pool, beneficiary, params, TraderProtectionCodec::decode(protection_word));

    BridgeCache cache;
    SwapResult result = execute_swap(beneficiary, params, cache);

    tx.commit();
    return result;
}

Amount PoolManager::batch_swap(const Address& caller,
                               std::span<const BatchHop> hops,
                               Amount amount_in,
                               Amount min_out) {
    if (hops.empty()) {
        throw ConfigurationError(ErrorCode::EMPTY_ROUTE, "batch swap needs at least one hop");
    }
    validate_amount(amount_in, "amount_in");

    TransactionScope tx(journal_);

    const Address beneficiary = beneficiary_for(caller);
    atomic_.check(TraderProtection{}, flash_.is_session_active(beneficiary), env_.block_number());

    BridgeCache cache;
    std::vector<Address> route_tokens;
    std::optional<Address> previous_out;
    Amount current = amount_in;

    for (std::size_t h = 0; h < hops.size(); ++h) {
        const BatchHop& hop = hops[h];
        if (hop.markings.empty() || hop.markings.size() != hop.amounts.size()) {
            throw ConfigurationError(ErrorCode::BUCKET_SPLIT_MISMATCH,
                                     "hop " + std::to_string(h) + " needs one amount per marking");
        }

        // Split the hop input across buckets
        std::vector<Amount> split(hop.markings.size(), 0);
        if (split.size() == 1) {
            split[0] = current;
        } else if (h == 0) {
            Amount sum = 0;
            for (Amount part : hop.amounts) {
                if (part > MAX_AMOUNT - sum) {
                    throw ConfigurationError(ErrorCode::BUCKET_SPLIT_MISMATCH, "bucket amounts overflow");
                }
                sum += part;
            }
            if (sum != amount_in) {
                throw ConfigurationError(ErrorCode::BUCKET_SPLIT_MISMATCH,
                                         "bucket amounts sum to " + to_string(sum) + ", route input is " +
                                             to_string(amount_in));
            }
            split.assign(hop.amounts.begin(), hop.amounts.end());
        } else {
            Amount weight_total = 0;
            for (Amount weight : hop.amounts) {
                if (weight > MAX_AMOUNT - weight_total) {
                    throw ConfigurationError(ErrorCode::BUCKET_SPLIT_MISMATCH, "bucket weights overflow");
                }
                weight_total += weight;
            }
            if (weight_total == 0) {
                throw ConfigurationError(ErrorCode::BUCKET_SPLIT_MISMATCH,
                                         "hop " + std::to_string(h) + " has zero bucket weights");
            }
            Amount assigned = 0;
            for (std::size_t b = 0; b + 1 < split.size(); ++b) {
                split[b] = mul_div(current, hop.amounts[b], weight_total);
                assigned += split[b];
            }
            split.back() = current - assigned;
        }

        // Resolve the bucket pools and price them together
        std::vector<PoolGuard::Lock> locks;
        std::vector<PoolId> pools;
        std::vector<QuoteParams> quotes;
        locks.reserve(split.size());
        PoolKey key;
        for (std::size_t b = 0; b < split.size(); ++b) {
            if (split[b] == 0) {
                continue;
            }
            const PoolId pool = assemble(hop.asset0, hop.asset1, hop.strategy, hop.markings[b]);
            if (std::find(pools.begin(), pools.end(), pool) != pools.end()) {
                throw ConfigurationError(ErrorCode::BUCKET_SPLIT_MISMATCH,
                                         "hop " + std::to_string(h) + " repeats pool " + to_string(pool));
            }
            const PoolState state = require_pool(pool);
            if (state.total_shares == 0) {
                throw LiquidityError(ErrorCode::NO_LIQUIDITY, "pool " + to_string(pool) + " has no liquidity");
            }
            check_protection(pool,
                             beneficiary,
                             SwapParams{.asset_in = hop.asset0,
                                        .asset_out = hop.asset1,
                                        .strategy = hop.strategy,
                                        .marking = hop.markings[b],
                                        .amount_in = split[b],
                                        .zero_for_one = hop.zero_for_one},
                             TraderProtection{});
            locks.push_back(pool_guard_.acquire(pool));
            pools.push_back(pool);

            key = disassemble(pool);
            quotes.push_back(QuoteParams{.asset0 = key.asset0,
                                         .asset1 = key.asset1,
                                         .strategy = key.strategy,
                                         .marking = key.marking,
                                         .amount_in = split[b],
                                         .zero_for_one = hop.zero_for_one,
                                         .reserve0 = state.reserves.reserve0,
                                         .reserve1 = state.reserves.reserve1,
                                         .session_active = flash_.is_session_active(beneficiary)});
        }
        if (quotes.empty()) {
            throw ConfigurationError(ErrorCode::INVALID_AMOUNT, "hop " + std::to_string(h) + " receives nothing");
        }

        const Address token_in = hop.zero_for_one ? key.asset0 : key.asset1;
        const Address token_out = hop.zero_for_one ? key.asset1 : key.asset0;
        if (previous_out && *previous_out != token_in) {
            throw ConfigurationError(ErrorCode::MALFORMED_ASSETS,
                                     "hop " + std::to_string(h) + " does not start from the previous output");
        }

        const std::vector<QuoteResult> results = router_.get_quote_batch(quotes, cache);

        Amount hop_out = 0;
        for (std::size_t q = 0; q < quotes.size(); ++q) {
            const Amount out = results[q].amount_out;
            if (out == 0) {
                throw QuoteUnavailable("no price for bucket pool " + to_string(pools[q]));
            }
            if (out >= quotes[q].reserve_out() || out > MAX_AMOUNT) {
                throw LiquidityError(ErrorCode::INSUFFICIENT_RESERVES,
                                     "quote " + to_string(out) + " drains pool " + to_string(pools[q]));
            }
            const Delta in = to_delta(quotes[q].amount_in);
            inventory_.apply_delta(pools[q],
                                   hop.zero_for_one ? in : -to_delta(out),
                                   hop.zero_for_one ? -to_delta(out) : in);
            hop_out += out;
        }

        flash_.add_delta(beneficiary, token_in, -to_delta(current));
        flash_.add_delta(beneficiary, token_out, to_delta(hop_out));
        for (const Address& token : {token_in, token_out}) {
            if (std::find(route_tokens.begin(), route_tokens.end(), token) == route_tokens.end()) {
                route_tokens.push_back(token);
            }
        }

        spdlog::debug("Batch hop {}: {} buckets, {} -> {}", h, quotes.size(), to_string(current), to_string(hop_out));
        previous_out = token_out;
        current = hop_out;
    }

    if (current < min_out) {
        throw SlippageViolation("route output " + to_string(current) + " below minimum " + to_string(min_out));
    }

    settle_if_idle(beneficiary, route_tokens);

    tx.commit();
    spdlog::debug("Batch swap for {}: {} hops, {} -> {}, {} bridge fetches",
                  beneficiary.short_hex(),
                  hops.size(),
                  to_string(amount_in),
                  to_string(current),
                  cache.fetch_count());
    return current;
}

// Flash sessions

void PoolManager::flash_session(const Address& caller,
                                FlashCallback& callback,
                                std::span<const uint8_t> data,
                                std::span<const Address> token_scope,
                                Amount native_value) {
    if (native_value > MAX_AMOUNT) {
        throw ConfigurationError(ErrorCode::AMOUNT_OUT_OF_RANGE, "native value exceeds 2^127 - 1");
    }

    TransactionScope tx(journal_);

    auto lock = owner_guard_.acquire(caller);
    flash_.start_session(caller);

    if (native_value > 0) {
        transfer_in(Address::native(), caller, native_value);
    }

    flash_.set_active_user(caller);
    callback.on_flash(*this, caller, data);
    flash_.clear_active_user();

    flash_.settle(caller, token_scope, native_value, [this, &caller](const Address& token, Delta delta) {
        if (delta > 0) {
            transfer_out(token, caller, magnitude(delta));
        } else {
            transfer_in(token, caller, magnitude(delta));
        }
    });

    if (flash_.has_residual(caller)) {
        std::string residual;
        for (const Address& token : flash_.residual_tokens(caller)) {
            residual += (residual.empty() ? "" : ", ") + token.short_hex() + "=" +
                        to_string(flash_.get_delta(caller, token));
        }
        throw SessionError(ErrorCode::UNSETTLED_DELTAS, "tokens outside settlement scope: " + residual);
    }

    flash_.end_session(caller);
    tx.commit();
}

// Commit-reveal

void PoolManager::commit(const Address& caller, const Hash256& commitment) {
    TransactionScope tx(journal_);
    commit_reveal_.commit(caller, commitment, env_.block_number());
    tx.commit();
}

SwapResult PoolManager::reveal_committed(const Address& caller,
                                         const SwapParams& params,
                                         uint64_t nonce,
                                         const Hash256& salt) {
    TransactionScope tx(journal_);

    const Hash256 revealed = CommitReveal::compute_commitment(params, nonce, caller, salt);
    commit_reveal_.reveal(caller, revealed, nonce, env_.block_number());

    SwapResult result = swap(caller, params);

    tx.commit();
    return result;
}

// Views and administration

Amount PoolManager::preview_quote(const SwapParams& params) const {
    const PoolId pool = assemble(params.asset_in, params.asset_out, params.strategy, params.marking);
    const PoolState* state = inventory_.state(pool);
    if (state == nullptr || state->total_shares == 0 || params.amount_in == 0) {
        return 0;
    }

    const PoolKey key = disassemble(pool);
    BridgeCache cache;
    return router_
        .get_quote(QuoteParams{.asset0 = key.asset0,
                               .asset1 = key.asset1,
                               .strategy = key.strategy,
                               .marking = key.marking,
                               .amount_in = params.amount_in,
                               .zero_for_one = params.zero_for_one,
                               .reserve0 = state->reserves.reserve0,
                               .reserve1 = state->reserves.reserve1},
                   cache)
        .amount_out;
}

void PoolManager::configure_protocol_fee(const Address& treasury, uint32_t fee_bps) {
    if (fee_bps > liquidity_math::BPS_DENOMINATOR) {
        throw ConfigurationError(ErrorCode::INVALID_FEE, "protocol fee " + std::to_string(fee_bps) + " bps > 10000");
    }
    if (fee_bps > 0 && treasury.is_zero()) {
        throw ConfigurationError(ErrorCode::INVALID_FEE, "protocol fee needs a non-zero treasury");
    }

    settings_.protocol_fee_bps = fee_bps;
    settings_.treasury = treasury;
    spdlog::info("Protocol fee set to {} bps, treasury {}", fee_bps, treasury.short_hex());
}

void PoolManager::set_pool_protection(const PoolId& pool, const PoolProtectionFlags& flags) {
    require_pool(pool);
    pool_protection_[pool] = flags;
    spdlog::info("Pool protection on {}: access={} circuit={} volume={}",
                 to_string(pool),
                 flags.access_control,
                 flags.circuit_breaker,
                 flags.volume_control);
}

// Internals

Address PoolManager::beneficiary_for(const Address& caller) const {
    return flash_.get_active_user().value_or(caller);
}

const PoolState& PoolManager::require_pool(const PoolId& pool) const {
    const PoolState* state = inventory_.state(pool);
    if (state == nullptr) {
        throw ConfigurationError(ErrorCode::POOL_NOT_FOUND, "no pool " + to_string(pool));
    }
    return *state;
}

void PoolManager::check_protection(const PoolId& pool,
                                   const Address& beneficiary,
                                   const SwapParams& params,
                                   const TraderProtection& flags) const {
    const uint64_t block = env_.block_number();
    atomic_.check(flags, flash_.is_session_active(beneficiary), block);

    auto it = pool_protection_.find(pool);
    if (it == pool_protection_.end() || !it->second.any()) {
        return;
    }

    PolicyRequest request{.pool = pool,
                          .trader = beneficiary,
                          .amount_in = params.amount_in,
                          .zero_for_one = params.zero_for_one,
                          .mode = 0,
                          .block = block};
    if (auto mode = AccessControl::engaged(it->second, flags)) {
        request.mode = *mode;
        access_.enforce(request);
    }
    if (auto mode = CircuitBreaker::engaged(it->second, flags)) {
        request.mode = *mode;
        circuit_.enforce(request);
    }
    if (auto mode = VolumeControl::engaged(it->second, flags)) {
        request.mode = *mode;
        volume_.enforce(request);
    }
}

SwapResult PoolManager::execute_swap(const Address& beneficiary, const SwapParams& params, BridgeCache& cache) {
    validate_amount(params.amount_in, "amount_in");

    const PoolId pool = assemble(params.asset_in, params.asset_out, params.strategy, params.marking);
    const PoolState state = require_pool(pool);
    if (state.total_shares == 0) {
        throw LiquidityError(ErrorCode::NO_LIQUIDITY, "pool " + to_string(pool) + " has no liquidity");
    }
    auto lock = pool_guard_.acquire(pool);

    const PoolKey key = disassemble(pool);
    const Address token_in = params.zero_for_one ? key.asset0 : key.asset1;
    const Address token_out = params.zero_for_one ? key.asset1 : key.asset0;

    const QuoteParams quote_params{.asset0 = key.asset0,
                                   .asset1 = key.asset1,
                                   .strategy = key.strategy,
                                   .marking = key.marking,
                                   .amount_in = params.amount_in,
                                   .zero_for_one = params.zero_for_one,
                                   .reserve0 = state.reserves.reserve0,
                                   .reserve1 = state.reserves.reserve1,
                                   .session_active = flash_.is_session_active(beneficiary)};
    const Amount amount_out = router_.get_quote(quote_params, cache).amount_out;

    if (amount_out == 0) {
        throw QuoteUnavailable("no price for pool " + to_string(pool));
    }
    if (amount_out >= quote_params.reserve_out() || amount_out > MAX_AMOUNT) {
        throw LiquidityError(ErrorCode::INSUFFICIENT_RESERVES,
                             "quote " + to_string(amount_out) + " drains pool " + to_string(pool));
    }
    if (amount_out < params.min_out) {
        throw SlippageViolation("output " + to_string(amount_out) + " below minimum " + to_string(params.min_out));
    }

    const Delta in = to_delta(params.amount_in);
    const Delta out = to_delta(amount_out);
    inventory_.apply_delta(pool, params.zero_for_one ? in : -out, params.zero_for_one ? -out : in);

    flash_.add_delta(beneficiary, token_in, -in);
    flash_.add_delta(beneficiary, token_out, out);
    const std::array<Address, 2> tokens{token_in, token_out};
    settle_if_idle(beneficiary, tokens);

    spdlog::debug("Swap on {}: {} {} -> {} {} for {}",
                  to_string(pool),
                  to_string(params.amount_in),
                  token_in.short_hex(),
                  to_string(amount_out),
                  token_out.short_hex(),
                  beneficiary.short_hex());
    return SwapResult{.pool_id = pool, .beneficiary = beneficiary, .amount_in = params.amount_in, .amount_out = amount_out};
}

void PoolManager::charge_protocol_fee(const PoolId& pool) {
    if (settings_.protocol_fee_bps == 0 || !settings_.treasury) {
        return;
    }

    const PoolState state = require_pool(pool);
    const Amount reserve0 = state.reserves.reserve0;
    const Amount reserve1 = state.reserves.reserve1;
    const Amount value = liquidity_math::pool_value_in_asset0(
        reserve0, reserve1, liquidity_math::inventory_rate(reserve0, reserve1));
    const Amount fee_value = liquidity_math::protocol_fee(value, state.fee_baseline, settings_.protocol_fee_bps);
    if (fee_value == 0) {
        return;
    }

    const Amount fee0 = mul_div(reserve0, fee_value, value);
    const Amount fee1 = mul_div(reserve1, fee_value, value);
    if (fee0 == 0 && fee1 == 0) {
        return;
    }

    inventory_.apply_delta(pool, -to_delta(fee0), -to_delta(fee1));
    const PoolKey key = disassemble(pool);
    vault_transfer(key.asset0, custody_, *settings_.treasury, fee0);
    vault_transfer(key.asset1, custody_, *settings_.treasury, fee1);

    spdlog::info("Protocol fee on {}: profit {} -> {} / {} to {}",
                 to_string(pool),
                 to_string(value - state.fee_baseline),
                 to_string(fee0),
                 to_string(fee1),
                 settings_.treasury->short_hex());
}

void PoolManager::reset_fee_baseline(const PoolId& pool) {
    const PackedReserves reserves = inventory_.get_inventory(pool);
    inventory_.set_fee_baseline(pool,
                                liquidity_math::pool_value_in_asset0(
                                    reserves.reserve0,
                                    reserves.reserve1,
                                    liquidity_math::inventory_rate(reserves.reserve0, reserves.reserve1)));
}

void PoolManager::settle_if_idle(const Address& beneficiary, std::span<const Address> tokens) {
    if (flash_.is_session_active(beneficiary)) {
        return;
    }
    flash_.settle(beneficiary, tokens, 0, [this, &beneficiary](const Address& token, Delta delta) {
        if (delta > 0) {
            transfer_out(token, beneficiary, magnitude(delta));
        } else {
            transfer_in(token, beneficiary, magnitude(delta));
        }
    });
}

void PoolManager::transfer_out(const Address& token, const Address& to, Amount amount) {
    vault_transfer(token, custody_, to, amount);
}

void PoolManager::transfer_in(const Address& token, const Address& from, Amount amount) {
    vault_transfer(token, from, custody_, amount);
}

void PoolManager::vault_transfer(const Address& token, const Address& from, const Address& to, Amount amount) {
    if (amount == 0) {
        return;
    }
    vault_.transfer(token, from, to, amount);
    journal_.record([this, token, from, to, amount] { vault_.transfer(token, to, from, amount); });
}

}  // namespace flash_amm::engine
