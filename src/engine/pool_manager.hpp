#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <boost/unordered/unordered_flat_map.hpp>

#include "accounting/asset_vault.hpp"
#include "accounting/flash_accounting.hpp"
#include "accounting/inventory_ledger.hpp"
#include "accounting/share_registry.hpp"
#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/configuration.hpp"
#include "core/environment.hpp"
#include "core/journal.hpp"
#include "core/pool_id.hpp"
#include "core/reentrancy_guard.hpp"
#include "core/swap_params.hpp"
#include "engine/flash_callback.hpp"
#include "protection/access_control.hpp"
#include "protection/atomic_execution.hpp"
#include "protection/circuit_breaker.hpp"
#include "protection/commit_reveal.hpp"
#include "protection/trader_protection.hpp"
#include "protection/volume_control.hpp"
#include "quoting/bridge_registry.hpp"
#include "quoting/quote_router.hpp"
#include "quoting/strategy_registry.hpp"

namespace flash_amm::engine {

using namespace flash_amm::core;
using namespace flash_amm::accounting;
using namespace flash_amm::quoting;
using namespace flash_amm::protection;

struct EngineSettings {
    Amount permanent_lock{1000};
    uint64_t commit_window_blocks{CommitReveal::DEFAULT_MAX_WINDOW};
    uint32_t protocol_fee_bps{0};
    std::optional<Address> treasury;

    [[nodiscard]] static EngineSettings from(const Configuration& config) {
        return EngineSettings{.permanent_lock = config.get_liquidity().permanent_lock,
                              .commit_window_blocks = config.get_commit_reveal().max_window_blocks,
                              .protocol_fee_bps = config.get_liquidity().protocol_fee_bps,
                              .treasury = config.get_liquidity().treasury};
    }
};

struct LiquidityResult {
    PoolId pool_id;
    Amount shares{0};
    Amount amount0{0};
    Amount amount1{0};
};

struct WithdrawalResult {
    PoolId pool_id;
    Amount amount0{0};
    Amount amount1{0};
};

struct SwapResult {
    PoolId pool_id;
    Address beneficiary;
    Amount amount_in{0};
    Amount amount_out{0};
};

/**
 * @brief One hop of a batch swap
 *
 * Every marking is a bucket of the same pair and strategy. On the first hop
 * amounts are absolute and must sum to the route input; on later hops they
 * are weights over the previous hop's output. A single-bucket hop always
 * takes its whole input.
 */
struct BatchHop {
    Address asset0;
    Address asset1;
    Address strategy;
    std::vector<uint32_t> markings;
    std::vector<Amount> amounts;
    bool zero_for_one{true};
};

/**
 * @brief Orchestrates pools, sessions, quoting and protection
 *
 * Every mutating entry point runs inside a TransactionScope: on any
 * exception the ledger, shares, deltas, commitments and vault transfers of
 * that call are undone before the exception leaves. Calls made from inside
 * a flash callback nest into the session's scope.
 *
 * Pool state is locked per pool id while a pool is priced and updated, and
 * a session owner is locked for the duration of its flash session.
 *
 * WARNING: Not thread-safe. One manager per execution context.
 */
class PoolManager {
  public:
    PoolManager(const EngineSettings& settings,
                ExecutionEnvironment& env,
                AssetVault& vault,
                const BridgeRegistry& bridges,
                const StrategyRegistry& strategies,
                const Address& custody);

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;
    PoolManager(PoolManager&&) = delete;
    PoolManager& operator=(PoolManager&&) = delete;

    /**
     * @brief Register an empty pool
     * @throws ConfigurationError MALFORMED_ASSETS, UNKNOWN_STRATEGY or POOL_ALREADY_EXISTS
     */
    PoolId create_pool(const Address& caller,
                       const Address& asset_a,
                       const Address& asset_b,
                       const Address& strategy,
                       uint32_t marking);

    /**
     * @brief Deposit both assets and mint shares
     *
     * Empty pool: sqrt(a * b) - permanent_lock shares, the lock minted to the
     * zero address. Otherwise the proportional minimum against current
     * reserves, after any protocol fee on accumulated profit.
     */
    LiquidityResult add_liquidity(const Address& caller,
                                  const Address& asset_a,
                                  const Address& asset_b,
                                  const Address& strategy,
                                  uint32_t marking,
                                  Amount amount_a,
                                  Amount amount_b);

    WithdrawalResult remove_liquidity(const Address& caller,
                                      const Address& asset_a,
                                      const Address& asset_b,
                                      const Address& strategy,
                                      uint32_t marking,
                                      Amount shares);

    SwapResult swap(const Address& caller, const SwapParams& params);

    /**
     * @brief Swap gated by the per-call trader protection word
     * @see TraderProtectionCodec for the word layout
     */
    SwapResult swap_with_protection(const Address& caller, const SwapParams& params, uint32_t protection_word);

    // Route output; fails SlippageViolation below min_out
    Amount batch_swap(const Address& caller, std::span<const BatchHop> hops, Amount amount_in, Amount min_out);

    /**
     * @brief Run @p callback inside a flash session owned by @p caller
     *
     * Settles every token in @p token_scope afterwards. @p native_value is
     * pulled from the caller up front and credited to the native delta.
     *
     * @throws ReentrancyViolation if @p caller already owns a running session
     * @throws SessionError UNSETTLED_DELTAS if a touched token outside
     *         @p token_scope keeps a non-zero delta
     */
    void flash_session(const Address& caller,
                       FlashCallback& callback,
                       std::span<const uint8_t> data,
                       std::span<const Address> token_scope,
                       Amount native_value = 0);

    void commit(const Address& caller, const Hash256& commitment);

    SwapResult reveal_committed(const Address& caller, const SwapParams& params, uint64_t nonce, const Hash256& salt);

    // Views

    [[nodiscard]] const PoolState* pool_state(const PoolId& pool) const {
        return inventory_.state(pool);
    }

    [[nodiscard]] PackedReserves get_inventory(const PoolId& pool) const {
        return inventory_.get_inventory(pool);
    }

    [[nodiscard]] Amount total_shares(const PoolId& pool) const {
        const PoolState* state = inventory_.state(pool);
        return state != nullptr ? state->total_shares : 0;
    }

    [[nodiscard]] Amount share_balance(const PoolId& pool, const Address& holder) const {
        return shares_.balance_of(pool, holder);
    }

    [[nodiscard]] std::vector<Delta> get_user_deltas(const Address& user, std::span<const Address> tokens) const {
        return flash_.get_deltas(user, tokens);
    }

    [[nodiscard]] uint64_t commit_nonce(const Address& trader) const {
        return commit_reveal_.nonce_of(trader);
    }

    [[nodiscard]] bool is_session_active(const Address& user) const {
        return flash_.is_session_active(user);
    }

    // Quote without executing; 0 when the strategy cannot price
    [[nodiscard]] Amount preview_quote(const SwapParams& params) const;

    // Administration

    /**
     * @throws ConfigurationError INVALID_FEE above 10000 bps or without a treasury
     */
    void configure_protocol_fee(const Address& treasury, uint32_t fee_bps);

    void set_pool_protection(const PoolId& pool, const PoolProtectionFlags& flags);

    [[nodiscard]] AtomicExecution& atomic_execution() noexcept {
        return atomic_;
    }

    [[nodiscard]] AccessControl& access_control() noexcept {
        return access_;
    }

    [[nodiscard]] CircuitBreaker& circuit_breaker() noexcept {
        return circuit_;
    }

    [[nodiscard]] VolumeControl& volume_control() noexcept {
        return volume_;
    }

    [[nodiscard]] const Address& custody() const noexcept {
        return custody_;
    }

  private:
    using PoolGuard = ReentrancyGuard<PoolId, PoolIdHash>;
    using OwnerGuard = ReentrancyGuard<Address, AddressHash>;

    [[nodiscard]] Address beneficiary_for(const Address& caller) const;
    const PoolState& require_pool(const PoolId& pool) const;
    void check_protection(const PoolId& pool,
                          const Address& beneficiary,
                          const SwapParams& params,
                          const TraderProtection& flags) const;

    SwapResult execute_swap(const Address& beneficiary, const SwapParams& params, BridgeCache& cache);
    void charge_protocol_fee(const PoolId& pool);
    void reset_fee_baseline(const PoolId& pool);

    // Settle now unless the beneficiary's session defers it
    void settle_if_idle(const Address& beneficiary, std::span<const Address> tokens);
    void transfer_out(const Address& token, const Address& to, Amount amount);
    void transfer_in(const Address& token, const Address& from, Amount amount);
    void vault_transfer(const Address& token, const Address& from, const Address& to, Amount amount);

    EngineSettings settings_;
    ExecutionEnvironment& env_;
    AssetVault& vault_;
    Address custody_;
    const StrategyRegistry& strategies_;

    Journal journal_;
    InventoryLedger inventory_;
    ShareRegistry shares_;
    FlashAccounting flash_;
    QuoteRouter router_;

    CommitReveal commit_reveal_;
    AtomicExecution atomic_;
    AccessControl access_;
    CircuitBreaker circuit_;
    VolumeControl volume_;
    boost::unordered_flat_map<PoolId, PoolProtectionFlags, PoolIdHash> pool_protection_;

    PoolGuard pool_guard_{"pool"};
    OwnerGuard owner_guard_{"session owner"};
};

}  // namespace flash_amm::engine
