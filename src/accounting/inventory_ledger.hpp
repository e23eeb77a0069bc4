#pragma once

#include <cstddef>

#include <boost/unordered/unordered_flat_map.hpp>

#include "core/amount.hpp"
#include "core/errors.hpp"
#include "core/journal.hpp"
#include "core/pool_id.hpp"

namespace flash_amm::accounting {

using namespace flash_amm::core;

/**
 * @brief Both reserves of a pool in one 32-byte slot
 *
 * The two magnitudes are a single logical unit: read together, written
 * together, never updated one at a time.
 */
struct alignas(32) PackedReserves {
    Amount reserve0{0};
    Amount reserve1{0};

    [[nodiscard]] constexpr bool empty() const noexcept {
        return reserve0 == 0 && reserve1 == 0;
    }

    [[nodiscard]] constexpr bool operator==(const PackedReserves&) const noexcept = default;
};

static_assert(sizeof(PackedReserves) == 32, "PackedReserves must occupy exactly one 32-byte slot");

/**
 * @brief Ledger entry of one pool
 *
 * total_shares == 0 iff reserves are empty. fee_baseline is the pool value
 * in asset0 terms at the last liquidity event, used for protocol fees.
 */
struct PoolState {
    PackedReserves reserves;
    Amount total_shares{0};
    Amount fee_baseline{0};
};

/**
 * @brief Per-pool reserve and share-supply store
 *
 * Records only: callers validate sufficiency before apply_delta. A delta
 * that would drive a reserve negative or past 128 bits is an internal
 * invariant breach and fails with INVENTORY_UNDERFLOW.
 *
 * Every mutation is journaled so an enclosing TransactionScope can undo it.
 *
 * WARNING: Not thread-safe - caller must provide external synchronization
 */
class InventoryLedger {
  public:
    using MapType = boost::unordered_flat_map<PoolId, PoolState, PoolIdHash>;

    explicit InventoryLedger(Journal& journal, std::size_t initial_capacity = 64) : journal_(journal) {
        pools_.reserve(initial_capacity);
    }

    InventoryLedger(const InventoryLedger&) = delete;
    InventoryLedger& operator=(const InventoryLedger&) = delete;

    // Register an empty pool; false if it already exists
    [[nodiscard]] bool create(const PoolId& pool) {
        auto [it, inserted] = pools_.try_emplace(pool);
        if (inserted) {
            journal_.record([this, pool] { pools_.erase(pool); });
        }
        return inserted;
    }

    [[nodiscard]] bool contains(const PoolId& pool) const {
        return pools_.contains(pool);
    }

    [[nodiscard]] const PoolState* state(const PoolId& pool) const {
        auto it = pools_.find(pool);
        return it != pools_.end() ? &it->second : nullptr;
    }

    // Reserves of @p pool, zero for an unknown pool
    [[nodiscard]] PackedReserves get_inventory(const PoolId& pool) const {
        auto it = pools_.find(pool);
        return it != pools_.end() ? it->second.reserves : PackedReserves{};
    }

    /**
     * @brief Apply signed deltas to both reserves in canonical order
     * @throws ConfigurationError POOL_NOT_FOUND for an unknown pool
     * @throws LiquidityError INVENTORY_UNDERFLOW if a reserve would leave [0, 2^128)
     */
    void apply_delta(const PoolId& pool, Delta delta0, Delta delta1) {
        PoolState& entry = lookup(pool);

        PackedReserves next;
        if (!apply_signed(entry.reserves.reserve0, delta0, next.reserve0) ||
            !apply_signed(entry.reserves.reserve1, delta1, next.reserve1)) {
            throw LiquidityError(ErrorCode::INVENTORY_UNDERFLOW,
                                 "reserve delta out of range on pool " + to_string(pool));
        }

        const PackedReserves previous = entry.reserves;
        entry.reserves = next;
        journal_.record([this, pool, previous] { pools_[pool].reserves = previous; });
    }

    void set_total_shares(const PoolId& pool, Amount shares) {
        PoolState& entry = lookup(pool);
        const Amount previous = entry.total_shares;
        entry.total_shares = shares;
        journal_.record([this, pool, previous] { pools_[pool].total_shares = previous; });
    }

    void set_fee_baseline(const PoolId& pool, Amount baseline) {
        PoolState& entry = lookup(pool);
        const Amount previous = entry.fee_baseline;
        entry.fee_baseline = baseline;
        journal_.record([this, pool, previous] { pools_[pool].fee_baseline = previous; });
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return pools_.size();
    }

  private:
    PoolState& lookup(const PoolId& pool) {
        auto it = pools_.find(pool);
        if (it == pools_.end()) {
            throw ConfigurationError(ErrorCode::POOL_NOT_FOUND, "no pool " + to_string(pool));
        }
        return it->second;
    }

    static bool apply_signed(Amount value, Delta delta, Amount& out) noexcept {
        if (delta >= 0) {
            const auto add = static_cast<Amount>(delta);
            if (value > MAX_UINT128 - add)
                return false;
            out = value + add;
        } else {
            const Amount sub = magnitude(delta);
            if (sub > value)
                return false;
            out = value - sub;
        }
        return true;
    }

    Journal& journal_;
    MapType pools_;
};

}  // namespace flash_amm::accounting
