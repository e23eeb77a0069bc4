#pragma once

#include <cstddef>

#include <boost/container_hash/hash.hpp>
#include <boost/unordered/unordered_flat_map.hpp>

#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/errors.hpp"
#include "core/journal.hpp"
#include "core/pool_id.hpp"

namespace flash_amm::accounting {

using namespace flash_amm::core;

/**
 * @brief Liquidity-share balances per (pool, holder)
 *
 * The permanent lock of every pool is minted to the zero address, which
 * never burns.
 */
class ShareRegistry {
  public:
    struct Key {
        PoolId pool;
        Address holder;

        [[nodiscard]] bool operator==(const Key&) const noexcept = default;
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            std::size_t seed = PoolIdHash{}(key.pool);
            boost::hash_combine(seed, AddressHash{}(key.holder));
            return seed;
        }
    };

    explicit ShareRegistry(Journal& journal) : journal_(journal) {}

    ShareRegistry(const ShareRegistry&) = delete;
    ShareRegistry& operator=(const ShareRegistry&) = delete;

    [[nodiscard]] Amount balance_of(const PoolId& pool, const Address& holder) const {
        auto it = balances_.find(Key{pool, holder});
        return it != balances_.end() ? it->second : 0;
    }

    void mint(const PoolId& pool, const Address& holder, Amount shares) {
        set(Key{pool, holder}, balance_of(pool, holder) + shares);
    }

    /**
     * @throws LiquidityError INSUFFICIENT_SHARES if @p holder owns fewer than @p shares
     */
    void burn(const PoolId& pool, const Address& holder, Amount shares) {
        const Amount balance = balance_of(pool, holder);
        if (shares > balance) {
            throw LiquidityError(ErrorCode::INSUFFICIENT_SHARES,
                                 holder.short_hex() + " holds " + to_string(balance) + " shares, burning " +
                                     to_string(shares));
        }
        set(Key{pool, holder}, balance - shares);
    }

  private:
    void set(const Key& key, Amount value) {
        auto it = balances_.find(key);
        const bool existed = it != balances_.end();
        const Amount previous = existed ? it->second : 0;

        if (value == 0) {
            balances_.erase(key);
        } else {
            balances_[key] = value;
        }

        journal_.record([this, key, existed, previous] {
            if (existed) {
                balances_[key] = previous;
            } else {
                balances_.erase(key);
            }
        });
    }

    Journal& journal_;
    boost::unordered_flat_map<Key, Amount, KeyHash> balances_;
};

}  // namespace flash_amm::accounting
