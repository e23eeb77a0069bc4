#pragma once

#include <cstddef>

#include <boost/container_hash/hash.hpp>
#include <boost/unordered/unordered_flat_map.hpp>

#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/errors.hpp"

namespace flash_amm::accounting {

using namespace flash_amm::core;

/**
 * @brief Token custody boundary
 *
 * Standard fungible-token bookkeeping lives outside the engine; this is the
 * one call the engine makes into it. Implementations throw SettlementError
 * when a transfer cannot be made.
 */
class AssetVault {
  public:
    virtual ~AssetVault() = default;

    virtual void transfer(const Address& token, const Address& from, const Address& to, Amount amount) = 0;
};

/**
 * @brief Balance table used by the demo, tests and benchmarks
 */
class InMemoryVault final : public AssetVault {
  public:
    void mint(const Address& holder, const Address& token, Amount amount) {
        balances_[Key{holder, token}] += amount;
    }

    [[nodiscard]] Amount balance_of(const Address& holder, const Address& token) const {
        auto it = balances_.find(Key{holder, token});
        return it != balances_.end() ? it->second : 0;
    }

    /**
     * @throws SettlementError TRANSFER_FAILED if @p from holds less than @p amount
     */
    void transfer(const Address& token, const Address& from, const Address& to, Amount amount) override {
        if (amount == 0 || from == to) {
            return;
        }

        auto& source = balances_[Key{from, token}];
        if (source < amount) {
            throw SettlementError(from.short_hex() + " holds " + to_string(source) + " of " + token.short_hex() +
                                  ", needs " + to_string(amount));
        }
        source -= amount;
        balances_[Key{to, token}] += amount;
        ++transfer_count_;
    }

    [[nodiscard]] std::size_t transfer_count() const noexcept {
        return transfer_count_;
    }

  private:
    struct Key {
        Address holder;
        Address token;

        [[nodiscard]] bool operator==(const Key&) const noexcept = default;
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            std::size_t seed = AddressHash{}(key.holder);
            boost::hash_combine(seed, AddressHash{}(key.token));
            return seed;
        }
    };

    boost::unordered_flat_map<Key, Amount, KeyHash> balances_;
    std::size_t transfer_count_{0};
};

}  // namespace flash_amm::accounting
