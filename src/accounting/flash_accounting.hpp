#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include <boost/container_hash/hash.hpp>
#include <boost/unordered/unordered_flat_map.hpp>
#include <boost/unordered/unordered_flat_set.hpp>
#include <spdlog/spdlog.h>

#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/errors.hpp"
#include "core/journal.hpp"

namespace flash_amm::accounting {

using namespace flash_amm::core;

/**
 * @brief Transient per-owner delta ledger with deferred settlement
 *
 * Sign convention: a positive delta is owed TO the user by the engine, a
 * negative delta is owed BY the user. While a session is active for a
 * user, swaps and liquidity events only accumulate here; settle() turns
 * the net per-token delta into one transfer.
 *
 * Active users form a stack so a flash callback can drive operations on
 * behalf of a different owner and restore the outer one on return.
 *
 * WARNING: Not thread-safe - caller must provide external synchronization
 */
class FlashAccounting {
  public:
    // Receives (token, net delta) for every non-zero delta being settled
    using SettlementSink = std::function<void(const Address& token, Delta delta)>;

    explicit FlashAccounting(Journal& journal) : journal_(journal) {}

    FlashAccounting(const FlashAccounting&) = delete;
    FlashAccounting& operator=(const FlashAccounting&) = delete;

    /**
     * @throws SessionError SESSION_ALREADY_ACTIVE if @p owner already has a session
     */
    void start_session(const Address& owner) {
        if (!sessions_.insert(owner).second) {
            throw SessionError(ErrorCode::SESSION_ALREADY_ACTIVE, "session already active for " + owner.short_hex());
        }
        journal_.record([this, owner] { sessions_.erase(owner); });
        spdlog::debug("Session started for {}", owner.short_hex());
    }

    /**
     * @brief Close the session of @p owner and drop its (settled) bookkeeping
     * @throws SessionError NO_ACTIVE_SESSION if @p owner has no session
     */
    void end_session(const Address& owner) {
        if (sessions_.erase(owner) == 0) {
            throw SessionError(ErrorCode::NO_ACTIVE_SESSION, "no active session for " + owner.short_hex());
        }
        journal_.record([this, owner] { sessions_.insert(owner); });
        spdlog::debug("Session ended for {}", owner.short_hex());
    }

    [[nodiscard]] bool is_session_active(const Address& user) const {
        return sessions_.contains(user);
    }

    void set_active_user(const Address& user) {
        active_users_.push_back(user);
        journal_.record([this] { active_users_.pop_back(); });
    }

    // Top of the active-user stack, or std::nullopt outside any callback
    [[nodiscard]] std::optional<Address> get_active_user() const {
        if (active_users_.empty()) {
            return std::nullopt;
        }
        return active_users_.back();
    }

    void clear_active_user() {
        if (active_users_.empty()) {
            return;
        }
        const Address previous = active_users_.back();
        active_users_.pop_back();
        journal_.record([this, previous] { active_users_.push_back(previous); });
    }

    /**
     * @brief Accumulate @p amount into the (user, token) delta
     * @throws ConfigurationError AMOUNT_OUT_OF_RANGE if the running delta overflows
     */
    void add_delta(const Address& user, const Address& token, Delta amount) {
        if (amount == 0) {
            return;
        }

        const Key key{user, token};
        auto it = deltas_.find(key);
        const bool existed = it != deltas_.end();
        const Delta previous = existed ? it->second : 0;

        Delta next = 0;
        if (__builtin_add_overflow(previous, amount, &next)) {
            throw ConfigurationError(ErrorCode::AMOUNT_OUT_OF_RANGE,
                                     "delta overflow for " + user.short_hex() + " on " + token.short_hex());
        }

        // A delta that returns to zero is dropped along with its touched entry
        if (next == 0) {
            deltas_.erase(it);
        } else {
            deltas_[key] = next;
        }
        journal_.record([this, key, existed, previous] {
            if (existed) {
                deltas_[key] = previous;
            } else {
                deltas_.erase(key);
            }
        });

        if (next == 0) {
            untouch(user, token);
        } else if (!existed) {
            touch(user, token);
        }
    }

    [[nodiscard]] Delta get_delta(const Address& user, const Address& token) const {
        auto it = deltas_.find(Key{user, token});
        return it != deltas_.end() ? it->second : 0;
    }

    [[nodiscard]] std::vector<Delta> get_deltas(const Address& user, std::span<const Address> tokens) const {
        std::vector<Delta> out;
        out.reserve(tokens.size());
        for (const auto& token : tokens) {
            out.push_back(get_delta(user, token));
        }
        return out;
    }

    // Tokens of @p user with an open delta, in first-touch order
    [[nodiscard]] std::vector<Address> touched_tokens(const Address& user) const {
        auto it = touched_.find(user);
        return it != touched_.end() ? it->second : std::vector<Address>{};
    }

    /**
     * @brief Pay out the listed tokens of @p user
     *
     * @p native_supplied (value the user already sent with the call) is first
     * credited to the native-asset delta. Each listed token with a non-zero
     * delta is zeroed and then handed to @p sink. A second settle of the same
     * tokens finds only zeros and does nothing.
     */
    void settle(const Address& user,
                std::span<const Address> tokens,
                Amount native_supplied,
                const SettlementSink& sink) {
        if (native_supplied > 0) {
            add_delta(user, Address::native(), to_delta(native_supplied));
        }

        for (const auto& token : tokens) {
            const Delta delta = get_delta(user, token);
            if (delta == 0) {
                continue;
            }
            add_delta(user, token, -delta);
            sink(token, delta);
        }
    }

    // True if @p user still carries a non-zero delta on any token
    [[nodiscard]] bool has_residual(const Address& user) const {
        return touched_.contains(user);
    }

    // Tokens of @p user with a non-zero delta
    [[nodiscard]] std::vector<Address> residual_tokens(const Address& user) const {
        return touched_tokens(user);
    }

    // Number of (user, token) pairs with an open delta
    [[nodiscard]] std::size_t open_delta_count() const noexcept {
        return deltas_.size();
    }

  private:
    struct Key {
        Address user;
        Address token;

        [[nodiscard]] bool operator==(const Key&) const noexcept = default;
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            std::size_t seed = AddressHash{}(key.user);
            boost::hash_combine(seed, AddressHash{}(key.token));
            return seed;
        }
    };

    void touch(const Address& user, const Address& token) {
        auto& tokens = touched_[user];
        if (std::find(tokens.begin(), tokens.end(), token) != tokens.end()) {
            return;
        }
        tokens.push_back(token);
        journal_.record([this, user] {
            auto it = touched_.find(user);
            if (it != touched_.end()) {
                it->second.pop_back();
                if (it->second.empty()) {
                    touched_.erase(it);
                }
            }
        });
    }

    void untouch(const Address& user, const Address& token) {
        auto it = touched_.find(user);
        if (it == touched_.end()) {
            return;
        }
        auto& tokens = it->second;
        auto pos = std::find(tokens.begin(), tokens.end(), token);
        if (pos == tokens.end()) {
            return;
        }
        const auto index = static_cast<std::size_t>(pos - tokens.begin());
        tokens.erase(pos);
        if (tokens.empty()) {
            touched_.erase(it);
        }
        journal_.record([this, user, token, index] {
            auto& restored = touched_[user];
            restored.insert(restored.begin() + static_cast<std::ptrdiff_t>(index), token);
        });
    }

    Journal& journal_;
    boost::unordered_flat_set<Address, AddressHash> sessions_;
    std::vector<Address> active_users_;
    boost::unordered_flat_map<Key, Delta, KeyHash> deltas_;
    boost::unordered_flat_map<Address, std::vector<Address>, AddressHash> touched_;
};

}  // namespace flash_amm::accounting
