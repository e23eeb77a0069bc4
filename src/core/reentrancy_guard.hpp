#pragma once

#include <string>
#include <utility>

#include <boost/unordered/unordered_flat_set.hpp>

#include "core/errors.hpp"

namespace flash_amm::core {

/**
 * @brief Reentrancy lock keyed per logical resource
 *
 * A pool id or a session owner is held while the engine mutates it and
 * calls out to untrusted code. Re-entering the same key throws; different
 * keys stay independent, which is what lets a flash-session callback swap
 * on pools while the owner key is held.
 *
 * WARNING: Not thread-safe - caller must provide external synchronization
 */
template <typename Key, typename Hash>
class ReentrancyGuard {
  public:
    using SetType = boost::unordered_flat_set<Key, Hash>;

    class Lock {
      public:
        Lock(ReentrancyGuard& guard, Key key) : guard_(&guard), key_(std::move(key)) {}

        ~Lock() {
            if (guard_ != nullptr) {
                guard_->held_.erase(key_);
            }
        }

        Lock(Lock&& other) noexcept : guard_(std::exchange(other.guard_, nullptr)), key_(std::move(other.key_)) {}

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        Lock& operator=(Lock&&) = delete;

      private:
        ReentrancyGuard* guard_;
        Key key_;
    };

    explicit ReentrancyGuard(std::string resource_name) : resource_name_(std::move(resource_name)) {}

    /**
     * @brief Hold @p key until the returned Lock is destroyed
     * @throws ReentrancyViolation if the key is already held
     */
    [[nodiscard]] Lock acquire(const Key& key) {
        if (!held_.insert(key).second) {
            throw ReentrancyViolation("reentrant call on locked " + resource_name_);
        }
        return Lock(*this, key);
    }

    [[nodiscard]] bool is_held(const Key& key) const {
        return held_.contains(key);
    }

    [[nodiscard]] std::size_t held_count() const noexcept {
        return held_.size();
    }

  private:
    std::string resource_name_;
    SetType held_;
};

}  // namespace flash_amm::core
