#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include <boost/unordered/unordered_flat_map.hpp>

#include "core/address.hpp"
#include "quoting/strategy.hpp"

namespace flash_amm::quoting {

// Strategy handle -> implementation
class StrategyRegistry {
  public:
    using StrategyPtr = std::shared_ptr<const Strategy>;

    StrategyRegistry() = default;

    StrategyRegistry(const StrategyRegistry&) = delete;
    StrategyRegistry& operator=(const StrategyRegistry&) = delete;

    void register_strategy(const Address& handle, StrategyPtr strategy) {
        strategies_[handle] = std::move(strategy);
    }

    [[nodiscard]] const Strategy* find(const Address& handle) const {
        auto it = strategies_.find(handle);
        return it != strategies_.end() ? it->second.get() : nullptr;
    }

    [[nodiscard]] bool contains(const Address& handle) const {
        return strategies_.contains(handle);
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return strategies_.size();
    }

  private:
    boost::unordered_flat_map<Address, StrategyPtr, AddressHash> strategies_;
};

}  // namespace flash_amm::quoting
