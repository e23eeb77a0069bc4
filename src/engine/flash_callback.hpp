#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <utility>

#include "core/address.hpp"

namespace flash_amm::engine {

class PoolManager;

/**
 * @brief Code run inside a flash session
 *
 * Invoked once while the owner's session is active. It may call back into
 * the manager's swap and liquidity entry points; everything it does is
 * deferred into the owner's deltas and settled when it returns.
 */
class FlashCallback {
  public:
    virtual ~FlashCallback() = default;

    virtual void on_flash(PoolManager& manager, const core::Address& owner, std::span<const uint8_t> data) = 0;
};

// Adapter for lambdas
class FunctionCallback final : public FlashCallback {
  public:
    using Function = std::function<void(PoolManager&, const core::Address&, std::span<const uint8_t>)>;

    explicit FunctionCallback(Function fn) : fn_(std::move(fn)) {}

    void on_flash(PoolManager& manager, const core::Address& owner, std::span<const uint8_t> data) override {
        fn_(manager, owner, data);
    }

  private:
    Function fn_;
};

}  // namespace flash_amm::engine
