#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "core/address.hpp"
#include "core/amount.hpp"
#include "core/errors.hpp"
#include "core/pool_id.hpp"
#include "protection/trader_protection.hpp"

namespace flash_amm::protection {

using namespace flash_amm::core;

// Pool-level opt-in bits, set by pool administration
struct PoolProtectionFlags {
    bool access_control{false};
    bool circuit_breaker{false};
    bool volume_control{false};

    [[nodiscard]] constexpr bool any() const noexcept {
        return access_control || circuit_breaker || volume_control;
    }
};

// What a policy hook is asked to judge
struct PolicyRequest {
    PoolId pool;
    Address trader;
    Amount amount_in{0};
    bool zero_for_one{true};
    uint8_t mode{0};
    uint64_t block{0};
};

/**
 * @brief Shared shape of AccessControl, CircuitBreaker and VolumeControl
 *
 * A gate is engaged when the pool opted in and the trader word turns the
 * module on; the trader word then selects the mode. What a mode means is
 * left to the installed policy hook. With no hook installed every request
 * is allowed.
 */
class ProtectionGate {
  public:
    // Returns false to refuse the request
    using PolicyHook = std::function<bool(const PolicyRequest&)>;

    void set_policy(PolicyHook hook) {
        hook_ = std::move(hook);
    }

    void clear_policy() noexcept {
        hook_ = nullptr;
    }

    [[nodiscard]] bool has_policy() const noexcept {
        return static_cast<bool>(hook_);
    }

    /**
     * @throws MevProtectionViolation with this gate's refusal code when the hook refuses
     */
    void enforce(const PolicyRequest& request) const {
        if (!hook_) {
            return;
        }
        if (!hook_(request)) {
            throw MevProtectionViolation(refusal_, name_ + " refused " + request.trader.short_hex() + " (mode " +
                                                       std::to_string(request.mode) + ")");
        }
    }

  protected:
    ProtectionGate(std::string name, ErrorCode refusal) : name_(std::move(name)), refusal_(refusal) {}

    // Mode selected by the trader when both opt-ins are present
    [[nodiscard]] static constexpr std::optional<uint8_t> engaged_mode(bool pool_opt_in,
                                                                       bool trader_on,
                                                                       uint8_t trader_mode) noexcept {
        if (pool_opt_in && trader_on) {
            return trader_mode;
        }
        return std::nullopt;
    }

  private:
    std::string name_;
    ErrorCode refusal_;
    PolicyHook hook_;
};

}  // namespace flash_amm::protection
