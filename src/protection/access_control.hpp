#pragma once

#include <cstdint>
#include <optional>

#include "protection/protection_gate.hpp"

namespace flash_amm::protection {

/**
 * @brief Trader allow/deny gate
 *
 * Engaged by PoolProtectionFlags::access_control plus bit 0 of the trader
 * word; bits 1..3 pick the mode handed to the policy hook. Refusals raise
 * ACCESS_DENIED.
 */
class AccessControl final : public ProtectionGate {
  public:
    AccessControl() : ProtectionGate("access control", ErrorCode::ACCESS_DENIED) {}

    [[nodiscard]] static constexpr std::optional<uint8_t> engaged(const PoolProtectionFlags& pool,
                                                                  const TraderProtection& trader) noexcept {
        return engaged_mode(pool.access_control, trader.access_control, trader.access_mode);
    }
};

}  // namespace flash_amm::protection
