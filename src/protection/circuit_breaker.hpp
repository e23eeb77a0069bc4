#pragma once

#include <cstdint>
#include <optional>

#include "protection/protection_gate.hpp"

namespace flash_amm::protection {

// Pool flag + trader bit 16, mode in bits 17..19. Refusals raise CIRCUIT_OPEN.
class CircuitBreaker final : public ProtectionGate {
  public:
    CircuitBreaker() : ProtectionGate("circuit breaker", ErrorCode::CIRCUIT_OPEN) {}

    [[nodiscard]] static constexpr std::optional<uint8_t> engaged(const PoolProtectionFlags& pool,
                                                                  const TraderProtection& trader) noexcept {
        return engaged_mode(pool.circuit_breaker, trader.circuit_breaker, trader.circuit_mode);
    }
};

}  // namespace flash_amm::protection
