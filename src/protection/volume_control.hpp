#pragma once

#include <cstdint>
#include <optional>

#include "protection/protection_gate.hpp"

namespace flash_amm::protection {

// Pool flag + trader bit 24, mode in bits 25..27. Refusals raise VOLUME_LIMIT_EXCEEDED.
class VolumeControl final : public ProtectionGate {
  public:
    VolumeControl() : ProtectionGate("volume control", ErrorCode::VOLUME_LIMIT_EXCEEDED) {}

    [[nodiscard]] static constexpr std::optional<uint8_t> engaged(const PoolProtectionFlags& pool,
                                                                  const TraderProtection& trader) noexcept {
        return engaged_mode(pool.volume_control, trader.volume_control, trader.volume_mode);
    }
};

}  // namespace flash_amm::protection
