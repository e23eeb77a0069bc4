#pragma once

#include <cstdint>

namespace flash_amm::protection {

/**
 * @brief Decoded per-call trader protection word
 *
 *   bit  0      access control engaged,   bits  1..3  access mode
 *   bit  8      atomic execution enabled, bits  9..11 batch mode
 *                                         (0 session-only, 1..7 window config)
 *   bit  16     circuit breaker engaged,  bits 17..19 mode
 *   bit  24     volume control engaged,   bits 25..27 mode
 *
 * Trader opt-in, so it travels with each call rather than in the pool marking.
 */
struct TraderProtection {
    bool access_control{false};
    uint8_t access_mode{0};
    bool atomic_execution{false};
    uint8_t batch_mode{0};
    bool circuit_breaker{false};
    uint8_t circuit_mode{0};
    bool volume_control{false};
    uint8_t volume_mode{0};

    [[nodiscard]] constexpr bool operator==(const TraderProtection&) const noexcept = default;
};

class TraderProtectionCodec {
  public:
    static constexpr unsigned ACCESS_SHIFT = 0;
    static constexpr unsigned ATOMIC_SHIFT = 8;
    static constexpr unsigned CIRCUIT_SHIFT = 16;
    static constexpr unsigned VOLUME_SHIFT = 24;
    static constexpr uint32_t MODE_MASK = 0x7;
    static constexpr uint32_t WORD_MASK = 0x0F0F'0F0F;

    [[nodiscard]] static constexpr TraderProtection decode(uint32_t word) noexcept {
        TraderProtection p;
        p.access_control = enabled(word, ACCESS_SHIFT);
        p.access_mode = mode(word, ACCESS_SHIFT);
        p.atomic_execution = enabled(word, ATOMIC_SHIFT);
        p.batch_mode = mode(word, ATOMIC_SHIFT);
        p.circuit_breaker = enabled(word, CIRCUIT_SHIFT);
        p.circuit_mode = mode(word, CIRCUIT_SHIFT);
        p.volume_control = enabled(word, VOLUME_SHIFT);
        p.volume_mode = mode(word, VOLUME_SHIFT);
        return p;
    }

    [[nodiscard]] static constexpr uint32_t encode(const TraderProtection& p) noexcept {
        return field(p.access_control, p.access_mode, ACCESS_SHIFT) |
               field(p.atomic_execution, p.batch_mode, ATOMIC_SHIFT) |
               field(p.circuit_breaker, p.circuit_mode, CIRCUIT_SHIFT) |
               field(p.volume_control, p.volume_mode, VOLUME_SHIFT);
    }

    // Word selecting atomic execution with @p batch_mode (0 = session-only)
    [[nodiscard]] static constexpr uint32_t atomic(uint8_t batch_mode) noexcept {
        return field(true, batch_mode, ATOMIC_SHIFT);
    }

  private:
    static constexpr bool enabled(uint32_t word, unsigned shift) noexcept {
        return ((word >> shift) & 1U) != 0;
    }

    static constexpr uint8_t mode(uint32_t word, unsigned shift) noexcept {
        return static_cast<uint8_t>((word >> (shift + 1)) & MODE_MASK);
    }

    static constexpr uint32_t field(bool on, uint8_t mode_value, unsigned shift) noexcept {
        return ((on ? 1U : 0U) | ((static_cast<uint32_t>(mode_value) & MODE_MASK) << 1)) << shift;
    }
};

}  // namespace flash_amm::protection
