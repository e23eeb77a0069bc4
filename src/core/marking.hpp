#pragma once

#include <array>
#include <cstdint>
#include <format>

namespace flash_amm::core {

/**
 * @brief Decoded form of the 24-bit pool marking word
 *
 * Wire layout (the contract integrators reproduce to derive a pool id):
 *
 *   bit  0      enhanced-context flag
 *   bits 0..3   default data bridges 0..3 (bridge i = bit i)
 *   bits 4..19  bucket id
 *   bits 20..23 extra-bridge slot (0 none, 1..14 configurable, 15 consolidated)
 *
 * Bit 0 is shared between the enhanced-context flag and default bridge 0;
 * decode reports both from it and encode ORs them back together.
 */
struct Marking {
    std::array<bool, 4> bridge_flags{};
    uint16_t bucket_id{0};
    uint8_t extra_slot{0};
    bool enhanced_context{false};

    [[nodiscard]] constexpr bool operator==(const Marking&) const noexcept = default;

    [[nodiscard]] constexpr bool has_extra_bridge() const noexcept {
        return extra_slot != 0;
    }

    [[nodiscard]] constexpr bool uses_consolidated_bridge() const noexcept {
        return extra_slot == 15;
    }
};

/**
 * @brief Pure, total codec between the 24-bit word and Marking
 *
 * Never fails: bits above 23 are masked away on decode, and out-of-range
 * field values are masked on encode. encode(decode(w)) == w for every
 * 24-bit w.
 */
class MarkingCodec {
  public:
    static constexpr uint32_t WORD_MASK = 0x00FF'FFFF;
    static constexpr uint32_t ENHANCED_CONTEXT_BIT = 0x0000'0001;
    static constexpr uint32_t BRIDGE_MASK = 0x0000'000F;
    static constexpr unsigned BUCKET_SHIFT = 4;
    static constexpr uint32_t BUCKET_MASK = 0xFFFF;
    static constexpr unsigned EXTRA_SLOT_SHIFT = 20;
    static constexpr uint32_t EXTRA_SLOT_MASK = 0xF;
    static constexpr uint8_t CONSOLIDATED_SLOT = 15;
    static constexpr uint8_t MAX_CONFIGURABLE_SLOT = 14;

    [[nodiscard]] static constexpr Marking decode(uint32_t word) noexcept {
        word &= WORD_MASK;

        Marking m;
        for (unsigned i = 0; i < 4; ++i) {
            m.bridge_flags[i] = (word >> i) & 1U;
        }
        m.enhanced_context = (word & ENHANCED_CONTEXT_BIT) != 0;
        m.bucket_id = static_cast<uint16_t>((word >> BUCKET_SHIFT) & BUCKET_MASK);
        m.extra_slot = static_cast<uint8_t>((word >> EXTRA_SLOT_SHIFT) & EXTRA_SLOT_MASK);
        return m;
    }

    [[nodiscard]] static constexpr uint32_t encode(const Marking& m) noexcept {
        uint32_t word = 0;
        for (unsigned i = 0; i < 4; ++i) {
            if (m.bridge_flags[i]) {
                word |= 1U << i;
            }
        }
        if (m.enhanced_context) {
            word |= ENHANCED_CONTEXT_BIT;
        }
        word |= (static_cast<uint32_t>(m.bucket_id) & BUCKET_MASK) << BUCKET_SHIFT;
        word |= (static_cast<uint32_t>(m.extra_slot) & EXTRA_SLOT_MASK) << EXTRA_SLOT_SHIFT;
        return word;
    }

    // Compose a marking word from its fields without building a Marking first
    [[nodiscard]] static constexpr uint32_t make(uint8_t bridge_bits, uint16_t bucket_id, uint8_t extra_slot) noexcept {
        return (static_cast<uint32_t>(bridge_bits) & BRIDGE_MASK) |
               (static_cast<uint32_t>(bucket_id) << BUCKET_SHIFT) |
               ((static_cast<uint32_t>(extra_slot) & EXTRA_SLOT_MASK) << EXTRA_SLOT_SHIFT);
    }
};

}  // namespace flash_amm::core

template <>
struct std::formatter<flash_amm::core::Marking> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const flash_amm::core::Marking& m, std::format_context& ctx) const {
        return std::format_to(ctx.out(),
                              "0x{:06x}",
                              flash_amm::core::MarkingCodec::encode(m));
    }
};
