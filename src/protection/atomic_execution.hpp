#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

#include "core/configuration.hpp"
#include "core/errors.hpp"
#include "protection/trader_protection.hpp"

namespace flash_amm::protection {

using namespace flash_amm::core;

/**
 * @brief Session-only and batch-window execution gating
 *
 * Slot 0 is session-only, slots 1..7 are batch windows. Slot 7 is the
 * emergency window: while the emergency switch is on it applies to every
 * caller regardless of their flags. With atomic execution off and no
 * emergency the check is a single flag test.
 */
class AtomicExecution {
  public:
    static constexpr std::size_t WINDOW_COUNT = 8;
    static constexpr uint8_t SESSION_ONLY = 0;
    static constexpr uint8_t EMERGENCY_WINDOW = 7;

    AtomicExecution() : windows_(default_windows()) {}

    [[nodiscard]] static constexpr std::array<BatchWindowConfig, WINDOW_COUNT> default_windows() noexcept {
        return {{
            {.cycle_length = 1, .settlement_blocks = 1, .enabled = false},   // session-only, no window
            {.cycle_length = 2, .settlement_blocks = 1, .enabled = true},
            {.cycle_length = 5, .settlement_blocks = 2, .enabled = true},
            {.cycle_length = 10, .settlement_blocks = 3, .enabled = true},
            {.cycle_length = 20, .settlement_blocks = 5, .enabled = true},
            {.cycle_length = 1, .settlement_blocks = 1, .enabled = false},   // reserved
            {.cycle_length = 1, .settlement_blocks = 1, .enabled = false},   // reserved
            {.cycle_length = 10, .settlement_blocks = 1, .enabled = true},   // emergency
        }};
    }

    void apply(const AtomicExecutionConfig& config) {
        for (const auto& [index, window] : config.windows) {
            configure(index, window);
        }
        set_emergency(config.emergency_mode);
    }

    /**
     * @throws ConfigurationError INVALID_BATCH_CONFIG for slot 0, a slot past 7,
     *         a zero cycle or settlement_blocks > cycle_length
     */
    void configure(uint8_t index, const BatchWindowConfig& window) {
        if (index == SESSION_ONLY || index >= WINDOW_COUNT) {
            throw ConfigurationError(ErrorCode::INVALID_BATCH_CONFIG,
                                     "batch window slot " + std::to_string(index) + " is not configurable");
        }
        if (window.cycle_length == 0 || window.settlement_blocks > window.cycle_length) {
            throw ConfigurationError(ErrorCode::INVALID_BATCH_CONFIG,
                                     "batch window " + std::to_string(index) + " needs 0 < settlement <= cycle");
        }
        windows_[index] = window;
    }

    [[nodiscard]] const BatchWindowConfig& window(uint8_t index) const {
        return windows_.at(index);
    }

    [[nodiscard]] bool is_window_active(uint8_t index, uint64_t block) const {
        return index < WINDOW_COUNT && windows_[index].is_active(block);
    }

    void set_emergency(bool on) {
        if (on != emergency_) {
            spdlog::warn("Atomic execution emergency mode {}", on ? "ENABLED" : "disabled");
        }
        emergency_ = on;
    }

    [[nodiscard]] bool emergency() const noexcept {
        return emergency_;
    }

    /**
     * @brief Gate one call
     * @throws MevProtectionViolation ATOMIC_EXECUTION_REQUIRED, BATCH_WINDOW_DISABLED
     *         or OUTSIDE_BATCH_WINDOW
     */
    void check(const TraderProtection& flags, bool session_active, uint64_t block) const {
        if (!flags.atomic_execution && !emergency_) [[likely]] {
            return;
        }

        if (emergency_) {
            require_window(EMERGENCY_WINDOW, block);
            return;
        }

        if (!session_active) {
            throw MevProtectionViolation(ErrorCode::ATOMIC_EXECUTION_REQUIRED,
                                         "atomic execution requires an active flash session");
        }
        if (flags.batch_mode != SESSION_ONLY) {
            require_window(flags.batch_mode, block);
        }
    }

  private:
    void require_window(uint8_t index, uint64_t block) const {
        const BatchWindowConfig& cfg = windows_[index];
        if (!cfg.enabled) {
            throw MevProtectionViolation(ErrorCode::BATCH_WINDOW_DISABLED,
                                         "batch window " + std::to_string(index) + " is disabled");
        }
        if (!cfg.is_active(block)) {
            throw MevProtectionViolation(ErrorCode::OUTSIDE_BATCH_WINDOW,
                                         "block " + std::to_string(block) + " is outside batch window " +
                                             std::to_string(index));
        }
    }

    std::array<BatchWindowConfig, WINDOW_COUNT> windows_;
    bool emergency_{false};
};

}  // namespace flash_amm::protection
