#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/unordered/unordered_flat_map.hpp>

#include "core/address.hpp"
#include "core/configuration.hpp"
#include "core/errors.hpp"
#include "core/marking.hpp"
#include "quoting/data_bridge.hpp"

namespace flash_amm::quoting {

/**
 * @brief Marking slot -> bridge handle -> implementation
 *
 * Four default slots (marking bits 0..3), fourteen configurable extra
 * slots (1..14) and the consolidated slot (15).
 */
class BridgeRegistry {
  public:
    using BridgePtr = std::shared_ptr<const DataBridge>;

    BridgeRegistry() = default;

    BridgeRegistry(const BridgeRegistry&) = delete;
    BridgeRegistry& operator=(const BridgeRegistry&) = delete;

    // Take slot handles from [bridges]; implementations are registered separately
    void apply(const BridgesConfig& config) {
        for (std::size_t i = 0; i < config.defaults.size(); ++i) {
            if (config.defaults[i]) {
                set_default(i, *config.defaults[i]);
            }
        }
        if (config.consolidated) {
            set_consolidated(*config.consolidated);
        }
        for (const auto& [slot, handle] : config.extra) {
            set_extra_slot(slot, handle);
        }
    }

    void register_bridge(const Address& handle, BridgePtr bridge) {
        impls_[handle] = std::move(bridge);
    }

    void set_default(std::size_t index, const Address& handle) {
        if (index >= defaults_.size()) {
            throw ConfigurationError(ErrorCode::INVALID_SLOT,
                                     "default bridge index " + std::to_string(index) + " must be in 0..3");
        }
        defaults_[index] = handle;
    }

    /**
     * @throws ConfigurationError INVALID_SLOT unless 1 <= slot <= 14
     */
    void set_extra_slot(uint8_t slot, const Address& handle) {
        if (slot == 0 || slot > MarkingCodec::MAX_CONFIGURABLE_SLOT) {
            throw ConfigurationError(ErrorCode::INVALID_SLOT,
                                     "extra bridge slot " + std::to_string(slot) + " must be in 1..14");
        }
        extras_[slot] = handle;
    }

    void set_consolidated(const Address& handle) {
        extras_[MarkingCodec::CONSOLIDATED_SLOT] = handle;
    }

    [[nodiscard]] std::optional<Address> default_handle(std::size_t index) const {
        return index < defaults_.size() ? defaults_[index] : std::nullopt;
    }

    // Handle configured for an extra slot 1..15; slot 0 means none
    [[nodiscard]] std::optional<Address> extra_handle(uint8_t slot) const {
        if (slot == 0 || slot >= extras_.size()) {
            return std::nullopt;
        }
        return extras_[slot];
    }

    // Implementation behind @p handle, nullptr if none is registered
    [[nodiscard]] const DataBridge* resolve(const Address& handle) const {
        auto it = impls_.find(handle);
        return it != impls_.end() ? it->second.get() : nullptr;
    }

  private:
    std::array<std::optional<Address>, 4> defaults_{};
    std::array<std::optional<Address>, 16> extras_{};  // index 0 unused
    boost::unordered_flat_map<Address, BridgePtr, AddressHash> impls_;
};

}  // namespace flash_amm::quoting
