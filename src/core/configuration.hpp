#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include "core/address.hpp"

namespace flash_amm::core {

/**
 * @brief System-wide configuration parameters
 */
struct SystemConfig {
    std::string log_level{"info"};
    std::string log_file{"/tmp/flash_amm.log"};

    void validate() const;
};

/**
 * @brief Liquidity minting and protocol fee settings
 */
struct LiquidityConfig {
    uint64_t permanent_lock{1000};  // shares burned on the first deposit of every pool
    uint32_t protocol_fee_bps{0};   // share of accumulated profit, 0 disables the fee
    std::optional<Address> treasury;

    void validate() const;
};

struct CommitRevealConfig {
    uint64_t max_window_blocks{20};

    void validate() const;
};

/**
 * @brief One batch-window slot
 *
 * Active iff (block % cycle_length) < settlement_blocks.
 */
struct BatchWindowConfig {
    uint64_t cycle_length{1};
    uint64_t settlement_blocks{1};
    bool enabled{false};

    [[nodiscard]] constexpr bool is_active(uint64_t block) const noexcept {
        return enabled && cycle_length > 0 && (block % cycle_length) < settlement_blocks;
    }

    void validate() const;
};

/**
 * @brief Atomic execution overrides
 *
 * Only slots named in [atomic_execution.windows.N] are present; the
 * remaining slots keep their built-in values.
 */
struct AtomicExecutionConfig {
    bool emergency_mode{false};
    std::map<uint8_t, BatchWindowConfig> windows;

    void validate() const;
};

/**
 * @brief Data bridge handles per marking slot
 *
 * Handles only. Implementations are registered in code and looked up by
 * handle when a quote is routed.
 */
struct BridgesConfig {
    std::array<std::optional<Address>, 4> defaults{};
    std::optional<Address> consolidated;
    std::map<uint8_t, Address> extra;  // slots 1..14

    void validate() const;
};

/**
 * @brief Main configuration class
 *
 * This class loads and manages all engine configuration from TOML files.
 * Configuration is immutable after loading.
 *
 * Example usage:
 * @code
 * Configuration config;
 * config.load_from_file("config/flash_amm.toml");
 *
 * auto& liquidity = config.get_liquidity();
 * auto& windows = config.get_atomic_execution().windows;
 * @endcode
 */
class Configuration {
  public:
    Configuration() = default;
    ~Configuration() = default;

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;
    Configuration(Configuration&&) = delete;
    Configuration& operator=(Configuration&&) = delete;

    /**
     * @brief Load configuration from TOML file
     * @param filepath Path to TOML configuration file
     * @throws std::runtime_error on parse errors or validation failures
     */
    void load_from_file(const std::filesystem::path& filepath);

    /**
     * @brief Load configuration from TOML string
     * @param toml_content TOML configuration as string
     * @throws std::runtime_error on parse errors or validation failures
     */
    void load_from_string(std::string_view toml_content);

    [[nodiscard]] const SystemConfig& get_system() const noexcept {
        return system_;
    }

    [[nodiscard]] const LiquidityConfig& get_liquidity() const noexcept {
        return liquidity_;
    }

    [[nodiscard]] const CommitRevealConfig& get_commit_reveal() const noexcept {
        return commit_reveal_;
    }

    [[nodiscard]] const AtomicExecutionConfig& get_atomic_execution() const noexcept {
        return atomic_execution_;
    }

    [[nodiscard]] const BridgesConfig& get_bridges() const noexcept {
        return bridges_;
    }

    /**
     * @brief Check if configuration has been loaded
     * @return True if configuration is loaded
     */
    [[nodiscard]] bool is_loaded() const noexcept {
        return loaded_;
    }

    /**
     * @brief Get the configuration file path (if loaded from file)
     * @return Path to configuration file
     */
    [[nodiscard]] const std::filesystem::path& get_filepath() const noexcept {
        return filepath_;
    }

    /**
     * @brief Validate all configuration parameters
     * @throws std::runtime_error on validation failures
     */
    void validate() const;

    /**
     * @brief Clear all configuration
     */
    void clear();

  private:
    void parse_toml(const toml::table& table);
    void parse_system(const toml::table& table);
    void parse_liquidity(const toml::table& table);
    void parse_commit_reveal(const toml::table& table);

    /**
     * @brief Parse [atomic_execution] and its [atomic_execution.windows.N] tables
     * @param table Atomic execution configuration table
     */
    void parse_atomic_execution(const toml::table& table);

    void parse_bridges(const toml::table& table);

    // Configuration data
    SystemConfig system_;
    LiquidityConfig liquidity_;
    CommitRevealConfig commit_reveal_;
    AtomicExecutionConfig atomic_execution_;
    BridgesConfig bridges_;

    // State
    bool loaded_{false};
    std::filesystem::path filepath_;
};

}  // namespace flash_amm::core
