/**
 * @file configuration_example.cpp
 * @brief Example demonstrating Configuration class usage
 *
 * This example shows how to:
 * - Load the engine configuration from a TOML file
 * - Access liquidity, commit-reveal, batch window and bridge settings
 * - Handle configuration errors
 */

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/amount.hpp"
#include "core/configuration.hpp"
#include "protection/atomic_execution.hpp"

using namespace flash_amm::core;
using flash_amm::protection::AtomicExecution;

void print_separator() {
    std::cout << std::string(60, '-') << std::endl;
}

void print_system_config(const SystemConfig& config) {
    std::cout << "System Configuration:" << std::endl;
    std::cout << "  Log Level: " << config.log_level << std::endl;
    std::cout << "  Log File:  " << config.log_file << std::endl;
}

void print_liquidity_config(const LiquidityConfig& config) {
    std::cout << "Liquidity Configuration:" << std::endl;
    std::cout << "  Permanent Lock:    " << config.permanent_lock << " shares" << std::endl;
    std::cout << "  Protocol Fee:      "
              << (config.protocol_fee_bps == 0 ? "Disabled" : std::to_string(config.protocol_fee_bps) + " bps")
              << std::endl;
    std::cout << "  Treasury:          " << (config.treasury ? config.treasury->to_hex() : "None") << std::endl;
}

void print_commit_reveal_config(const CommitRevealConfig& config) {
    std::cout << "Commit-Reveal Configuration:" << std::endl;
    std::cout << "  Reveal Window:     " << config.max_window_blocks << " blocks" << std::endl;
}

void print_atomic_execution_config(const AtomicExecutionConfig& config) {
    // Built-in windows with the file's overrides applied
    AtomicExecution atomic;
    atomic.apply(config);

    std::cout << "Atomic Execution Configuration:" << std::endl;
    std::cout << "  Emergency Mode:    " << (config.emergency_mode ? "ON" : "Off") << std::endl;
    for (uint8_t i = 1; i < AtomicExecution::WINDOW_COUNT; ++i) {
        const BatchWindowConfig& window = atomic.window(i);
        std::cout << "  Window " << static_cast<int>(i) << ":          ";
        if (!window.enabled) {
            std::cout << "Disabled";
        } else {
            std::cout << window.settlement_blocks << " of every " << window.cycle_length << " blocks";
        }
        std::cout << (config.windows.contains(i) ? " (configured)" : "") << std::endl;
    }
}

void print_bridges_config(const BridgesConfig& config) {
    std::cout << "Data Bridges:" << std::endl;
    for (size_t i = 0; i < config.defaults.size(); ++i) {
        std::cout << "  Default " << i << ":         " << (config.defaults[i] ? config.defaults[i]->to_hex() : "None")
                  << std::endl;
    }
    std::cout << "  Consolidated:      " << (config.consolidated ? config.consolidated->to_hex() : "None")
              << std::endl;
    std::cout << "  Extra Slots (" << config.extra.size() << "):" << std::endl;
    for (const auto& [slot, handle] : config.extra) {
        std::cout << "    - " << static_cast<int>(slot) << ": " << handle.to_hex() << std::endl;
    }
}

int main(int argc, char* argv[]) {
    // Set up logging
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::cout << "=== Configuration Example ===" << std::endl << std::endl;

    // Determine config file path
    std::filesystem::path config_file;
    if (argc > 1) {
        config_file = argv[1];
    } else {
        // Try to find config file in common locations
        std::vector<std::filesystem::path> search_paths = {
            "config/flash_amm.toml", "../config/flash_amm.toml", "../../config/flash_amm.toml"};

        for (const auto& path : search_paths) {
            if (std::filesystem::exists(path)) {
                config_file = path;
                break;
            }
        }

        if (config_file.empty()) {
            std::cerr << "Error: No configuration file found." << std::endl;
            std::cerr << "Usage: " << argv[0] << " [config_file.toml]" << std::endl;
            return 1;
        }
    }

    std::cout << "Loading configuration from: " << config_file << std::endl << std::endl;

    try {
        Configuration config;
        config.load_from_file(config_file);

        if (!config.is_loaded()) {
            std::cerr << "Error: Configuration not loaded properly" << std::endl;
            return 1;
        }

        print_separator();
        print_system_config(config.get_system());
        print_separator();
        print_liquidity_config(config.get_liquidity());
        print_separator();
        print_commit_reveal_config(config.get_commit_reveal());
        print_separator();
        print_atomic_execution_config(config.get_atomic_execution());
        print_separator();
        print_bridges_config(config.get_bridges());
        print_separator();

        std::cout << std::endl << "Configuration example completed successfully!" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
