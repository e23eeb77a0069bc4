#include "configuration.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/marking.hpp"

namespace flash_amm::core {

namespace {

constexpr uint32_t MAX_FEE_BPS = 10'000;
constexpr uint8_t MAX_WINDOW_INDEX = 7;

Address parse_address(const toml::node& node, const std::string& field) {
    auto text = node.value<std::string>();
    if (!text) {
        throw std::runtime_error(field + " must be a hex address string");
    }
    auto addr = Address::from_hex(*text);
    if (!addr) {
        throw std::runtime_error("Invalid address for " + field + ": " + *text);
    }
    return *addr;
}

uint8_t parse_index(std::string_view key, unsigned low, unsigned high, const std::string& field) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), value);
    if (ec != std::errc{} || ptr != key.data() + key.size() || value < low || value > high) {
        throw std::runtime_error(field + " index '" + std::string(key) + "' must be in " + std::to_string(low) +
                                 ".." + std::to_string(high));
    }
    return static_cast<uint8_t>(value);
}

uint64_t non_negative(int64_t value, const std::string& field) {
    if (value < 0) {
        throw std::runtime_error(field + " cannot be negative");
    }
    return static_cast<uint64_t>(value);
}

}  // namespace

// Validation functions

void SystemConfig::validate() const {
    static const std::array<std::string_view, 5> valid_levels = {"trace", "debug", "info", "warn", "error"};

    auto it = std::find(valid_levels.begin(), valid_levels.end(), log_level);
    if (it == valid_levels.end()) {
        throw std::runtime_error("Invalid log level: " + log_level);
    }

    if (log_file.empty()) {
        throw std::runtime_error("Log file path cannot be empty");
    }
}

void LiquidityConfig::validate() const {
    if (protocol_fee_bps > MAX_FEE_BPS) {
        throw std::runtime_error("Protocol fee " + std::to_string(protocol_fee_bps) + " bps exceeds 10000");
    }
    if (protocol_fee_bps > 0 && (!treasury || treasury->is_zero())) {
        throw std::runtime_error("Protocol fee requires a non-zero treasury address");
    }
    if (permanent_lock == 0) {
        spdlog::warn("Permanent lock is 0, first deposits are not protected against share inflation");
    }
}

void CommitRevealConfig::validate() const {
    if (max_window_blocks == 0) {
        throw std::runtime_error("Commit-reveal window must be > 0 blocks");
    }
}

void BatchWindowConfig::validate() const {
    if (cycle_length == 0) {
        throw std::runtime_error("Batch window cycle length must be > 0");
    }
    if (settlement_blocks > cycle_length) {
        throw std::runtime_error("Batch window settlement blocks (" + std::to_string(settlement_blocks) +
                                 ") exceed cycle length (" + std::to_string(cycle_length) + ")");
    }
}

void AtomicExecutionConfig::validate() const {
    for (const auto& [index, window] : windows) {
        if (index == 0 || index > MAX_WINDOW_INDEX) {
            throw std::runtime_error("Batch window index " + std::to_string(index) + " must be in 1..7");
        }
        try {
            window.validate();
        } catch (const std::exception& e) {
            throw std::runtime_error("Batch window " + std::to_string(index) + " validation failed: " + e.what());
        }
    }
}

void BridgesConfig::validate() const {
    for (const auto& [slot, handle] : extra) {
        if (slot == 0 || slot > MarkingCodec::MAX_CONFIGURABLE_SLOT) {
            throw std::runtime_error("Extra bridge slot " + std::to_string(slot) + " must be in 1..14");
        }
        if (handle.is_zero()) {
            throw std::runtime_error("Extra bridge slot " + std::to_string(slot) + " has a zero handle");
        }
    }
}

// Configuration class implementation

void Configuration::load_from_file(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("Configuration file not found: " + filepath.string());
    }

    try {
        auto config = toml::parse_file(filepath.string());
        parse_toml(config);
        filepath_ = filepath;
        loaded_ = true;

        // Validate after loading
        validate();

        spdlog::info("Configuration loaded from: {}", filepath.string());
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Failed to parse TOML file: " << e;
        throw std::runtime_error(oss.str());
    }
}

void Configuration::load_from_string(std::string_view toml_content) {
    try {
        auto config = toml::parse(toml_content);
        parse_toml(config);
        loaded_ = true;

        // Validate after loading
        validate();

        spdlog::info("Configuration loaded from string");
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Failed to parse TOML string: " << e;
        throw std::runtime_error(oss.str());
    }
}

void Configuration::validate() const {
    system_.validate();
    liquidity_.validate();
    commit_reveal_.validate();
    atomic_execution_.validate();
    bridges_.validate();
}

void Configuration::clear() {
    system_ = SystemConfig{};
    liquidity_ = LiquidityConfig{};
    commit_reveal_ = CommitRevealConfig{};
    atomic_execution_ = AtomicExecutionConfig{};
    bridges_ = BridgesConfig{};
    loaded_ = false;
    filepath_.clear();
}

void Configuration::parse_toml(const toml::table& table) {
    // Parse each section
    if (auto system = table["system"].as_table()) {
        parse_system(*system);
    }

    if (auto liquidity = table["liquidity"].as_table()) {
        parse_liquidity(*liquidity);
    }

    if (auto commit_reveal = table["commit_reveal"].as_table()) {
        parse_commit_reveal(*commit_reveal);
    }

    if (auto atomic = table["atomic_execution"].as_table()) {
        parse_atomic_execution(*atomic);
    }

    if (auto bridges = table["bridges"].as_table()) {
        parse_bridges(*bridges);
    }
}

void Configuration::parse_system(const toml::table& table) {
    if (auto val = table["log_level"].value<std::string>()) {
        system_.log_level = *val;
    }
    if (auto val = table["log_file"].value<std::string>()) {
        system_.log_file = *val;
    }
}

void Configuration::parse_liquidity(const toml::table& table) {
    if (auto val = table["permanent_lock"].value<int64_t>()) {
        liquidity_.permanent_lock = non_negative(*val, "permanent_lock");
    }
    if (auto val = table["protocol_fee_bps"].value<int64_t>()) {
        liquidity_.protocol_fee_bps = static_cast<uint32_t>(non_negative(*val, "protocol_fee_bps"));
    }
    if (auto node = table.get("treasury")) {
        liquidity_.treasury = parse_address(*node, "liquidity.treasury");
    }
}

void Configuration::parse_commit_reveal(const toml::table& table) {
    if (auto val = table["max_window_blocks"].value<int64_t>()) {
        commit_reveal_.max_window_blocks = non_negative(*val, "max_window_blocks");
    }
}

void Configuration::parse_atomic_execution(const toml::table& table) {
    if (auto val = table["emergency_mode"].value<bool>()) {
        atomic_execution_.emergency_mode = *val;
    }

    auto windows = table["windows"].as_table();
    if (!windows) {
        return;
    }

    for (auto&& [key, value] : *windows) {
        auto window_table = value.as_table();
        if (!window_table) {
            continue;
        }
        const uint8_t index = parse_index(key.str(), 1, MAX_WINDOW_INDEX, "atomic_execution.windows");

        BatchWindowConfig window{.cycle_length = 1, .settlement_blocks = 1, .enabled = true};
        if (auto val = (*window_table)["cycle_length"].value<int64_t>()) {
            window.cycle_length = non_negative(*val, "cycle_length");
        }
        if (auto val = (*window_table)["settlement_blocks"].value<int64_t>()) {
            window.settlement_blocks = non_negative(*val, "settlement_blocks");
        }
        if (auto val = (*window_table)["enabled"].value<bool>()) {
            window.enabled = *val;
        }
        atomic_execution_.windows[index] = window;
    }
}

void Configuration::parse_bridges(const toml::table& table) {
    if (auto arr = table["default"].as_array()) {
        if (arr->size() > bridges_.defaults.size()) {
            throw std::runtime_error("bridges.default holds at most 4 handles");
        }
        for (std::size_t i = 0; i < arr->size(); ++i) {
            bridges_.defaults[i] = parse_address(*arr->get(i), "bridges.default[" + std::to_string(i) + "]");
        }
    }
    if (auto node = table.get("consolidated")) {
        bridges_.consolidated = parse_address(*node, "bridges.consolidated");
    }
    if (auto extra = table["extra"].as_table()) {
        for (auto&& [key, value] : *extra) {
            const uint8_t slot = parse_index(key.str(), 1, MarkingCodec::MAX_CONFIGURABLE_SLOT, "bridges.extra");
            bridges_.extra[slot] = parse_address(value, "bridges.extra." + std::string(key.str()));
        }
    }
}

}  // namespace flash_amm::core
