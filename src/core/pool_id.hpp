#pragma once

/**
 * @file pool_id.hpp
 * @brief Deterministic pool identity
 *
 * A pool is identified by its canonical asset pair, its pricing strategy
 * handle and its 24-bit marking word. The identifier is the lossless packing
 *
 *   asset0 (20) | asset1 (20) | strategy (20) | marking (3, big-endian)
 *
 * with asset0 < asset1. The caller's asset order never changes the id.
 */

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#include <boost/container_hash/hash.hpp>

#include "core/address.hpp"
#include "core/errors.hpp"
#include "core/marking.hpp"
#include "core/platform.hpp"

namespace flash_amm::core {

/**
 * @brief Canonical unpacked pool key
 */
struct PoolKey {
    Address asset0;
    Address asset1;
    Address strategy;
    uint32_t marking{0};

    [[nodiscard]] constexpr bool operator==(const PoolKey&) const noexcept = default;
};

struct PoolId {
    static constexpr std::size_t MARKING_BYTES = MARKING_BITS / 8;
    static constexpr std::size_t SIZE = 3 * ADDRESS_SIZE + MARKING_BYTES;

    std::array<uint8_t, SIZE> bytes{};

    [[nodiscard]] constexpr bool operator==(const PoolId&) const noexcept = default;

    [[nodiscard]] constexpr std::strong_ordering operator<=>(const PoolId& other) const noexcept {
        for (std::size_t i = 0; i < SIZE; ++i) {
            if (bytes[i] != other.bytes[i])
                return bytes[i] <=> other.bytes[i];
        }
        return std::strong_ordering::equal;
    }

    [[nodiscard]] std::string to_hex() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out = "0x";
        out.reserve(2 + SIZE * 2);
        for (uint8_t b : bytes) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0F]);
        }
        return out;
    }
};

struct PoolIdHash {
    std::size_t operator()(const PoolId& id) const noexcept {
        return boost::hash_range(id.bytes.begin(), id.bytes.end());
    }
};

inline std::size_t hash_value(const PoolId& id) {
    return PoolIdHash{}(id);
}

// (min, max) of the two assets
[[nodiscard]] constexpr std::pair<Address, Address> canonical_pair(const Address& a, const Address& b) noexcept {
    return a < b ? std::pair{a, b} : std::pair{b, a};
}

/**
 * @brief Canonicalize and pack a pool key
 * @throws ConfigurationError MALFORMED_ASSETS when the assets are equal or one is zero
 */
[[nodiscard]] inline PoolId assemble(const Address& asset_a,
                                     const Address& asset_b,
                                     const Address& strategy,
                                     uint32_t marking) {
    if (asset_a == asset_b) {
        throw ConfigurationError(ErrorCode::MALFORMED_ASSETS, "pool assets must differ: " + asset_a.to_hex());
    }
    if (asset_a.is_zero() || asset_b.is_zero()) {
        throw ConfigurationError(ErrorCode::MALFORMED_ASSETS, "pool asset cannot be the zero address");
    }

    const auto [asset0, asset1] = canonical_pair(asset_a, asset_b);
    marking &= MarkingCodec::WORD_MASK;

    PoolId id;
    auto out = id.bytes.begin();
    out = std::copy(asset0.bytes.begin(), asset0.bytes.end(), out);
    out = std::copy(asset1.bytes.begin(), asset1.bytes.end(), out);
    out = std::copy(strategy.bytes.begin(), strategy.bytes.end(), out);
    *out++ = static_cast<uint8_t>(marking >> 16);
    *out++ = static_cast<uint8_t>(marking >> 8);
    *out = static_cast<uint8_t>(marking);
    return id;
}

[[nodiscard]] inline PoolId assemble(const PoolKey& key) {
    return assemble(key.asset0, key.asset1, key.strategy, key.marking);
}

// Exact inverse of assemble
[[nodiscard]] constexpr PoolKey disassemble(const PoolId& id) noexcept {
    PoolKey key;
    std::size_t offset = 0;
    for (std::size_t i = 0; i < ADDRESS_SIZE; ++i)
        key.asset0.bytes[i] = id.bytes[offset + i];
    offset += ADDRESS_SIZE;
    for (std::size_t i = 0; i < ADDRESS_SIZE; ++i)
        key.asset1.bytes[i] = id.bytes[offset + i];
    offset += ADDRESS_SIZE;
    for (std::size_t i = 0; i < ADDRESS_SIZE; ++i)
        key.strategy.bytes[i] = id.bytes[offset + i];
    offset += ADDRESS_SIZE;
    key.marking = (static_cast<uint32_t>(id.bytes[offset]) << 16) |
                  (static_cast<uint32_t>(id.bytes[offset + 1]) << 8) | static_cast<uint32_t>(id.bytes[offset + 2]);
    return key;
}

// asset0/asset1 short forms plus the marking; full hex is too long for a log line
[[nodiscard]] inline std::string to_string(const PoolId& id) {
    const auto key = disassemble(id);
    return std::format("{}/{}#{:06x}", key.asset0.short_hex(), key.asset1.short_hex(), key.marking);
}

}  // namespace flash_amm::core

template <>
struct std::formatter<flash_amm::core::PoolId> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const flash_amm::core::PoolId& id, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", flash_amm::core::to_string(id));
    }
};
