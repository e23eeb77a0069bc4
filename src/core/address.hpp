/**
 * @file address.hpp
 * @brief Fixed-size 20-byte handle for assets, strategies, bridges and traders
 *
 * Every participant the engine talks to is identified by an Address: token
 * contracts, pricing strategies, data bridges and the traders themselves.
 * The type is:
 * - Stack-allocated with no heap usage
 * - Trivially copyable, so it can be a map key and part of a packed PoolId
 * - Totally ordered byte-lexicographically, which defines canonical asset order
 *
 * The all-zero address is reserved for the native asset in settlement and for
 * the holder of permanently locked liquidity shares.
 */

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <boost/container_hash/hash.hpp>

#include "core/platform.hpp"

namespace flash_amm::core {

struct Address {
    std::array<uint8_t, ADDRESS_SIZE> bytes{};

    constexpr Address() noexcept = default;

    constexpr explicit Address(const std::array<uint8_t, ADDRESS_SIZE>& raw) noexcept : bytes(raw) {}

    /**
     * @brief Build an address whose low-order bytes hold @p value (big-endian)
     *
     * Convenient for tests and demos: Address::from_uint(0xA) sorts before
     * Address::from_uint(0xB).
     */
    [[nodiscard]] static constexpr Address from_uint(uint64_t value) noexcept {
        Address addr;
        for (std::size_t i = 0; i < 8; ++i) {
            addr.bytes[ADDRESS_SIZE - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
        }
        return addr;
    }

    /**
     * @brief Parse "0x"-prefixed or bare 40-digit hex
     * @return std::nullopt on wrong length or a non-hex digit
     */
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex) noexcept {
        if (hex.starts_with("0x") || hex.starts_with("0X")) {
            hex.remove_prefix(2);
        }
        if (hex.size() != ADDRESS_SIZE * 2) {
            return std::nullopt;
        }

        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        };

        Address addr;
        for (std::size_t i = 0; i < ADDRESS_SIZE; ++i) {
            const int hi = nibble(hex[2 * i]);
            const int lo = nibble(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            addr.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return addr;
    }

    // Native asset / burn holder
    [[nodiscard]] static constexpr Address native() noexcept {
        return Address{};
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    }

    [[nodiscard]] std::string to_hex() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out = "0x";
        out.reserve(2 + ADDRESS_SIZE * 2);
        for (uint8_t b : bytes) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0F]);
        }
        return out;
    }

    // Short form for log lines: 0x1234..abcd
    [[nodiscard]] std::string short_hex() const {
        auto full = to_hex();
        return full.substr(0, 6) + ".." + full.substr(full.size() - 4);
    }

    [[nodiscard]] constexpr bool operator==(const Address& other) const noexcept = default;

    [[nodiscard]] constexpr std::strong_ordering operator<=>(const Address& other) const noexcept {
        for (std::size_t i = 0; i < ADDRESS_SIZE; ++i) {
            if (bytes[i] != other.bytes[i])
                return bytes[i] <=> other.bytes[i];
        }
        return std::strong_ordering::equal;
    }
};

// Hash for Boost and std unordered containers
struct AddressHash {
    std::size_t operator()(const Address& addr) const noexcept {
        return boost::hash_range(addr.bytes.begin(), addr.bytes.end());
    }
};

inline std::size_t hash_value(const Address& addr) {
    return AddressHash{}(addr);
}

}  // namespace flash_amm::core

template <>
struct std::formatter<flash_amm::core::Address> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const flash_amm::core::Address& addr, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", addr.to_hex());
    }
};
