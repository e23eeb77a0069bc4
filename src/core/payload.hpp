#pragma once

/**
 * @file payload.hpp
 * @brief Opaque byte payloads and a 32-byte word codec over them
 *
 * Bridges hand strategies raw bytes. The reference bridges and strategies
 * agree on a sequence of 32-byte big-endian words; other implementations
 * are free to use any layout.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "core/address.hpp"
#include "core/amount.hpp"

namespace flash_amm::core {

using Bytes = std::vector<uint8_t>;

inline constexpr std::size_t WORD_SIZE = 32;

class PayloadWriter {
  public:
    PayloadWriter& put_amount(Amount value) {
        for (std::size_t i = 0; i < WORD_SIZE - 16; ++i) {
            out_.push_back(0);
        }
        for (int shift = 120; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>(value >> shift));
        }
        return *this;
    }

    PayloadWriter& put_u64(uint64_t value) {
        return put_amount(value);
    }

    PayloadWriter& put_bool(bool value) {
        return put_amount(value ? 1 : 0);
    }

    PayloadWriter& put_address(const Address& addr) {
        for (std::size_t i = 0; i < WORD_SIZE - ADDRESS_SIZE; ++i) {
            out_.push_back(0);
        }
        out_.insert(out_.end(), addr.bytes.begin(), addr.bytes.end());
        return *this;
    }

    [[nodiscard]] Bytes take() noexcept {
        return std::move(out_);
    }

  private:
    Bytes out_;
};

class PayloadReader {
  public:
    explicit PayloadReader(std::span<const uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] std::size_t word_count() const noexcept {
        return data_.size() / WORD_SIZE;
    }

    // True when the payload is a whole number of words and holds at least @p words
    [[nodiscard]] bool has_words(std::size_t words) const noexcept {
        return data_.size() % WORD_SIZE == 0 && word_count() >= words;
    }

    /**
     * @brief Word @p index as an Amount
     * @return std::nullopt if out of range or the word exceeds 128 bits
     */
    [[nodiscard]] std::optional<Amount> amount_at(std::size_t index) const noexcept {
        if (index >= word_count()) {
            return std::nullopt;
        }
        const auto word = data_.subspan(index * WORD_SIZE, WORD_SIZE);
        for (std::size_t i = 0; i < WORD_SIZE - 16; ++i) {
            if (word[i] != 0) {
                return std::nullopt;
            }
        }
        Amount value = 0;
        for (std::size_t i = WORD_SIZE - 16; i < WORD_SIZE; ++i) {
            value = (value << 8) | word[i];
        }
        return value;
    }

    [[nodiscard]] std::optional<bool> bool_at(std::size_t index) const noexcept {
        auto value = amount_at(index);
        if (!value || *value > 1) {
            return std::nullopt;
        }
        return *value == 1;
    }

  private:
    std::span<const uint8_t> data_;
};

}  // namespace flash_amm::core
