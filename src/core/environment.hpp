#pragma once

#include <cstdint>

#include "core/amount.hpp"

namespace flash_amm::core {

/**
 * @brief Host-chain view the engine reads block-scoped state from
 *
 * Commit-reveal windows, batch windows and the enhanced trader context all
 * read from here rather than from the wall clock.
 */
class ExecutionEnvironment {
  public:
    virtual ~ExecutionEnvironment() = default;

    [[nodiscard]] virtual uint64_t block_number() const = 0;
    [[nodiscard]] virtual uint64_t timestamp() const = 0;
    [[nodiscard]] virtual Amount gas_price() const = 0;
};

/**
 * @brief Deterministic in-process chain for the demo, tests and benchmarks
 *
 * Blocks advance only when told to; each block adds block_time seconds.
 */
class SimulatedChain final : public ExecutionEnvironment {
  public:
    explicit SimulatedChain(uint64_t start_block = 1, uint64_t start_timestamp = 1'700'000'000,
                            uint64_t block_time = 12) noexcept
        : block_(start_block), timestamp_(start_timestamp), block_time_(block_time) {}

    [[nodiscard]] uint64_t block_number() const override {
        return block_;
    }

    [[nodiscard]] uint64_t timestamp() const override {
        return timestamp_;
    }

    [[nodiscard]] Amount gas_price() const override {
        return gas_price_;
    }

    void advance_blocks(uint64_t count = 1) noexcept {
        block_ += count;
        timestamp_ += count * block_time_;
    }

    // Jump to an absolute block; the timestamp follows the block delta
    void set_block(uint64_t block) noexcept {
        if (block >= block_) {
            advance_blocks(block - block_);
        } else {
            timestamp_ -= (block_ - block) * block_time_;
            block_ = block;
        }
    }

    void set_gas_price(Amount price) noexcept {
        gas_price_ = price;
    }

  private:
    uint64_t block_;
    uint64_t timestamp_;
    uint64_t block_time_;
    Amount gas_price_{units(20, 9)};
};

}  // namespace flash_amm::core
