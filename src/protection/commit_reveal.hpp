#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/unordered/unordered_flat_map.hpp>

#include "core/address.hpp"
#include "core/journal.hpp"
#include "core/swap_params.hpp"

namespace flash_amm::protection {

using namespace flash_amm::core;

using Hash256 = std::array<uint8_t, 32>;

[[nodiscard]] std::string to_hex(const Hash256& hash);

struct CommitRecord {
    Hash256 commitment{};
    uint64_t block_committed{0};
    uint64_t trader_nonce{0};
};

/**
 * @brief Commit-reveal swap protection
 *
 *   NoCommitment --commit(hash)--> Committed@B --reveal--> Consumed
 *
 * A reveal is legal only in blocks (B, B + max_window]. Success clears the
 * record and bumps the trader nonce, so a replay finds no commitment.
 * Checks run in order: existence, window, nonce, hash. A new commit
 * replaces an unconsumed one.
 */
class CommitReveal {
  public:
    static constexpr uint64_t DEFAULT_MAX_WINDOW = 20;

    CommitReveal(Journal& journal, uint64_t max_window_blocks = DEFAULT_MAX_WINDOW)
        : journal_(journal), max_window_(max_window_blocks) {}

    CommitReveal(const CommitReveal&) = delete;
    CommitReveal& operator=(const CommitReveal&) = delete;

    /**
     * @brief SHA-256 over the packed swap, nonce, trader and salt
     *
     * Layout: asset_in(20) asset_out(20) strategy(20) marking(3) amount_in(32)
     * zero_for_one(1) min_out(32) nonce(8) trader(20) salt(32), integers
     * big-endian.
     */
    [[nodiscard]] static Hash256 compute_commitment(const SwapParams& params,
                                                    uint64_t nonce,
                                                    const Address& trader,
                                                    const Hash256& salt);

    void commit(const Address& trader, const Hash256& commitment, uint64_t block);

    /**
     * @brief Consume the commitment of @p trader
     * @throws MevProtectionViolation INVALID_COMMITMENT, COMMITMENT_TOO_NEW,
     *         COMMITMENT_EXPIRED or INVALID_NONCE
     */
    void reveal(const Address& trader, const Hash256& revealed, uint64_t nonce, uint64_t block);

    [[nodiscard]] uint64_t nonce_of(const Address& trader) const {
        auto it = nonces_.find(trader);
        return it != nonces_.end() ? it->second : 0;
    }

    [[nodiscard]] std::optional<CommitRecord> record_of(const Address& trader) const {
        auto it = records_.find(trader);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] uint64_t max_window() const noexcept {
        return max_window_;
    }

  private:
    Journal& journal_;
    uint64_t max_window_;
    boost::unordered_flat_map<Address, CommitRecord, AddressHash> records_;
    boost::unordered_flat_map<Address, uint64_t, AddressHash> nonces_;
};

}  // namespace flash_amm::protection
