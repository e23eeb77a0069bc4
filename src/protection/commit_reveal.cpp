#include "commit_reveal.hpp"

#include <openssl/sha.h>

#include <cstddef>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace flash_amm::protection {

namespace {

void put_address(std::vector<uint8_t>& out, const Address& addr) {
    out.insert(out.end(), addr.bytes.begin(), addr.bytes.end());
}

void put_be(std::vector<uint8_t>& out, uint64_t value, std::size_t width) {
    for (std::size_t i = width; i > 0; --i) {
        out.push_back(i <= 8 ? static_cast<uint8_t>(value >> (8 * (i - 1))) : 0);
    }
}

void put_word(std::vector<uint8_t>& out, Amount value) {
    for (std::size_t i = 0; i < 16; ++i) {
        out.push_back(0);
    }
    for (int shift = 120; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

}  // namespace

std::string to_hex(const Hash256& hash) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (uint8_t b : hash) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Hash256 CommitReveal::compute_commitment(const SwapParams& params,
                                         uint64_t nonce,
                                         const Address& trader,
                                         const Hash256& salt) {
    std::vector<uint8_t> packed;
    packed.reserve(3 * ADDRESS_SIZE + 3 + 32 + 1 + 32 + 8 + ADDRESS_SIZE + salt.size());

    put_address(packed, params.asset_in);
    put_address(packed, params.asset_out);
    put_address(packed, params.strategy);
    put_be(packed, params.marking & 0x00FF'FFFF, 3);
    put_word(packed, params.amount_in);
    packed.push_back(params.zero_for_one ? 1 : 0);
    put_word(packed, params.min_out);
    put_be(packed, nonce, 8);
    put_address(packed, trader);
    packed.insert(packed.end(), salt.begin(), salt.end());

    Hash256 digest{};
    SHA256(packed.data(), packed.size(), digest.data());
    return digest;
}

void CommitReveal::commit(const Address& trader, const Hash256& commitment, uint64_t block) {
    auto it = records_.find(trader);
    const std::optional<CommitRecord> previous =
        it != records_.end() ? std::optional<CommitRecord>(it->second) : std::nullopt;

    records_[trader] = CommitRecord{.commitment = commitment, .block_committed = block, .trader_nonce = nonce_of(trader)};
    journal_.record([this, trader, previous] {
        if (previous) {
            records_[trader] = *previous;
        } else {
            records_.erase(trader);
        }
    });

    spdlog::info("Commitment {} from {} at block {}", to_hex(commitment).substr(0, 16), trader.short_hex(), block);
}

void CommitReveal::reveal(const Address& trader, const Hash256& revealed, uint64_t nonce, uint64_t block) {
    auto it = records_.find(trader);
    if (it == records_.end()) {
        throw MevProtectionViolation(ErrorCode::INVALID_COMMITMENT, "no commitment for " + trader.short_hex());
    }

    const CommitRecord record = it->second;
    if (block <= record.block_committed) {
        throw MevProtectionViolation(ErrorCode::COMMITMENT_TOO_NEW,
                                     "reveal at block " + std::to_string(block) + ", committed at " +
                                         std::to_string(record.block_committed));
    }
    if (block - record.block_committed > max_window_) {
        throw MevProtectionViolation(ErrorCode::COMMITMENT_EXPIRED,
                                     "reveal at block " + std::to_string(block) + " past window ending at " +
                                         std::to_string(record.block_committed + max_window_));
    }

    const uint64_t live_nonce = nonce_of(trader);
    if (nonce != live_nonce) {
        throw MevProtectionViolation(ErrorCode::INVALID_NONCE,
                                     "nonce " + std::to_string(nonce) + ", expected " + std::to_string(live_nonce));
    }
    if (revealed != record.commitment) {
        throw MevProtectionViolation(ErrorCode::INVALID_COMMITMENT, "revealed swap does not match commitment");
    }

    records_.erase(trader);
    nonces_[trader] = live_nonce + 1;
    journal_.record([this, trader, record, live_nonce] {
        records_[trader] = record;
        if (live_nonce == 0) {
            nonces_.erase(trader);
        } else {
            nonces_[trader] = live_nonce;
        }
    });

    spdlog::info("Commitment of {} revealed at block {}, nonce now {}", trader.short_hex(), block, live_nonce + 1);
}

}  // namespace flash_amm::protection
