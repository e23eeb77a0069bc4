#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace flash_amm::core {

// Broad failure class; every EngineError aborts the whole top-level call
enum class ErrorCategory : uint8_t {
    CONFIGURATION,
    QUOTE_UNAVAILABLE,
    SLIPPAGE,
    LIQUIDITY,
    SESSION,
    MEV_PROTECTION,
    REENTRANCY,
    SETTLEMENT
};

enum class ErrorCode : uint8_t {
    // Configuration
    MALFORMED_ASSETS,
    INVALID_AMOUNT,
    AMOUNT_OUT_OF_RANGE,
    DEGENERATE_INITIAL_DEPOSIT,
    POOL_NOT_FOUND,
    POOL_ALREADY_EXISTS,
    UNKNOWN_STRATEGY,
    INVALID_SLOT,
    INVALID_BATCH_CONFIG,
    BUCKET_SPLIT_MISMATCH,
    EMPTY_ROUTE,
    INVALID_FEE,
    // Quote
    QUOTE_UNAVAILABLE,
    // Slippage
    SLIPPAGE_VIOLATION,
    // Liquidity
    NO_LIQUIDITY,
    INSUFFICIENT_WITHDRAWAL,
    INSUFFICIENT_LIQUIDITY_MINTED,
    INSUFFICIENT_SHARES,
    INSUFFICIENT_RESERVES,
    INVENTORY_UNDERFLOW,
    // Session
    SESSION_ALREADY_ACTIVE,
    NO_ACTIVE_SESSION,
    UNSETTLED_DELTAS,
    // MEV protection
    INVALID_COMMITMENT,
    COMMITMENT_TOO_NEW,
    COMMITMENT_EXPIRED,
    INVALID_NONCE,
    ATOMIC_EXECUTION_REQUIRED,
    BATCH_WINDOW_DISABLED,
    OUTSIDE_BATCH_WINDOW,
    ACCESS_DENIED,
    CIRCUIT_OPEN,
    VOLUME_LIMIT_EXCEEDED,
    // Reentrancy
    REENTRANT_CALL,
    // Settlement
    TRANSFER_FAILED
};

[[nodiscard]] constexpr ErrorCategory category_of(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::QUOTE_UNAVAILABLE:
            return ErrorCategory::QUOTE_UNAVAILABLE;
        case ErrorCode::SLIPPAGE_VIOLATION:
            return ErrorCategory::SLIPPAGE;
        case ErrorCode::NO_LIQUIDITY:
        case ErrorCode::INSUFFICIENT_WITHDRAWAL:
        case ErrorCode::INSUFFICIENT_LIQUIDITY_MINTED:
        case ErrorCode::INSUFFICIENT_SHARES:
        case ErrorCode::INSUFFICIENT_RESERVES:
        case ErrorCode::INVENTORY_UNDERFLOW:
            return ErrorCategory::LIQUIDITY;
        case ErrorCode::SESSION_ALREADY_ACTIVE:
        case ErrorCode::NO_ACTIVE_SESSION:
        case ErrorCode::UNSETTLED_DELTAS:
            return ErrorCategory::SESSION;
        case ErrorCode::INVALID_COMMITMENT:
        case ErrorCode::COMMITMENT_TOO_NEW:
        case ErrorCode::COMMITMENT_EXPIRED:
        case ErrorCode::INVALID_NONCE:
        case ErrorCode::ATOMIC_EXECUTION_REQUIRED:
        case ErrorCode::BATCH_WINDOW_DISABLED:
        case ErrorCode::OUTSIDE_BATCH_WINDOW:
        case ErrorCode::ACCESS_DENIED:
        case ErrorCode::CIRCUIT_OPEN:
        case ErrorCode::VOLUME_LIMIT_EXCEEDED:
            return ErrorCategory::MEV_PROTECTION;
        case ErrorCode::REENTRANT_CALL:
            return ErrorCategory::REENTRANCY;
        case ErrorCode::TRANSFER_FAILED:
            return ErrorCategory::SETTLEMENT;
        default:
            return ErrorCategory::CONFIGURATION;
    }
}

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MALFORMED_ASSETS: return "MALFORMED_ASSETS";
        case ErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorCode::AMOUNT_OUT_OF_RANGE: return "AMOUNT_OUT_OF_RANGE";
        case ErrorCode::DEGENERATE_INITIAL_DEPOSIT: return "DEGENERATE_INITIAL_DEPOSIT";
        case ErrorCode::POOL_NOT_FOUND: return "POOL_NOT_FOUND";
        case ErrorCode::POOL_ALREADY_EXISTS: return "POOL_ALREADY_EXISTS";
        case ErrorCode::UNKNOWN_STRATEGY: return "UNKNOWN_STRATEGY";
        case ErrorCode::INVALID_SLOT: return "INVALID_SLOT";
        case ErrorCode::INVALID_BATCH_CONFIG: return "INVALID_BATCH_CONFIG";
        case ErrorCode::BUCKET_SPLIT_MISMATCH: return "BUCKET_SPLIT_MISMATCH";
        case ErrorCode::EMPTY_ROUTE: return "EMPTY_ROUTE";
        case ErrorCode::INVALID_FEE: return "INVALID_FEE";
        case ErrorCode::QUOTE_UNAVAILABLE: return "QUOTE_UNAVAILABLE";
        case ErrorCode::SLIPPAGE_VIOLATION: return "SLIPPAGE_VIOLATION";
        case ErrorCode::NO_LIQUIDITY: return "NO_LIQUIDITY";
        case ErrorCode::INSUFFICIENT_WITHDRAWAL: return "INSUFFICIENT_WITHDRAWAL";
        case ErrorCode::INSUFFICIENT_LIQUIDITY_MINTED: return "INSUFFICIENT_LIQUIDITY_MINTED";
        case ErrorCode::INSUFFICIENT_SHARES: return "INSUFFICIENT_SHARES";
        case ErrorCode::INSUFFICIENT_RESERVES: return "INSUFFICIENT_RESERVES";
        case ErrorCode::INVENTORY_UNDERFLOW: return "INVENTORY_UNDERFLOW";
        case ErrorCode::SESSION_ALREADY_ACTIVE: return "SESSION_ALREADY_ACTIVE";
        case ErrorCode::NO_ACTIVE_SESSION: return "NO_ACTIVE_SESSION";
        case ErrorCode::UNSETTLED_DELTAS: return "UNSETTLED_DELTAS";
        case ErrorCode::INVALID_COMMITMENT: return "INVALID_COMMITMENT";
        case ErrorCode::COMMITMENT_TOO_NEW: return "COMMITMENT_TOO_NEW";
        case ErrorCode::COMMITMENT_EXPIRED: return "COMMITMENT_EXPIRED";
        case ErrorCode::INVALID_NONCE: return "INVALID_NONCE";
        case ErrorCode::ATOMIC_EXECUTION_REQUIRED: return "ATOMIC_EXECUTION_REQUIRED";
        case ErrorCode::BATCH_WINDOW_DISABLED: return "BATCH_WINDOW_DISABLED";
        case ErrorCode::OUTSIDE_BATCH_WINDOW: return "OUTSIDE_BATCH_WINDOW";
        case ErrorCode::ACCESS_DENIED: return "ACCESS_DENIED";
        case ErrorCode::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case ErrorCode::VOLUME_LIMIT_EXCEEDED: return "VOLUME_LIMIT_EXCEEDED";
        case ErrorCode::REENTRANT_CALL: return "REENTRANT_CALL";
        case ErrorCode::TRANSFER_FAILED: return "TRANSFER_FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Base of every engine failure
 *
 * Synchronous and non-retryable: the PoolManager rolls back the whole
 * top-level call before the exception leaves it.
 */
class EngineError : public std::runtime_error {
  public:
    EngineError(ErrorCode code, const std::string& detail)
        : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept {
        return code_;
    }

    [[nodiscard]] ErrorCategory category() const noexcept {
        return category_of(code_);
    }

  private:
    ErrorCode code_;
};

class ConfigurationError : public EngineError {
  public:
    using EngineError::EngineError;
};

class QuoteUnavailable : public EngineError {
  public:
    explicit QuoteUnavailable(const std::string& detail) : EngineError(ErrorCode::QUOTE_UNAVAILABLE, detail) {}
};

class SlippageViolation : public EngineError {
  public:
    explicit SlippageViolation(const std::string& detail) : EngineError(ErrorCode::SLIPPAGE_VIOLATION, detail) {}
};

class LiquidityError : public EngineError {
  public:
    using EngineError::EngineError;
};

class SessionError : public EngineError {
  public:
    using EngineError::EngineError;
};

class MevProtectionViolation : public EngineError {
  public:
    using EngineError::EngineError;
};

class ReentrancyViolation : public EngineError {
  public:
    explicit ReentrancyViolation(const std::string& detail) : EngineError(ErrorCode::REENTRANT_CALL, detail) {}
};

class SettlementError : public EngineError {
  public:
    explicit SettlementError(const std::string& detail) : EngineError(ErrorCode::TRANSFER_FAILED, detail) {}
};

}  // namespace flash_amm::core
