#pragma once

#include <stdexcept>
#include <string>

namespace settle {

// ============================================================================
// ERROR TAXONOMY
//
// Every rejected precondition maps to a distinct ErrorCode so callers can
// decide whether to retry. Categories follow the retry semantics:
//   validation      - fix the input and retry
//   state_conflict  - not retryable without a different action
//   resource        - retryable after funding
//   dependency      - engine commit state is recorded; retry with the token
// ============================================================================

enum class ErrorCategory {
    VALIDATION,
    STATE_CONFLICT,
    RESOURCE,
    DEPENDENCY,
    NOT_FOUND,
    AUTHORIZATION,
    INTERNAL
};

enum class ErrorCode {
    INVALID_AMOUNT,
    INVALID_REQUEST,
    AMOUNT_TOO_SMALL,
    MARKET_CLOSED,
    MARKET_NOT_FOUND,
    BET_NOT_FOUND,
    INSUFFICIENT_FUNDS,
    ALREADY_RESOLVED,
    NOT_RESOLVED,
    ALREADY_CLAIMED,
    POOL_CONFLICT,
    FORBIDDEN,
    UNAUTHENTICATED,
    SETTLEMENT_PENDING,
    WALLET_UNAVAILABLE,
    STORAGE
};

std::string to_string(ErrorCategory category);
std::string to_string(ErrorCode code);

class SettlementError : public std::runtime_error {
public:
    SettlementError(ErrorCode code, ErrorCategory category, const std::string& message)
        : std::runtime_error(message), code_(code), category_(category) {}

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return category_; }

private:
    ErrorCode code_;
    ErrorCategory category_;
};

// Validation

class InvalidAmountError : public SettlementError {
public:
    explicit InvalidAmountError(const std::string& message)
        : SettlementError(ErrorCode::INVALID_AMOUNT, ErrorCategory::VALIDATION, message) {}
};

class InvalidRequestError : public SettlementError {
public:
    explicit InvalidRequestError(const std::string& message)
        : SettlementError(ErrorCode::INVALID_REQUEST, ErrorCategory::VALIDATION, message) {}
};

class AmountTooSmallError : public SettlementError {
public:
    explicit AmountTooSmallError(const std::string& message)
        : SettlementError(ErrorCode::AMOUNT_TOO_SMALL, ErrorCategory::VALIDATION, message) {}
};

// State conflicts

class MarketClosedError : public SettlementError {
public:
    explicit MarketClosedError(const std::string& message)
        : SettlementError(ErrorCode::MARKET_CLOSED, ErrorCategory::STATE_CONFLICT, message) {}

protected:
    MarketClosedError(ErrorCode code, ErrorCategory category, const std::string& message)
        : SettlementError(code, category, message) {}
};

// A missing market is also a closed one for bet placement.
class MarketNotFoundError : public MarketClosedError {
public:
    explicit MarketNotFoundError(const std::string& market_id)
        : MarketClosedError(ErrorCode::MARKET_NOT_FOUND, ErrorCategory::NOT_FOUND,
                            "Market not found: " + market_id) {}
};

class BetNotFoundError : public SettlementError {
public:
    explicit BetNotFoundError(const std::string& bet_id)
        : SettlementError(ErrorCode::BET_NOT_FOUND, ErrorCategory::NOT_FOUND,
                          "Bet not found: " + bet_id) {}
};

class AlreadyResolvedError : public SettlementError {
public:
    explicit AlreadyResolvedError(const std::string& market_id)
        : SettlementError(ErrorCode::ALREADY_RESOLVED, ErrorCategory::STATE_CONFLICT,
                          "Market already resolved: " + market_id) {}
};

class NotResolvedError : public SettlementError {
public:
    explicit NotResolvedError(const std::string& market_id)
        : SettlementError(ErrorCode::NOT_RESOLVED, ErrorCategory::STATE_CONFLICT,
                          "Market not resolved: " + market_id) {}
};

class AlreadyClaimedError : public SettlementError {
public:
    explicit AlreadyClaimedError(const std::string& bet_id)
        : SettlementError(ErrorCode::ALREADY_CLAIMED, ErrorCategory::STATE_CONFLICT,
                          "Bet already claimed: " + bet_id) {}
};

class PoolConflictError : public SettlementError {
public:
    explicit PoolConflictError(const std::string& market_id)
        : SettlementError(ErrorCode::POOL_CONFLICT, ErrorCategory::STATE_CONFLICT,
                          "Concurrent pool update on market: " + market_id) {}
};

// Resource

class InsufficientFundsError : public SettlementError {
public:
    explicit InsufficientFundsError(const std::string& message)
        : SettlementError(ErrorCode::INSUFFICIENT_FUNDS, ErrorCategory::RESOURCE, message) {}
};

// Authorization

class ForbiddenError : public SettlementError {
public:
    explicit ForbiddenError(const std::string& message)
        : SettlementError(ErrorCode::FORBIDDEN, ErrorCategory::AUTHORIZATION, message) {}
};

class UnauthenticatedError : public SettlementError {
public:
    explicit UnauthenticatedError(const std::string& message)
        : SettlementError(ErrorCode::UNAUTHENTICATED, ErrorCategory::AUTHORIZATION, message) {}
};

// Dependency

/**
 * The engine's own state is committed but an external transfer has not been
 * confirmed. Retrying with retry_token() is always safe.
 */
class SettlementPendingError : public SettlementError {
public:
    SettlementPendingError(const std::string& retry_token, const std::string& message)
        : SettlementError(ErrorCode::SETTLEMENT_PENDING, ErrorCategory::DEPENDENCY, message)
        , retry_token_(retry_token) {}

    const std::string& retry_token() const { return retry_token_; }

private:
    std::string retry_token_;
};

class WalletUnavailableError : public SettlementError {
public:
    explicit WalletUnavailableError(const std::string& message)
        : SettlementError(ErrorCode::WALLET_UNAVAILABLE, ErrorCategory::DEPENDENCY, message) {}
};

// Internal

class StorageError : public SettlementError {
public:
    explicit StorageError(const std::string& message)
        : SettlementError(ErrorCode::STORAGE, ErrorCategory::INTERNAL, message) {}
};

} // namespace settle
