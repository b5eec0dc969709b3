#include "common/errors.hpp"

namespace settle {

std::string to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION: return "validation";
        case ErrorCategory::STATE_CONFLICT: return "state_conflict";
        case ErrorCategory::RESOURCE: return "resource";
        case ErrorCategory::DEPENDENCY: return "dependency";
        case ErrorCategory::NOT_FOUND: return "not_found";
        case ErrorCategory::AUTHORIZATION: return "authorization";
        case ErrorCategory::INTERNAL: return "internal";
    }
    return "unknown";
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_AMOUNT: return "invalid_amount";
        case ErrorCode::INVALID_REQUEST: return "invalid_request";
        case ErrorCode::AMOUNT_TOO_SMALL: return "amount_too_small";
        case ErrorCode::MARKET_CLOSED: return "market_closed";
        case ErrorCode::MARKET_NOT_FOUND: return "market_not_found";
        case ErrorCode::BET_NOT_FOUND: return "bet_not_found";
        case ErrorCode::INSUFFICIENT_FUNDS: return "insufficient_funds";
        case ErrorCode::ALREADY_RESOLVED: return "already_resolved";
        case ErrorCode::NOT_RESOLVED: return "not_resolved";
        case ErrorCode::ALREADY_CLAIMED: return "already_claimed";
        case ErrorCode::POOL_CONFLICT: return "pool_conflict";
        case ErrorCode::FORBIDDEN: return "forbidden";
        case ErrorCode::UNAUTHENTICATED: return "unauthenticated";
        case ErrorCode::SETTLEMENT_PENDING: return "settlement_pending";
        case ErrorCode::WALLET_UNAVAILABLE: return "wallet_unavailable";
        case ErrorCode::STORAGE: return "storage";
    }
    return "unknown";
}

} // namespace settle
