#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>
#include "common/money.hpp"

namespace settle {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// UUID v4 for market and bet ids
std::string generate_uuid();

// ============================================================================
// ENUMS
// ============================================================================

enum class Side {
    YES,
    NO
};

inline Side opposite(Side s) {
    return s == Side::YES ? Side::NO : Side::YES;
}

enum class MarketStatus {
    OPEN,
    RESOLVED
};

// Sub-state of an external wallet side effect
enum class TransferStatus {
    NONE,       // No transfer owed (losing bet)
    PENDING,    // Recorded, outcome of the wallet call not known yet
    SENT,       // Accepted by the wallet, awaiting confirmation
    CONFIRMED,  // Applied exactly once
    FAILED,     // Rejected by the wallet; retry with the same key
    REVERSED    // Debit intent voided by a refund
};

enum class TransferKind {
    BET_DEBIT,
    DEBIT_REFUND,
    PLATFORM_FEE,
    CREATOR_FEE,
    PAYOUT
};

std::string to_string(Side side);
std::string to_string(MarketStatus status);
std::string to_string(TransferStatus status);
std::string to_string(TransferKind kind);

// Accept "YES"/"NO" in any case; throws InvalidRequestError otherwise.
Side side_from_string(const std::string& s);
MarketStatus market_status_from_string(const std::string& s);
TransferStatus transfer_status_from_string(const std::string& s);
TransferKind transfer_kind_from_string(const std::string& s);

inline bool is_final(TransferStatus s) {
    return s == TransferStatus::NONE || s == TransferStatus::CONFIRMED ||
           s == TransferStatus::REVERSED;
}

// ============================================================================
// RECORDS
// ============================================================================

struct Market {
    std::string market_id;
    std::string title;
    std::string category_id;
    std::string creator_id;

    Amount yes_pool;
    Amount no_pool;
    Amount seed_liquidity;      // Per side
    Amount total_volume;        // Gross, pre-fee
    int64_t bet_count{0};

    MarketStatus status{MarketStatus::OPEN};
    std::optional<Side> outcome;

    int64_t end_date{0};        // Epoch ms
    int64_t created_at{0};
    int64_t resolved_at{0};
    std::string resolution_note;

    std::optional<int64_t> platform_fee_bps;
    std::optional<int64_t> creator_fee_bps;

    int64_t version{0};         // Compare-and-set token for pool updates

    bool is_open_at(int64_t epoch_ms) const {
        return status == MarketStatus::OPEN && epoch_ms < end_date;
    }
};

struct Bet {
    std::string bet_id;
    std::string market_id;
    std::string user_id;
    Side side{Side::YES};

    Amount gross_amount;
    Amount platform_fee;
    Amount creator_fee;
    Amount net_stake;
    Price price;                // Locked at execution

    int64_t created_at{0};
    bool resolved{false};
    std::optional<Amount> payout;
    bool claimed{false};
    int64_t claimed_at{0};
    TransferStatus payout_status{TransferStatus::NONE};
};

struct Transfer {
    std::string transfer_id;    // Idempotency key
    std::string bet_id;
    std::string account_id;
    TransferKind kind{TransferKind::PAYOUT};
    Amount amount;
    TransferStatus status{TransferStatus::PENDING};
    int attempts{0};
    std::string last_error;
    int64_t created_at{0};
    int64_t updated_at{0};
};

struct PayoutResult {
    std::string bet_id;
    std::string market_id;
    std::string user_id;
    bool won{false};
    Amount payout;
    TransferStatus transfer_status{TransferStatus::NONE};
    std::string idempotency_key;
};

// Idempotency keys derived from the bet id
std::string transfer_key(const std::string& bet_id, TransferKind kind);

} // namespace settle
