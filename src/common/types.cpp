#include "common/types.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace settle {

std::string generate_uuid() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((a >> 32) & 0xFFFFFFFF);
    ss << "-";
    ss << std::setw(4) << ((a >> 16) & 0xFFFF);
    ss << "-";
    ss << std::setw(4) << (((a & 0xFFFF) & 0x0FFF) | 0x4000);  // Version 4
    ss << "-";
    ss << std::setw(4) << (((b >> 48) & 0x3FFF) | 0x8000);  // Variant
    ss << "-";
    ss << std::setw(12) << (b & 0xFFFFFFFFFFFF);

    return ss.str();
}

std::string to_string(Side side) {
    switch (side) {
        case Side::YES: return "YES";
        case Side::NO: return "NO";
    }
    return "UNKNOWN";
}

std::string to_string(MarketStatus status) {
    switch (status) {
        case MarketStatus::OPEN: return "open";
        case MarketStatus::RESOLVED: return "resolved";
    }
    return "unknown";
}

std::string to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::NONE: return "none";
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::SENT: return "sent";
        case TransferStatus::CONFIRMED: return "confirmed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::REVERSED: return "reversed";
    }
    return "unknown";
}

std::string to_string(TransferKind kind) {
    switch (kind) {
        case TransferKind::BET_DEBIT: return "bet_debit";
        case TransferKind::DEBIT_REFUND: return "debit_refund";
        case TransferKind::PLATFORM_FEE: return "platform_fee";
        case TransferKind::CREATOR_FEE: return "creator_fee";
        case TransferKind::PAYOUT: return "payout";
    }
    return "unknown";
}

Side side_from_string(const std::string& s) {
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "YES") return Side::YES;
    if (upper == "NO") return Side::NO;
    throw InvalidRequestError("Side must be YES or NO, got '" + s + "'");
}

MarketStatus market_status_from_string(const std::string& s) {
    if (s == "resolved") return MarketStatus::RESOLVED;
    return MarketStatus::OPEN;
}

TransferStatus transfer_status_from_string(const std::string& s) {
    if (s == "pending") return TransferStatus::PENDING;
    if (s == "sent") return TransferStatus::SENT;
    if (s == "confirmed") return TransferStatus::CONFIRMED;
    if (s == "failed") return TransferStatus::FAILED;
    if (s == "reversed") return TransferStatus::REVERSED;
    return TransferStatus::NONE;
}

TransferKind transfer_kind_from_string(const std::string& s) {
    if (s == "bet_debit") return TransferKind::BET_DEBIT;
    if (s == "debit_refund") return TransferKind::DEBIT_REFUND;
    if (s == "platform_fee") return TransferKind::PLATFORM_FEE;
    if (s == "creator_fee") return TransferKind::CREATOR_FEE;
    return TransferKind::PAYOUT;
}

std::string transfer_key(const std::string& bet_id, TransferKind kind) {
    switch (kind) {
        case TransferKind::BET_DEBIT: return bet_id + ":debit";
        case TransferKind::DEBIT_REFUND: return bet_id + ":refund";
        case TransferKind::PLATFORM_FEE: return bet_id + ":platform-fee";
        case TransferKind::CREATOR_FEE: return bet_id + ":creator-fee";
        case TransferKind::PAYOUT: return bet_id + ":payout";
    }
    return bet_id;
}

} // namespace settle
