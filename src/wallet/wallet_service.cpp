#include "wallet/wallet_service.hpp"

namespace settle {

std::string to_string(DebitResult r) {
    switch (r) {
        case DebitResult::OK: return "ok";
        case DebitResult::INSUFFICIENT: return "insufficient";
    }
    return "unknown";
}

std::string to_string(CreditResult r) {
    switch (r) {
        case CreditResult::OK: return "ok";
        case CreditResult::PENDING: return "pending";
        case CreditResult::FAILED: return "failed";
    }
    return "unknown";
}

TransferStatus transfer_status_for(CreditResult r) {
    switch (r) {
        case CreditResult::OK: return TransferStatus::CONFIRMED;
        case CreditResult::PENDING: return TransferStatus::SENT;
        case CreditResult::FAILED: return TransferStatus::FAILED;
    }
    return TransferStatus::FAILED;
}

} // namespace settle
