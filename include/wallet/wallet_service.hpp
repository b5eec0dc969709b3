#pragma once

#include <string>
#include "common/types.hpp"

namespace settle {

enum class DebitResult {
    OK,
    INSUFFICIENT
};

enum class CreditResult {
    OK,         // Applied
    PENDING,    // Accepted, settles later
    FAILED      // Rejected; safe to retry with the same key
};

std::string to_string(DebitResult r);
std::string to_string(CreditResult r);

// OK -> CONFIRMED, PENDING -> SENT, FAILED -> FAILED
TransferStatus transfer_status_for(CreditResult r);

/**
 * Custodian of user funds. Every mutating call carries an idempotency key;
 * repeating a call with the same key never applies it twice and returns the
 * first call's result.
 *
 * Transport and availability failures throw WalletUnavailableError. The
 * caller cannot tell whether such a call was applied.
 */
class WalletService {
public:
    virtual ~WalletService() = default;

    virtual Amount balance(const std::string& account_id) = 0;

    virtual DebitResult debit(const std::string& account_id, Amount amount,
                              const std::string& idempotency_key) = 0;

    virtual CreditResult credit(const std::string& account_id, Amount amount,
                                const std::string& idempotency_key) = 0;
};

} // namespace settle
