#pragma once

#include <memory>
#include <functional>
#include <chrono>
#include "wallet/wallet_service.hpp"

namespace settle {

/**
 * Retries WalletUnavailableError with exponential backoff, reusing the same
 * idempotency key on every attempt. Rethrows the last failure once
 * max_attempts is exhausted.
 */
class RetryingWallet : public WalletService {
public:
    struct Policy {
        int max_attempts{3};
        int backoff_initial_ms{100};
        int backoff_max_ms{2000};
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingWallet(std::shared_ptr<WalletService> inner, const Policy& policy,
                   Sleeper sleeper = nullptr);

    Amount balance(const std::string& account_id) override;

    DebitResult debit(const std::string& account_id, Amount amount,
                      const std::string& idempotency_key) override;

    CreditResult credit(const std::string& account_id, Amount amount,
                        const std::string& idempotency_key) override;

private:
    std::shared_ptr<WalletService> inner_;
    Policy policy_;
    Sleeper sleeper_;

    template <typename Fn>
    auto with_retry(const char* op, const std::string& key, Fn&& fn) -> decltype(fn());
};

} // namespace settle
