#include "wallet/retrying_wallet.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace settle {

RetryingWallet::RetryingWallet(std::shared_ptr<WalletService> inner, const Policy& policy,
                               Sleeper sleeper)
    : inner_(std::move(inner))
    , policy_(policy)
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (policy_.max_attempts < 1) {
        policy_.max_attempts = 1;
    }
}

template <typename Fn>
auto RetryingWallet::with_retry(const char* op, const std::string& key, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 0;; attempt++) {
        try {
            return fn();
        } catch (const WalletUnavailableError& e) {
            SETTLE_COUNTER("wallet_unavailable").increment();
            if (attempt + 1 >= policy_.max_attempts) {
                spdlog::error("Wallet {} {} failed after {} attempts: {}",
                              op, key, attempt + 1, e.what());
                throw;
            }
            auto delay = time_utils::backoff_delay(attempt, policy_.backoff_initial_ms,
                                                   policy_.backoff_max_ms);
            spdlog::warn("Wallet {} {} unavailable (attempt {}/{}), retrying in {}ms: {}",
                         op, key, attempt + 1, policy_.max_attempts, delay.count(), e.what());
            sleeper_(delay);
        }
    }
}

Amount RetryingWallet::balance(const std::string& account_id) {
    return with_retry("balance", account_id, [&] { return inner_->balance(account_id); });
}

DebitResult RetryingWallet::debit(const std::string& account_id, Amount amount,
                                  const std::string& idempotency_key) {
    return with_retry("debit", idempotency_key, [&] {
        return inner_->debit(account_id, amount, idempotency_key);
    });
}

CreditResult RetryingWallet::credit(const std::string& account_id, Amount amount,
                                    const std::string& idempotency_key) {
    return with_retry("credit", idempotency_key, [&] {
        return inner_->credit(account_id, amount, idempotency_key);
    });
}

} // namespace settle
