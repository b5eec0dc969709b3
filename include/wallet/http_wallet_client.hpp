#pragma once

#include <string>
#include "wallet/wallet_service.hpp"
#include "config/config.hpp"

namespace settle {

/**
 * REST client for an external custodial wallet.
 *
 *   GET  /balances/{accountId}          -> {"balance": "<decimal>"}
 *   POST /debit  {accountId, amount, idempotencyKey} -> {"result": "ok"|"insufficient"}
 *   POST /credit {accountId, amount, idempotencyKey} -> {"status": "ok"|"pending"|"failed"}
 *
 * Requests are signed with X-Api-Key, X-Timestamp and X-Signature
 * (crypto::sign_wallet_request). Connection errors, timeouts, 429 and 5xx
 * raise WalletUnavailableError.
 */
class HttpWalletClient : public WalletService {
public:
    explicit HttpWalletClient(const WalletConfig& config);
    ~HttpWalletClient() override;

    HttpWalletClient(const HttpWalletClient&) = delete;
    HttpWalletClient& operator=(const HttpWalletClient&) = delete;

    Amount balance(const std::string& account_id) override;

    DebitResult debit(const std::string& account_id, Amount amount,
                      const std::string& idempotency_key) override;

    CreditResult credit(const std::string& account_id, Amount amount,
                        const std::string& idempotency_key) override;

    // Response interpretation, separated from transport
    static Amount parse_balance_response(long http_status, const std::string& body);
    static DebitResult parse_debit_response(long http_status, const std::string& body);
    static CreditResult parse_credit_response(long http_status, const std::string& body);

private:
    struct HttpResponse {
        long status{0};
        std::string body;
    };

    WalletConfig config_;

    HttpResponse http_get(const std::string& path);
    HttpResponse http_post(const std::string& path, const std::string& body,
                           const std::string& idempotency_key);
    HttpResponse perform(const std::string& method, const std::string& path,
                         const std::string& body, const std::string& idempotency_key);
};

} // namespace settle
