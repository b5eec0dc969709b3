#pragma once

#include "wallet/wallet_service.hpp"
#include "persistence/ledger_store.hpp"

namespace settle {

/**
 * Wallet kept in the engine's own database. Balances live in the accounts
 * table and every applied call is journaled in wallet_operations under its
 * idempotency key, in the same transaction as the balance change.
 */
class LedgerWallet : public WalletService {
public:
    explicit LedgerWallet(LedgerStore& store);

    Amount balance(const std::string& account_id) override;

    DebitResult debit(const std::string& account_id, Amount amount,
                      const std::string& idempotency_key) override;

    CreditResult credit(const std::string& account_id, Amount amount,
                        const std::string& idempotency_key) override;

    // Operator funding, e.g. `settled fund`. Idempotent by key.
    Amount deposit(const std::string& account_id, Amount amount,
                   const std::string& idempotency_key);

private:
    LedgerStore& store_;
};

} // namespace settle
