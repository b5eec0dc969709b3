#include "wallet/ledger_wallet.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>

namespace settle {

LedgerWallet::LedgerWallet(LedgerStore& store)
    : store_(store)
{
}

Amount LedgerWallet::balance(const std::string& account_id) {
    auto account = store_.get_account(account_id);
    return account ? account->balance : Amount::zero();
}

DebitResult LedgerWallet::debit(const std::string& account_id, Amount amount,
                                const std::string& idempotency_key) {
    if (!amount.is_positive()) {
        throw InvalidAmountError("Debit amount must be positive");
    }

    LedgerStore::Transaction tx(store_);

    if (auto prior = store_.get_wallet_operation(idempotency_key)) {
        spdlog::debug("Debit {} replayed: {}", idempotency_key, *prior);
        return *prior == "ok" ? DebitResult::OK : DebitResult::INSUFFICIENT;
    }

    Amount current = balance(account_id);
    if (current < amount) {
        store_.insert_wallet_operation(idempotency_key, account_id, "debit", amount, "insufficient");
        tx.commit();
        return DebitResult::INSUFFICIENT;
    }

    store_.upsert_account(account_id, current - amount);
    store_.insert_wallet_operation(idempotency_key, account_id, "debit", amount, "ok");
    tx.commit();

    spdlog::debug("Debited {} from {} ({})", amount.to_string(), account_id, idempotency_key);
    return DebitResult::OK;
}

CreditResult LedgerWallet::credit(const std::string& account_id, Amount amount,
                                  const std::string& idempotency_key) {
    if (amount.is_negative()) {
        throw InvalidAmountError("Credit amount must not be negative");
    }

    LedgerStore::Transaction tx(store_);

    if (store_.get_wallet_operation(idempotency_key)) {
        spdlog::debug("Credit {} replayed", idempotency_key);
        return CreditResult::OK;
    }

    store_.upsert_account(account_id, balance(account_id) + amount);
    store_.insert_wallet_operation(idempotency_key, account_id, "credit", amount, "ok");
    tx.commit();

    spdlog::debug("Credited {} to {} ({})", amount.to_string(), account_id, idempotency_key);
    return CreditResult::OK;
}

Amount LedgerWallet::deposit(const std::string& account_id, Amount amount,
                             const std::string& idempotency_key) {
    if (!amount.is_positive()) {
        throw InvalidAmountError("Deposit amount must be positive");
    }

    LedgerStore::Transaction tx(store_);

    if (!store_.get_wallet_operation(idempotency_key)) {
        store_.upsert_account(account_id, balance(account_id) + amount);
        store_.insert_wallet_operation(idempotency_key, account_id, "deposit", amount, "ok");
    }
    Amount updated = balance(account_id);
    tx.commit();

    spdlog::info("Deposit {} to {}: balance {}", amount.to_string(), account_id, updated.to_string());
    return updated;
}

} // namespace settle
