#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <mutex>
#include <thread>
#include <condition_variable>
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/ledger_store.hpp"
#include "wallet/wallet_service.hpp"

namespace settle {

/**
 * Discrepancy types found by the ledger audit.
 */
enum class DiscrepancyType {
    POOL_CONSERVATION,       // yes + no != 2 * seed + sum(net stake)
    VOLUME_MISMATCH,         // total_volume != sum(gross)
    BET_COUNT_MISMATCH,
    FEE_CONSERVATION,        // gross != fees + net on some bet
    FEE_TRANSFER_MISMATCH,   // recorded fee transfers != fees taken
    RESOLVED_FLAG_MISMATCH,  // bet.resolved disagrees with market status
    REVERSED_DEBIT,          // committed bet whose debit was refunded
    TRANSFER_STUCK           // out of automatic retries
};

std::string to_string(DiscrepancyType d);

struct Discrepancy {
    DiscrepancyType type;
    std::string identifier;  // market_id or transfer_id
    std::string expected;
    std::string actual;
    bool is_critical{false};
};

struct AuditResult {
    std::vector<Discrepancy> discrepancies;
    int markets_checked{0};
    int64_t bets_checked{0};

    bool is_consistent() const { return discrepancies.empty(); }
    bool has_critical_discrepancies() const;
    std::string summary() const;
};

struct ReconcileRunResult {
    int credits_retried{0};
    int credits_confirmed{0};
    int credits_failed{0};
    int credits_unavailable{0};
    int debits_voided{0};
    int debits_never_applied{0};
    int debits_unavailable{0};
    int stuck{0};

    std::string summary() const;
};

/**
 * Drives every recorded wallet side effect to a final state.
 *
 * - Non-final credits (payout, fees, refunds) are re-issued with their
 *   original idempotency key until confirmed or max_attempts is reached.
 * - bet_debit intents still pending after debit_grace_ms belong to bets that
 *   never committed. They are re-debited with the same key (a no-op if the
 *   first call applied) and then refunded with "<betId>:refund".
 *
 * audit() checks the ledger's conservation laws without changing anything.
 */
class Reconciler {
public:
    Reconciler(LedgerStore& store, WalletService& wallet, const ReconcilerConfig& config);
    ~Reconciler();

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    ReconcileRunResult run_once();
    AuditResult audit();

    // Background loop calling run_once() every interval_seconds
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

private:
    LedgerStore& store_;
    WalletService& wallet_;
    ReconcilerConfig config_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::mutex run_mutex_;   // One pass at a time

    void retry_credit(const Transfer& transfer, ReconcileRunResult& result);
    void void_debit_intent(const Transfer& intent, ReconcileRunResult& result);
    void worker_loop();
};

} // namespace settle
