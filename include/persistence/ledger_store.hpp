#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>
#include "common/types.hpp"

// Forward declare sqlite3
struct sqlite3;

namespace settle {

// ============================================================================
// LEDGER STORE
//
// Durable record of markets, bets, wallet transfers and ledger accounts.
// One SQLite connection, serialised by a recursive mutex. All money columns
// are INTEGER micro-units and prices INTEGER nano-units.
//
// Multi-row updates go through LedgerStore::Transaction. The conditional
// writers (update_market_pools, resolve_market_if_open,
// claim_bet_if_unclaimed, update_transfer_status_if) return false when their guard did not match and
// are the only way those fields change.
// ============================================================================

struct MarketTotals {
    Amount net_stake;           // Sum of bet net stakes
    Amount gross;               // Sum of bet gross amounts
    Amount fees;                // Sum of bet platform + creator fees
    Amount fee_transfers;       // Sum of recorded fee transfers
    int64_t bet_count{0};
    int64_t fee_mismatches{0};  // Bets where gross != fees + net
    int64_t resolved_mismatches{0};
    int64_t reversed_debits{0};  // Committed bets whose debit was reversed
};

struct AccountBalance {
    std::string account_id;
    Amount balance;
    int64_t updated_at{0};
};

class LedgerStore {
public:
    explicit LedgerStore(const std::string& db_path);
    ~LedgerStore();

    // Non-copyable
    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    /**
     * RAII transaction. The outermost instance issues BEGIN IMMEDIATE, nested
     * ones a SAVEPOINT. Rolls back on destruction unless commit() ran.
     * Holds the store mutex for its whole lifetime.
     */
    class Transaction {
    public:
        explicit Transaction(LedgerStore& store);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        LedgerStore& store_;
        std::unique_lock<std::recursive_mutex> lock_;
        int depth_{0};
        bool committed_{false};
    };

    // Connection management
    bool is_open() const;
    void close();
    const std::string& path() const { return db_path_; }

    // Schema management
    void initialize_schema();
    int get_schema_version();

    // Markets
    void insert_market(const Market& market);
    std::optional<Market> get_market(const std::string& market_id);
    std::vector<Market> list_markets(int limit = 100);

    // Compare-and-set on version; succeeds only while the market is open.
    bool update_market_pools(const std::string& market_id, int64_t expected_version,
                             Amount yes_pool, Amount no_pool, Amount total_volume,
                             int64_t bet_count);

    // open -> resolved, and flags every bet of the market as resolved.
    bool resolve_market_if_open(const std::string& market_id, Side outcome,
                                int64_t resolved_at, const std::string& note);

    // Bets
    void insert_bet(const Bet& bet);
    std::optional<Bet> get_bet(const std::string& bet_id);
    std::vector<Bet> get_bets_for_market(const std::string& market_id);
    std::vector<Bet> get_bets_for_user(const std::string& user_id);

    // Resolved-market, winning, unclaimed bets of a user
    std::vector<Bet> get_unclaimed_winning_bets(const std::string& user_id);

    bool claim_bet_if_unclaimed(const std::string& bet_id, Amount payout,
                                TransferStatus payout_status, int64_t claimed_at);
    void update_payout_status(const std::string& bet_id, TransferStatus status);

    MarketTotals compute_market_totals(const std::string& market_id);

    // Transfers
    void insert_transfer(const Transfer& transfer);
    std::optional<Transfer> get_transfer(const std::string& transfer_id);
    std::vector<Transfer> get_transfers_for_bet(const std::string& bet_id);

    // Records the outcome of one wallet call; count_attempt bumps attempts.
    void update_transfer_status(const std::string& transfer_id, TransferStatus status,
                                const std::string& last_error, bool count_attempt);

    // As above, but only while the transfer is still in `expected`
    bool update_transfer_status_if(const std::string& transfer_id, TransferStatus expected,
                                   TransferStatus status, const std::string& last_error,
                                   bool count_attempt);

    // Non-final credits (payout, fees, refunds)
    std::vector<Transfer> get_open_credit_transfers(int limit = 500);

    // Pending bet_debit intents created before the cutoff
    std::vector<Transfer> get_stale_debit_intents(int64_t created_before, int limit = 500);

    // Ledger accounts
    std::optional<AccountBalance> get_account(const std::string& account_id);
    void upsert_account(const std::string& account_id, Amount balance);

    // Wallet operation journal; returns the recorded result for a key
    std::optional<std::string> get_wallet_operation(const std::string& idempotency_key);
    void insert_wallet_operation(const std::string& idempotency_key, const std::string& account_id,
                                 const std::string& operation, Amount amount,
                                 const std::string& result);

    // Utility
    void execute(const std::string& sql);

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    mutable std::recursive_mutex mutex_;
    int tx_depth_{0};

    // Schema creation
    void create_tables();
    void create_indexes();

    // Best effort; used where throwing is not allowed
    bool execute_noexcept(const std::string& sql) noexcept;
};

} // namespace settle
