#include "persistence/ledger_store.hpp"
#include <filesystem>
#include "common/errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace settle {

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kMarketColumns =
    "market_id, title, category_id, creator_id, yes_pool, no_pool, seed_liquidity, "
    "total_volume, bet_count, status, outcome, end_date, created_at, resolved_at, "
    "resolution_note, platform_fee_bps, creator_fee_bps, version";

constexpr const char* kBetColumns =
    "bet_id, market_id, user_id, side, gross_amount, platform_fee, creator_fee, "
    "net_stake, price, created_at, resolved, payout, claimed, claimed_at, payout_status";

constexpr const char* kTransferColumns =
    "transfer_id, bet_id, account_id, kind, amount, status, attempts, last_error, "
    "created_at, updated_at";

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (!db_) {
            throw StorageError("Database is closed");
        }
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw StorageError("Failed to prepare statement: " +
                               std::string(sqlite3_errmsg(db_)));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind_int64(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
    }

    // True while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError("SQL step failed: " + std::string(sqlite3_errmsg(db_)));
    }

    // For statements that return no rows
    void run() {
        if (step()) {
            throw StorageError("Statement unexpectedly returned rows");
        }
    }

    int changes() const { return sqlite3_changes(db_); }

    std::string get_text(int col) const {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return text ? text : "";
    }

    int64_t get_int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

Market read_market(const Statement& s) {
    Market m;
    m.market_id = s.get_text(0);
    m.title = s.get_text(1);
    m.category_id = s.get_text(2);
    m.creator_id = s.get_text(3);
    m.yes_pool = Amount::from_micros(s.get_int64(4));
    m.no_pool = Amount::from_micros(s.get_int64(5));
    m.seed_liquidity = Amount::from_micros(s.get_int64(6));
    m.total_volume = Amount::from_micros(s.get_int64(7));
    m.bet_count = s.get_int64(8);
    m.status = market_status_from_string(s.get_text(9));
    if (!s.is_null(10)) m.outcome = side_from_string(s.get_text(10));
    m.end_date = s.get_int64(11);
    m.created_at = s.get_int64(12);
    m.resolved_at = s.get_int64(13);
    m.resolution_note = s.get_text(14);
    if (!s.is_null(15)) m.platform_fee_bps = s.get_int64(15);
    if (!s.is_null(16)) m.creator_fee_bps = s.get_int64(16);
    m.version = s.get_int64(17);
    return m;
}

Bet read_bet(const Statement& s) {
    Bet b;
    b.bet_id = s.get_text(0);
    b.market_id = s.get_text(1);
    b.user_id = s.get_text(2);
    b.side = side_from_string(s.get_text(3));
    b.gross_amount = Amount::from_micros(s.get_int64(4));
    b.platform_fee = Amount::from_micros(s.get_int64(5));
    b.creator_fee = Amount::from_micros(s.get_int64(6));
    b.net_stake = Amount::from_micros(s.get_int64(7));
    b.price = Price::from_nanos(s.get_int64(8));
    b.created_at = s.get_int64(9);
    b.resolved = s.get_int64(10) != 0;
    if (!s.is_null(11)) b.payout = Amount::from_micros(s.get_int64(11));
    b.claimed = s.get_int64(12) != 0;
    b.claimed_at = s.get_int64(13);
    b.payout_status = transfer_status_from_string(s.get_text(14));
    return b;
}

Transfer read_transfer(const Statement& s) {
    Transfer t;
    t.transfer_id = s.get_text(0);
    t.bet_id = s.get_text(1);
    t.account_id = s.get_text(2);
    t.kind = transfer_kind_from_string(s.get_text(3));
    t.amount = Amount::from_micros(s.get_int64(4));
    t.status = transfer_status_from_string(s.get_text(5));
    t.attempts = static_cast<int>(s.get_int64(6));
    t.last_error = s.get_text(7);
    t.created_at = s.get_int64(8);
    t.updated_at = s.get_int64(9);
    return t;
}

} // namespace

// ============================================================================
// CONNECTION
// ============================================================================

LedgerStore::LedgerStore(const std::string& db_path)
    : db_path_(db_path)
{
    std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty() && db_path != ":memory:") {
        std::filesystem::create_directories(parent);
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open database: " + error);
    }

    sqlite3_busy_timeout(db_, 5000);

    // Enable foreign keys
    execute("PRAGMA foreign_keys = ON;");

    // WAL mode for better concurrent access
    execute("PRAGMA journal_mode = WAL;");

    initialize_schema();

    spdlog::info("LedgerStore opened: {}", db_path);
}

LedgerStore::~LedgerStore() {
    close();
}

bool LedgerStore::is_open() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return db_ != nullptr;
}

void LedgerStore::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::info("LedgerStore closed");
    }
}

void LedgerStore::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        throw StorageError("Database is closed");
    }
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw StorageError("SQL error: " + error + " in: " + sql);
    }
}

bool LedgerStore::execute_noexcept(const std::string& sql) noexcept {
    if (!db_) return false;
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {} in: {}", errmsg ? errmsg : "Unknown error", sql);
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

// ============================================================================
// TRANSACTIONS
// ============================================================================

LedgerStore::Transaction::Transaction(LedgerStore& store)
    : store_(store)
    , lock_(store.mutex_)
    , depth_(store.tx_depth_)
{
    if (depth_ == 0) {
        store_.execute("BEGIN IMMEDIATE;");
    } else {
        store_.execute(fmt::format("SAVEPOINT sp_{};", depth_));
    }
    store_.tx_depth_++;
}

LedgerStore::Transaction::~Transaction() {
    if (!committed_) {
        if (depth_ == 0) {
            store_.execute_noexcept("ROLLBACK;");
        } else {
            store_.execute_noexcept(fmt::format(
                "ROLLBACK TO SAVEPOINT sp_{0}; RELEASE SAVEPOINT sp_{0};", depth_));
        }
    }
    store_.tx_depth_--;
}

void LedgerStore::Transaction::commit() {
    if (committed_) return;
    if (depth_ == 0) {
        store_.execute("COMMIT;");
    } else {
        store_.execute(fmt::format("RELEASE SAVEPOINT sp_{};", depth_));
    }
    committed_ = true;
}

// ============================================================================
// SCHEMA
// ============================================================================

void LedgerStore::initialize_schema() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    create_tables();
    create_indexes();

    int version = get_schema_version();
    if (version > kSchemaVersion) {
        throw StorageError(fmt::format(
            "Database schema version {} is newer than supported {}", version, kSchemaVersion));
    }
    spdlog::debug("Ledger schema version {}", version);
}

void LedgerStore::create_tables() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS markets (
            market_id TEXT PRIMARY KEY,
            title TEXT NOT NULL,
            category_id TEXT,
            creator_id TEXT NOT NULL,
            yes_pool INTEGER NOT NULL,
            no_pool INTEGER NOT NULL,
            seed_liquidity INTEGER NOT NULL,
            total_volume INTEGER NOT NULL DEFAULT 0,
            bet_count INTEGER NOT NULL DEFAULT 0,
            status TEXT NOT NULL DEFAULT 'open',
            outcome TEXT,
            end_date INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            resolved_at INTEGER NOT NULL DEFAULT 0,
            resolution_note TEXT,
            platform_fee_bps INTEGER,
            creator_fee_bps INTEGER,
            version INTEGER NOT NULL DEFAULT 0,
            CHECK (yes_pool > 0 AND no_pool > 0)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS bets (
            bet_id TEXT PRIMARY KEY,
            market_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            side TEXT NOT NULL,
            gross_amount INTEGER NOT NULL,
            platform_fee INTEGER NOT NULL,
            creator_fee INTEGER NOT NULL,
            net_stake INTEGER NOT NULL,
            price INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            resolved INTEGER NOT NULL DEFAULT 0,
            payout INTEGER,
            claimed INTEGER NOT NULL DEFAULT 0,
            claimed_at INTEGER NOT NULL DEFAULT 0,
            payout_status TEXT NOT NULL DEFAULT 'none',
            FOREIGN KEY (market_id) REFERENCES markets(market_id)
        );
    )");

    // bet_debit intents precede their bet row, so no foreign key on bet_id
    execute(R"(
        CREATE TABLE IF NOT EXISTS transfers (
            transfer_id TEXT PRIMARY KEY,
            bet_id TEXT NOT NULL,
            account_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            amount INTEGER NOT NULL,
            status TEXT NOT NULL,
            attempts INTEGER NOT NULL DEFAULT 0,
            last_error TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS accounts (
            account_id TEXT PRIMARY KEY,
            balance INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS wallet_operations (
            idempotency_key TEXT PRIMARY KEY,
            account_id TEXT NOT NULL,
            operation TEXT NOT NULL,
            amount INTEGER NOT NULL,
            result TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
    )");

    // Schema version table
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    execute(fmt::format("INSERT OR IGNORE INTO schema_version (version) VALUES ({});",
                        kSchemaVersion));
}

void LedgerStore::create_indexes() {
    execute("CREATE INDEX IF NOT EXISTS idx_bets_market ON bets(market_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_bets_user ON bets(user_id, claimed);");
    execute("CREATE INDEX IF NOT EXISTS idx_transfers_bet ON transfers(bet_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_transfers_status ON transfers(status, kind);");
    execute("CREATE INDEX IF NOT EXISTS idx_markets_created ON markets(created_at DESC);");
}

int LedgerStore::get_schema_version() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, "SELECT MAX(version) FROM schema_version;");
    int version = 0;
    if (stmt.step() && !stmt.is_null(0)) {
        version = static_cast<int>(stmt.get_int64(0));
    }
    return version;
}

// ============================================================================
// MARKETS
// ============================================================================

void LedgerStore::insert_market(const Market& market) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "INSERT INTO markets ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
        kMarketColumns));

    stmt.bind_text(1, market.market_id);
    stmt.bind_text(2, market.title);
    stmt.bind_text(3, market.category_id);
    stmt.bind_text(4, market.creator_id);
    stmt.bind_int64(5, market.yes_pool.micros());
    stmt.bind_int64(6, market.no_pool.micros());
    stmt.bind_int64(7, market.seed_liquidity.micros());
    stmt.bind_int64(8, market.total_volume.micros());
    stmt.bind_int64(9, market.bet_count);
    stmt.bind_text(10, to_string(market.status));
    if (market.outcome) stmt.bind_text(11, to_string(*market.outcome));
    else stmt.bind_null(11);
    stmt.bind_int64(12, market.end_date);
    stmt.bind_int64(13, market.created_at);
    stmt.bind_int64(14, market.resolved_at);
    stmt.bind_text(15, market.resolution_note);
    if (market.platform_fee_bps) stmt.bind_int64(16, *market.platform_fee_bps);
    else stmt.bind_null(16);
    if (market.creator_fee_bps) stmt.bind_int64(17, *market.creator_fee_bps);
    else stmt.bind_null(17);
    stmt.bind_int64(18, market.version);
    stmt.run();
}

std::optional<Market> LedgerStore::get_market(const std::string& market_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format("SELECT {} FROM markets WHERE market_id = ?;", kMarketColumns));
    stmt.bind_text(1, market_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_market(stmt);
}

std::vector<Market> LedgerStore::list_markets(int limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "SELECT {} FROM markets ORDER BY created_at DESC LIMIT ?;", kMarketColumns));
    stmt.bind_int64(1, limit);

    std::vector<Market> markets;
    while (stmt.step()) {
        markets.push_back(read_market(stmt));
    }
    return markets;
}

bool LedgerStore::update_market_pools(const std::string& market_id, int64_t expected_version,
                                      Amount yes_pool, Amount no_pool, Amount total_volume,
                                      int64_t bet_count) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, R"(
        UPDATE markets
        SET yes_pool = ?, no_pool = ?, total_volume = ?, bet_count = ?, version = version + 1
        WHERE market_id = ? AND version = ? AND status = 'open';
    )");
    stmt.bind_int64(1, yes_pool.micros());
    stmt.bind_int64(2, no_pool.micros());
    stmt.bind_int64(3, total_volume.micros());
    stmt.bind_int64(4, bet_count);
    stmt.bind_text(5, market_id);
    stmt.bind_int64(6, expected_version);
    stmt.run();
    return stmt.changes() == 1;
}

bool LedgerStore::resolve_market_if_open(const std::string& market_id, Side outcome,
                                         int64_t resolved_at, const std::string& note) {
    Transaction tx(*this);

    Statement update(db_, R"(
        UPDATE markets
        SET status = 'resolved', outcome = ?, resolved_at = ?, resolution_note = ?,
            version = version + 1
        WHERE market_id = ? AND status = 'open';
    )");
    update.bind_text(1, to_string(outcome));
    update.bind_int64(2, resolved_at);
    update.bind_text(3, note);
    update.bind_text(4, market_id);
    update.run();

    if (update.changes() != 1) {
        return false;
    }

    Statement flag(db_, "UPDATE bets SET resolved = 1 WHERE market_id = ?;");
    flag.bind_text(1, market_id);
    flag.run();

    tx.commit();
    return true;
}

// ============================================================================
// BETS
// ============================================================================

void LedgerStore::insert_bet(const Bet& bet) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "INSERT INTO bets ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
        kBetColumns));

    stmt.bind_text(1, bet.bet_id);
    stmt.bind_text(2, bet.market_id);
    stmt.bind_text(3, bet.user_id);
    stmt.bind_text(4, to_string(bet.side));
    stmt.bind_int64(5, bet.gross_amount.micros());
    stmt.bind_int64(6, bet.platform_fee.micros());
    stmt.bind_int64(7, bet.creator_fee.micros());
    stmt.bind_int64(8, bet.net_stake.micros());
    stmt.bind_int64(9, bet.price.nanos());
    stmt.bind_int64(10, bet.created_at);
    stmt.bind_int64(11, bet.resolved ? 1 : 0);
    if (bet.payout) stmt.bind_int64(12, bet.payout->micros());
    else stmt.bind_null(12);
    stmt.bind_int64(13, bet.claimed ? 1 : 0);
    stmt.bind_int64(14, bet.claimed_at);
    stmt.bind_text(15, to_string(bet.payout_status));
    stmt.run();
}

std::optional<Bet> LedgerStore::get_bet(const std::string& bet_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format("SELECT {} FROM bets WHERE bet_id = ?;", kBetColumns));
    stmt.bind_text(1, bet_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_bet(stmt);
}

std::vector<Bet> LedgerStore::get_bets_for_market(const std::string& market_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "SELECT {} FROM bets WHERE market_id = ? ORDER BY created_at;", kBetColumns));
    stmt.bind_text(1, market_id);

    std::vector<Bet> bets;
    while (stmt.step()) {
        bets.push_back(read_bet(stmt));
    }
    return bets;
}

std::vector<Bet> LedgerStore::get_bets_for_user(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "SELECT {} FROM bets WHERE user_id = ? ORDER BY created_at DESC;", kBetColumns));
    stmt.bind_text(1, user_id);

    std::vector<Bet> bets;
    while (stmt.step()) {
        bets.push_back(read_bet(stmt));
    }
    return bets;
}

std::vector<Bet> LedgerStore::get_unclaimed_winning_bets(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, R"(
        SELECT b.bet_id, b.market_id, b.user_id, b.side, b.gross_amount, b.platform_fee,
               b.creator_fee, b.net_stake, b.price, b.created_at, b.resolved, b.payout,
               b.claimed, b.claimed_at, b.payout_status
        FROM bets b
        JOIN markets m ON m.market_id = b.market_id
        WHERE b.user_id = ? AND b.claimed = 0 AND m.status = 'resolved' AND b.side = m.outcome
        ORDER BY b.created_at;
    )");
    stmt.bind_text(1, user_id);

    std::vector<Bet> bets;
    while (stmt.step()) {
        bets.push_back(read_bet(stmt));
    }
    return bets;
}

bool LedgerStore::claim_bet_if_unclaimed(const std::string& bet_id, Amount payout,
                                         TransferStatus payout_status, int64_t claimed_at) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, R"(
        UPDATE bets
        SET claimed = 1, payout = ?, payout_status = ?, claimed_at = ?
        WHERE bet_id = ? AND claimed = 0;
    )");
    stmt.bind_int64(1, payout.micros());
    stmt.bind_text(2, to_string(payout_status));
    stmt.bind_int64(3, claimed_at);
    stmt.bind_text(4, bet_id);
    stmt.run();
    return stmt.changes() == 1;
}

void LedgerStore::update_payout_status(const std::string& bet_id, TransferStatus status) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, "UPDATE bets SET payout_status = ? WHERE bet_id = ?;");
    stmt.bind_text(1, to_string(status));
    stmt.bind_text(2, bet_id);
    stmt.run();
}

MarketTotals LedgerStore::compute_market_totals(const std::string& market_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    MarketTotals totals;

    {
        Statement stmt(db_, R"(
            SELECT COALESCE(SUM(b.net_stake), 0),
                   COALESCE(SUM(b.gross_amount), 0),
                   COALESCE(SUM(b.platform_fee + b.creator_fee), 0),
                   COUNT(*),
                   COALESCE(SUM(CASE WHEN b.gross_amount != b.platform_fee + b.creator_fee + b.net_stake
                                     THEN 1 ELSE 0 END), 0),
                   COALESCE(SUM(CASE WHEN b.resolved != (m.status = 'resolved')
                                     THEN 1 ELSE 0 END), 0)
            FROM bets b
            JOIN markets m ON m.market_id = b.market_id
            WHERE b.market_id = ?;
        )");
        stmt.bind_text(1, market_id);
        if (stmt.step()) {
            totals.net_stake = Amount::from_micros(stmt.get_int64(0));
            totals.gross = Amount::from_micros(stmt.get_int64(1));
            totals.fees = Amount::from_micros(stmt.get_int64(2));
            totals.bet_count = stmt.get_int64(3);
            totals.fee_mismatches = stmt.get_int64(4);
            totals.resolved_mismatches = stmt.get_int64(5);
        }
    }

    {
        Statement stmt(db_, R"(
            SELECT COALESCE(SUM(t.amount), 0)
            FROM transfers t
            JOIN bets b ON b.bet_id = t.bet_id
            WHERE b.market_id = ? AND t.kind IN ('platform_fee', 'creator_fee');
        )");
        stmt.bind_text(1, market_id);
        if (stmt.step()) {
            totals.fee_transfers = Amount::from_micros(stmt.get_int64(0));
        }
    }

    {
        Statement stmt(db_, R"(
            SELECT COUNT(*)
            FROM bets b
            JOIN transfers t ON t.bet_id = b.bet_id
            WHERE b.market_id = ? AND t.kind = 'bet_debit' AND t.status = 'reversed';
        )");
        stmt.bind_text(1, market_id);
        if (stmt.step()) {
            totals.reversed_debits = stmt.get_int64(0);
        }
    }

    return totals;
}

// ============================================================================
// TRANSFERS
// ============================================================================

void LedgerStore::insert_transfer(const Transfer& transfer) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "INSERT INTO transfers ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", kTransferColumns));

    stmt.bind_text(1, transfer.transfer_id);
    stmt.bind_text(2, transfer.bet_id);
    stmt.bind_text(3, transfer.account_id);
    stmt.bind_text(4, to_string(transfer.kind));
    stmt.bind_int64(5, transfer.amount.micros());
    stmt.bind_text(6, to_string(transfer.status));
    stmt.bind_int64(7, transfer.attempts);
    stmt.bind_text(8, transfer.last_error);
    stmt.bind_int64(9, transfer.created_at);
    stmt.bind_int64(10, transfer.updated_at);
    stmt.run();
}

std::optional<Transfer> LedgerStore::get_transfer(const std::string& transfer_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "SELECT {} FROM transfers WHERE transfer_id = ?;", kTransferColumns));
    stmt.bind_text(1, transfer_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_transfer(stmt);
}

std::vector<Transfer> LedgerStore::get_transfers_for_bet(const std::string& bet_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(
        "SELECT {} FROM transfers WHERE bet_id = ? ORDER BY created_at;", kTransferColumns));
    stmt.bind_text(1, bet_id);

    std::vector<Transfer> transfers;
    while (stmt.step()) {
        transfers.push_back(read_transfer(stmt));
    }
    return transfers;
}

void LedgerStore::update_transfer_status(const std::string& transfer_id, TransferStatus status,
                                         const std::string& last_error, bool count_attempt) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, R"(
        UPDATE transfers
        SET status = ?, last_error = ?, attempts = attempts + ?, updated_at = ?
        WHERE transfer_id = ?;
    )");
    stmt.bind_text(1, to_string(status));
    stmt.bind_text(2, last_error);
    stmt.bind_int64(3, count_attempt ? 1 : 0);
    stmt.bind_int64(4, now_ms());
    stmt.bind_text(5, transfer_id);
    stmt.run();

    if (stmt.changes() != 1) {
        throw StorageError("Transfer not found: " + transfer_id);
    }
}

bool LedgerStore::update_transfer_status_if(const std::string& transfer_id, TransferStatus expected,
                                            TransferStatus status, const std::string& last_error,
                                            bool count_attempt) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, R"(
        UPDATE transfers
        SET status = ?, last_error = ?, attempts = attempts + ?, updated_at = ?
        WHERE transfer_id = ? AND status = ?;
    )");
    stmt.bind_text(1, to_string(status));
    stmt.bind_text(2, last_error);
    stmt.bind_int64(3, count_attempt ? 1 : 0);
    stmt.bind_int64(4, now_ms());
    stmt.bind_text(5, transfer_id);
    stmt.bind_text(6, to_string(expected));
    stmt.run();
    return stmt.changes() == 1;
}

std::vector<Transfer> LedgerStore::get_open_credit_transfers(int limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(R"(
        SELECT {} FROM transfers
        WHERE kind != 'bet_debit' AND status IN ('pending', 'sent', 'failed')
        ORDER BY created_at LIMIT ?;
    )", kTransferColumns));
    stmt.bind_int64(1, limit);

    std::vector<Transfer> transfers;
    while (stmt.step()) {
        transfers.push_back(read_transfer(stmt));
    }
    return transfers;
}

std::vector<Transfer> LedgerStore::get_stale_debit_intents(int64_t created_before, int limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, fmt::format(R"(
        SELECT {} FROM transfers
        WHERE kind = 'bet_debit' AND status = 'pending' AND created_at < ?
        ORDER BY created_at LIMIT ?;
    )", kTransferColumns));
    stmt.bind_int64(1, created_before);
    stmt.bind_int64(2, limit);

    std::vector<Transfer> transfers;
    while (stmt.step()) {
        transfers.push_back(read_transfer(stmt));
    }
    return transfers;
}

// ============================================================================
// LEDGER ACCOUNTS
// ============================================================================

std::optional<AccountBalance> LedgerStore::get_account(const std::string& account_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, "SELECT account_id, balance, updated_at FROM accounts WHERE account_id = ?;");
    stmt.bind_text(1, account_id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    AccountBalance account;
    account.account_id = stmt.get_text(0);
    account.balance = Amount::from_micros(stmt.get_int64(1));
    account.updated_at = stmt.get_int64(2);
    return account;
}

void LedgerStore::upsert_account(const std::string& account_id, Amount balance) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, R"(
        INSERT INTO accounts (account_id, balance, updated_at) VALUES (?, ?, ?)
        ON CONFLICT(account_id) DO UPDATE SET
            balance = excluded.balance,
            updated_at = excluded.updated_at;
    )");
    stmt.bind_text(1, account_id);
    stmt.bind_int64(2, balance.micros());
    stmt.bind_int64(3, now_ms());
    stmt.run();
}

std::optional<std::string> LedgerStore::get_wallet_operation(const std::string& idempotency_key) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, "SELECT result FROM wallet_operations WHERE idempotency_key = ?;");
    stmt.bind_text(1, idempotency_key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return stmt.get_text(0);
}

void LedgerStore::insert_wallet_operation(const std::string& idempotency_key,
                                          const std::string& account_id,
                                          const std::string& operation, Amount amount,
                                          const std::string& result) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, R"(
        INSERT INTO wallet_operations (idempotency_key, account_id, operation, amount, result, created_at)
        VALUES (?, ?, ?, ?, ?, ?);
    )");
    stmt.bind_text(1, idempotency_key);
    stmt.bind_text(2, account_id);
    stmt.bind_text(3, operation);
    stmt.bind_int64(4, amount.micros());
    stmt.bind_text(5, result);
    stmt.bind_int64(6, now_ms());
    stmt.run();
}

} // namespace settle
