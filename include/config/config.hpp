#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace settle {

struct FeeConfig {
    int64_t platform_fee_bps{200};           // 2% of gross to the platform
    int64_t creator_fee_bps{1000};           // 10% of gross to the market creator
    std::string platform_account{"platform"};
};

struct MarketDefaults {
    Amount seed_liquidity{Amount::from_units(1000)};  // Seeded on each side
    int64_t min_duration_seconds{60};                  // endDate must be at least this far out
};

struct WalletConfig {
    std::string mode{"ledger"};              // ledger, http
    std::string base_url{"http://127.0.0.1:9090"};
    std::string api_key;
    std::string api_secret;
    int timeout_ms{5000};
    int max_attempts{3};                     // Per call, same idempotency key
    int backoff_initial_ms{100};
    int backoff_max_ms{2000};

    // Longest a single wallet call can take: every attempt timing out plus backoff
    int64_t worst_case_call_ms() const;
};

struct ServerConfig {
    std::string bind_address{"0.0.0.0"};
    int port{8080};
    int threads{4};
};

struct ReconcilerConfig {
    bool enabled{true};
    int interval_seconds{30};
    int64_t debit_grace_ms{60000};           // Age before an unconfirmed debit intent is voided
    int max_attempts{10};                    // Transfers beyond this need an operator
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    std::string db_path{"./data/settle.db"};
    std::vector<std::string> admin_users;    // May resolve any market

    FeeConfig fees;
    MarketDefaults markets;
    WalletConfig wallet;
    ServerConfig server;
    ReconcilerConfig reconciler;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // SETTLE_DB_PATH, SETTLE_WALLET_API_KEY, SETTLE_WALLET_API_SECRET
    void apply_env_overrides();

    bool is_admin(const std::string& user_id) const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace settle
