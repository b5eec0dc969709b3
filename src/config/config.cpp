#include "config/config.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace settle {

namespace {

// Amounts are written as decimal strings; numbers are accepted on input.
Amount amount_from_json(const nlohmann::json& j) {
    if (j.is_string()) return Amount::parse(j.get<std::string>());
    return Amount::from_double(j.get<double>());
}

} // namespace

void to_json(nlohmann::json& j, const FeeConfig& c) {
    j = nlohmann::json{
        {"platform_fee_bps", c.platform_fee_bps},
        {"creator_fee_bps", c.creator_fee_bps},
        {"platform_account", c.platform_account}
    };
}

void from_json(const nlohmann::json& j, FeeConfig& c) {
    if (j.contains("platform_fee_bps")) j.at("platform_fee_bps").get_to(c.platform_fee_bps);
    if (j.contains("creator_fee_bps")) j.at("creator_fee_bps").get_to(c.creator_fee_bps);
    if (j.contains("platform_account")) j.at("platform_account").get_to(c.platform_account);
}

void to_json(nlohmann::json& j, const MarketDefaults& c) {
    j = nlohmann::json{
        {"seed_liquidity", c.seed_liquidity.to_string()},
        {"min_duration_seconds", c.min_duration_seconds}
    };
}

void from_json(const nlohmann::json& j, MarketDefaults& c) {
    if (j.contains("seed_liquidity")) c.seed_liquidity = amount_from_json(j.at("seed_liquidity"));
    if (j.contains("min_duration_seconds")) j.at("min_duration_seconds").get_to(c.min_duration_seconds);
}

void to_json(nlohmann::json& j, const WalletConfig& c) {
    // Credentials are never written back to disk
    j = nlohmann::json{
        {"mode", c.mode},
        {"base_url", c.base_url},
        {"timeout_ms", c.timeout_ms},
        {"max_attempts", c.max_attempts},
        {"backoff_initial_ms", c.backoff_initial_ms},
        {"backoff_max_ms", c.backoff_max_ms}
    };
}

void from_json(const nlohmann::json& j, WalletConfig& c) {
    if (j.contains("mode")) j.at("mode").get_to(c.mode);
    if (j.contains("base_url")) j.at("base_url").get_to(c.base_url);
    if (j.contains("api_key")) j.at("api_key").get_to(c.api_key);
    if (j.contains("api_secret")) j.at("api_secret").get_to(c.api_secret);
    if (j.contains("timeout_ms")) j.at("timeout_ms").get_to(c.timeout_ms);
    if (j.contains("max_attempts")) j.at("max_attempts").get_to(c.max_attempts);
    if (j.contains("backoff_initial_ms")) j.at("backoff_initial_ms").get_to(c.backoff_initial_ms);
    if (j.contains("backoff_max_ms")) j.at("backoff_max_ms").get_to(c.backoff_max_ms);
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = nlohmann::json{
        {"bind_address", c.bind_address},
        {"port", c.port},
        {"threads", c.threads}
    };
}

void from_json(const nlohmann::json& j, ServerConfig& c) {
    if (j.contains("bind_address")) j.at("bind_address").get_to(c.bind_address);
    if (j.contains("port")) j.at("port").get_to(c.port);
    if (j.contains("threads")) j.at("threads").get_to(c.threads);
}

void to_json(nlohmann::json& j, const ReconcilerConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"interval_seconds", c.interval_seconds},
        {"debit_grace_ms", c.debit_grace_ms},
        {"max_attempts", c.max_attempts}
    };
}

void from_json(const nlohmann::json& j, ReconcilerConfig& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("interval_seconds")) j.at("interval_seconds").get_to(c.interval_seconds);
    if (j.contains("debit_grace_ms")) j.at("debit_grace_ms").get_to(c.debit_grace_ms);
    if (j.contains("max_attempts")) j.at("max_attempts").get_to(c.max_attempts);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"db_path", c.db_path},
        {"admin_users", c.admin_users},
        {"fees", c.fees},
        {"markets", c.markets},
        {"wallet", c.wallet},
        {"server", c.server},
        {"reconciler", c.reconciler},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("db_path")) j.at("db_path").get_to(c.db_path);
    if (j.contains("admin_users")) j.at("admin_users").get_to(c.admin_users);
    if (j.contains("fees")) j.at("fees").get_to(c.fees);
    if (j.contains("markets")) j.at("markets").get_to(c.markets);
    if (j.contains("wallet")) j.at("wallet").get_to(c.wallet);
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("reconciler")) j.at("reconciler").get_to(c.reconciler);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

int64_t WalletConfig::worst_case_call_ms() const {
    int64_t total = static_cast<int64_t>(timeout_ms) * max_attempts;
    for (int attempt = 0; attempt + 1 < max_attempts; attempt++) {
        total += time_utils::backoff_delay(attempt, backoff_initial_ms, backoff_max_ms).count();
    }
    return total;
}

bool Config::validate() const {
    if (db_path.empty()) {
        spdlog::error("db_path must not be empty");
        return false;
    }

    if (fees.platform_fee_bps < 0 || fees.creator_fee_bps < 0) {
        spdlog::error("Fee rates must be non-negative");
        return false;
    }

    if (fees.platform_fee_bps > 10000 || fees.creator_fee_bps > 10000 ||
        fees.platform_fee_bps + fees.creator_fee_bps >= 10000) {
        spdlog::error("Combined fee rate must be below 100%");
        return false;
    }

    if (fees.platform_account.empty()) {
        spdlog::error("fees.platform_account must not be empty");
        return false;
    }

    if (!markets.seed_liquidity.is_positive()) {
        spdlog::error("markets.seed_liquidity must be positive");
        return false;
    }

    if (wallet.mode != "ledger" && wallet.mode != "http") {
        spdlog::error("wallet.mode must be 'ledger' or 'http', got '{}'", wallet.mode);
        return false;
    }

    if (wallet.max_attempts < 1 || wallet.timeout_ms <= 0) {
        spdlog::error("wallet.max_attempts must be >= 1 and wallet.timeout_ms positive");
        return false;
    }

    if (server.port <= 0 || server.port > 65535 || server.threads < 1) {
        spdlog::error("server.port must be in 1..65535 and server.threads >= 1");
        return false;
    }

    if (reconciler.interval_seconds < 1) {
        spdlog::error("reconciler.interval_seconds must be >= 1");
        return false;
    }

    if (reconciler.debit_grace_ms <= wallet.worst_case_call_ms()) {
        spdlog::error("reconciler.debit_grace_ms ({}) must exceed the worst-case wallet call ({}ms)",
                      reconciler.debit_grace_ms, wallet.worst_case_call_ms());
        return false;
    }

    if (admin_users.empty()) {
        spdlog::warn("No admin_users configured; only market creators can resolve");
    }

    return true;
}

void Config::apply_env_overrides() {
    db_path = get_env("SETTLE_DB_PATH", db_path);
    wallet.api_key = get_env("SETTLE_WALLET_API_KEY", wallet.api_key);
    wallet.api_secret = get_env("SETTLE_WALLET_API_SECRET", wallet.api_secret);
}

bool Config::is_admin(const std::string& user_id) const {
    return std::find(admin_users.begin(), admin_users.end(), user_id) != admin_users.end();
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace settle
