#include <iostream>
#include <iomanip>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "config/config.hpp"
#include "persistence/ledger_store.hpp"
#include "wallet/ledger_wallet.hpp"
#include "settlement/reconciler.hpp"
#include "pricing/pool_manager.hpp"
#include "utils/logging.hpp"

using namespace settle;

namespace {

void print_markets(LedgerStore& store) {
    std::cout << "════════════════════════════════════════════════════════════════════════\n";
    std::cout << std::left << std::setw(38) << "MARKET" << std::setw(10) << "STATUS"
              << std::setw(8) << "BETS" << std::setw(12) << "YES" << "VOLUME\n";
    std::cout << "────────────────────────────────────────────────────────────────────────\n";
    for (const auto& m : store.list_markets(1000)) {
        std::cout << std::left << std::setw(38) << m.market_id
                  << std::setw(10) << to_string(m.status)
                  << std::setw(8) << m.bet_count
                  << std::setw(12) << price_for(m.yes_pool, m.no_pool, Side::YES).to_string()
                  << m.total_volume.to_string() << "\n";
    }
    std::cout << "════════════════════════════════════════════════════════════════════════\n";
}

nlohmann::json to_json(const AuditResult& result) {
    nlohmann::json discrepancies = nlohmann::json::array();
    for (const auto& d : result.discrepancies) {
        discrepancies.push_back({
            {"type", to_string(d.type)},
            {"id", d.identifier},
            {"expected", d.expected},
            {"actual", d.actual},
            {"critical", d.is_critical}
        });
    }
    return {
        {"marketsChecked", result.markets_checked},
        {"betsChecked", result.bets_checked},
        {"consistent", result.is_consistent()},
        {"discrepancies", std::move(discrepancies)}
    };
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"settle_audit - verify ledger invariants of a settlement database"};

    std::string config_path = "configs/settled.json";
    std::string db_path;
    bool json_output = false;
    bool list = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-d,--db", db_path, "Database path (overrides config)");
    app.add_flag("--json", json_output, "Print the report as JSON");
    app.add_flag("-l,--list", list, "List markets before auditing");

    CLI11_PARSE(app, argc, argv);

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }
    config.apply_env_overrides();
    if (!db_path.empty()) {
        config.db_path = db_path;
    }

    config.logging.log_to_file = false;
    if (json_output) {
        config.logging.log_level = "error";
    }
    setup_logging(config.logging, "settle_audit");

    if (!std::filesystem::exists(config.db_path)) {
        std::cerr << "Database not found: " << config.db_path << "\n";
        return 1;
    }

    try {
        LedgerStore store(config.db_path);
        LedgerWallet wallet(store);
        Reconciler reconciler(store, wallet, config.reconciler);

        if (list && !json_output) {
            print_markets(store);
        }

        AuditResult result = reconciler.audit();
        if (json_output) {
            std::cout << to_json(result).dump(2) << "\n";
        } else {
            std::cout << result.summary() << "\n";
        }
        return result.has_critical_discrepancies() ? 2 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Audit failed: {}", e.what());
        return 1;
    }
}
