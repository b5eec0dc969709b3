#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "core/engine.hpp"
#include "api/api_router.hpp"
#include "api/http_server.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

using namespace settle;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

Config load_config(const std::string& path) {
    Config config;
    if (std::filesystem::exists(path)) {
        config = Config::load(path);
    } else {
        std::cerr << "Config " << path << " not found, using defaults\n";
    }
    config.apply_env_overrides();
    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration");
    }
    return config;
}

int run_server(Engine& engine) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    api::ApiRouter router(engine);
    api::HttpServer server(router, engine.config().server);
    server.start();

    if (engine.config().reconciler.enabled) {
        engine.reconciler().start();
    }

    spdlog::info("settled running; Ctrl+C to stop");
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutdown signal received");
    server.stop();
    engine.reconciler().stop();
    return 0;
}

void print_market(const Market& m) {
    std::cout << "Market created\n"
              << "  id:        " << m.market_id << "\n"
              << "  title:     " << m.title << "\n"
              << "  creator:   " << m.creator_id << "\n"
              << "  seed:      " << m.seed_liquidity.to_string() << " per side\n"
              << "  closes:    " << time_utils::to_iso8601(m.end_date) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"settled - prediction market settlement engine"};
    app.require_subcommand(0, 1);

    std::string config_path = "configs/settled.json";
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_flag("-v,--version", show_version, "Show version information");

    app.add_subcommand("serve", "Run the HTTP API and reconciler (default)");

    CreateMarketRequest market_req;
    std::string end_date;
    std::string seed;
    auto* create_cmd = app.add_subcommand("create-market", "Create a market");
    create_cmd->add_option("--title", market_req.title, "Market title")->required();
    create_cmd->add_option("--creator", market_req.creator_id, "Creator user id")->required();
    create_cmd->add_option("--end-date", end_date, "Close time, ISO 8601 UTC")->required();
    create_cmd->add_option("--category", market_req.category_id, "Category id");
    create_cmd->add_option("--seed", seed, "Seed liquidity per side");

    std::string fund_account;
    std::string fund_amount;
    std::string fund_key;
    auto* fund_cmd = app.add_subcommand("fund", "Deposit into a ledger wallet account");
    fund_cmd->add_option("--account", fund_account, "Account id")->required();
    fund_cmd->add_option("--amount", fund_amount, "Amount, decimal")->required();
    fund_cmd->add_option("--key", fund_key, "Idempotency key (generated if omitted)");

    bool audit_after = false;
    auto* reconcile_cmd = app.add_subcommand("reconcile", "Run one reconciliation pass and exit");
    reconcile_cmd->add_flag("--audit", audit_after, "Also audit ledger invariants");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "settled v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    Config config;
    try {
        config = load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    setup_logging(config.logging, "settled");

    try {
        Engine engine(config);

        if (create_cmd->parsed()) {
            market_req.end_date = time_utils::from_iso8601(end_date);
            if (!seed.empty()) {
                market_req.seed_liquidity = Amount::parse(seed);
            }
            print_market(engine.create_market(market_req));
            return 0;
        }

        if (fund_cmd->parsed()) {
            std::string key = fund_key.empty() ? "deposit:" + generate_uuid() : fund_key;
            Amount balance = engine.deposit(fund_account, Amount::parse(fund_amount), key);
            std::cout << fund_account << " balance: " << balance.to_string() << "\n";
            return 0;
        }

        if (reconcile_cmd->parsed()) {
            ReconcileRunResult result = engine.reconciler().run_once();
            std::cout << result.summary() << "\n";
            if (audit_after) {
                AuditResult audit = engine.reconciler().audit();
                std::cout << audit.summary() << "\n";
                return audit.has_critical_discrepancies() ? 2 : 0;
            }
            return result.stuck > 0 ? 2 : 0;
        }

        return run_server(engine);
    } catch (const SettlementError& e) {
        spdlog::error("{} [{}]", e.what(), to_string(e.code()));
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
}
