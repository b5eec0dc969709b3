#include "core/engine.hpp"
#include "common/errors.hpp"
#include "wallet/http_wallet_client.hpp"
#include "wallet/retrying_wallet.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>

namespace settle {

Engine::Engine(const Config& config, std::shared_ptr<WalletService> wallet)
    : config_(config)
    , store_(config_.db_path)
    , pools_(store_)
    , wallet_(make_wallet(std::move(wallet)))
    , bets_(store_, pools_, *wallet_, config_)
    , resolution_(store_, pools_, config_)
    , claims_(store_, *wallet_)
    , reconciler_(store_, *wallet_, config_.reconciler)
{
    spdlog::info("Engine ready: db={} wallet={} fees={}/{} bps",
                 config_.db_path, config_.wallet.mode,
                 config_.fees.platform_fee_bps, config_.fees.creator_fee_bps);
}

Engine::~Engine() {
    reconciler_.stop();
}

std::shared_ptr<WalletService> Engine::make_wallet(std::shared_ptr<WalletService> injected) {
    if (injected) {
        return injected;
    }

    if (config_.wallet.mode == "http") {
        RetryingWallet::Policy policy;
        policy.max_attempts = config_.wallet.max_attempts;
        policy.backoff_initial_ms = config_.wallet.backoff_initial_ms;
        policy.backoff_max_ms = config_.wallet.backoff_max_ms;
        return std::make_shared<RetryingWallet>(
            std::make_shared<HttpWalletClient>(config_.wallet), policy);
    }

    ledger_wallet_ = std::make_shared<LedgerWallet>(store_);
    return ledger_wallet_;
}

Market Engine::create_market(const CreateMarketRequest& request) {
    if (request.title.empty()) {
        throw InvalidRequestError("Market title is required");
    }
    if (request.creator_id.empty()) {
        throw InvalidRequestError("Market creator is required");
    }

    int64_t created = now_ms();
    int64_t earliest_end = created + config_.markets.min_duration_seconds * 1000;
    if (request.end_date < earliest_end) {
        throw InvalidRequestError("endDate must be at least " +
                                  time_utils::format_duration(std::chrono::seconds(config_.markets.min_duration_seconds)) +
                                  " in the future");
    }

    Amount seed = request.seed_liquidity.value_or(config_.markets.seed_liquidity);
    if (!seed.is_positive()) {
        throw InvalidAmountError("Seed liquidity must be positive");
    }

    int64_t platform_bps = request.platform_fee_bps.value_or(config_.fees.platform_fee_bps);
    int64_t creator_bps = request.creator_fee_bps.value_or(config_.fees.creator_fee_bps);
    if (platform_bps < 0 || creator_bps < 0 || platform_bps > 10000 || creator_bps > 10000 ||
        platform_bps + creator_bps >= 10000) {
        throw InvalidRequestError("Fee rates must be non-negative and sum to less than 10000 bps");
    }

    Market market;
    market.market_id = generate_uuid();
    market.title = request.title;
    market.category_id = request.category_id;
    market.creator_id = request.creator_id;
    market.yes_pool = seed;
    market.no_pool = seed;
    market.seed_liquidity = seed;
    market.end_date = request.end_date;
    market.created_at = created;
    market.platform_fee_bps = request.platform_fee_bps;
    market.creator_fee_bps = request.creator_fee_bps;

    store_.insert_market(market);
    SETTLE_COUNTER("markets_created").increment();
    spdlog::info("Market {} created by {}: '{}' closes {}", market.market_id, market.creator_id,
                 market.title, time_utils::to_iso8601(market.end_date));
    return market;
}

Amount Engine::deposit(const std::string& account_id, Amount amount, const std::string& idempotency_key) {
    if (!ledger_wallet_) {
        throw InvalidRequestError("Funding is only available with the ledger wallet");
    }
    if (account_id.empty()) {
        throw InvalidRequestError("Account id is required");
    }
    return ledger_wallet_->deposit(account_id, amount, idempotency_key);
}

} // namespace settle
