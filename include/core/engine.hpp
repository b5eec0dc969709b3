#pragma once

#include <memory>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/ledger_store.hpp"
#include "pricing/pool_manager.hpp"
#include "wallet/wallet_service.hpp"
#include "wallet/ledger_wallet.hpp"
#include "betting/bet_service.hpp"
#include "resolution/resolution_service.hpp"
#include "settlement/claim_processor.hpp"
#include "settlement/reconciler.hpp"

namespace settle {

struct CreateMarketRequest {
    std::string title;
    std::string category_id;
    std::string creator_id;
    int64_t end_date{0};                     // Epoch ms
    std::optional<Amount> seed_liquidity;    // Defaults to markets.seed_liquidity
    std::optional<int64_t> platform_fee_bps;
    std::optional<int64_t> creator_fee_bps;
};

/**
 * Wires the settlement components together from a Config and owns them.
 * The wallet is built from wallet.mode unless one is injected.
 */
class Engine {
public:
    explicit Engine(const Config& config, std::shared_ptr<WalletService> wallet = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Throws InvalidRequestError, InvalidAmountError
    Market create_market(const CreateMarketRequest& request);

    // Operator funding; only available with the ledger wallet.
    Amount deposit(const std::string& account_id, Amount amount, const std::string& idempotency_key);

    const Config& config() const { return config_; }
    LedgerStore& store() { return store_; }
    PoolManager& pools() { return pools_; }
    WalletService& wallet() { return *wallet_; }
    BetService& bets() { return bets_; }
    ResolutionService& resolution() { return resolution_; }
    ClaimProcessor& claims() { return claims_; }
    Reconciler& reconciler() { return reconciler_; }

private:
    Config config_;
    LedgerStore store_;
    PoolManager pools_;
    std::shared_ptr<LedgerWallet> ledger_wallet_;   // Set in ledger mode
    std::shared_ptr<WalletService> wallet_;
    BetService bets_;
    ResolutionService resolution_;
    ClaimProcessor claims_;
    Reconciler reconciler_;

    std::shared_ptr<WalletService> make_wallet(std::shared_ptr<WalletService> injected);
};

} // namespace settle
