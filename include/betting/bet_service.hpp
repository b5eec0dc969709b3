#pragma once

#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/ledger_store.hpp"
#include "pricing/pool_manager.hpp"
#include "wallet/wallet_service.hpp"

namespace settle {

/**
 * Executes bets: validates, prices, takes fees, debits the wallet and
 * commits pools and the bet record as one unit under the market lock.
 *
 * The debit is preceded by a persisted bet_debit intent so that a crash or
 * an ambiguous wallet response can be voided by the reconciler. A bet whose
 * persistence fails after a successful debit is refunded with
 * "<betId>:refund".
 */
class BetService {
public:
    BetService(LedgerStore& store, PoolManager& pools, WalletService& wallet,
               const Config& config);

    // Throws InvalidAmountError, MarketNotFoundError, MarketClosedError,
    // InsufficientFundsError, AmountTooSmallError, SettlementPendingError.
    Bet place_bet(const std::string& market_id, const std::string& user_id,
                  Side side, Amount gross_amount);

private:
    LedgerStore& store_;
    PoolManager& pools_;
    WalletService& wallet_;
    const Config& config_;

    Transfer make_transfer(const std::string& bet_id, TransferKind kind,
                           const std::string& account_id, Amount amount) const;

    void refund_debit(const Bet& bet, const std::string& reason);
    void credit_fees(const Bet& bet, const std::string& creator_id);
    void mark_transfer(const std::string& transfer_id, TransferStatus status,
                       const std::string& error, bool count_attempt);
};

} // namespace settle
