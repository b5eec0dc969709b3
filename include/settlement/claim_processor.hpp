#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "persistence/ledger_store.hpp"
#include "wallet/wallet_service.hpp"

namespace settle {

struct UnclaimedBet {
    Bet bet;
    Amount payout;
};

struct UnclaimedWinnings {
    std::string user_id;
    std::vector<UnclaimedBet> bets;
    Amount total;
};

/**
 * Pays out resolved bets at most once.
 *
 * The claimed flag, the frozen payout and a pending payout transfer are
 * committed together by a conditional update before the wallet is called,
 * so of any number of concurrent claims exactly one proceeds. The wallet
 * credit uses "<betId>:payout" on every attempt.
 */
class ClaimProcessor {
public:
    ClaimProcessor(LedgerStore& store, WalletService& wallet);

    // Throws BetNotFoundError, ForbiddenError, NotResolvedError,
    // AlreadyClaimedError, SettlementPendingError.
    PayoutResult claim(const std::string& bet_id, const std::string& requester_id);

    // Re-issues an unconfirmed payout credit; claims first if still unclaimed.
    PayoutResult retry_transfer(const std::string& bet_id, const std::string& requester_id);

    UnclaimedWinnings unclaimed_winnings(const std::string& user_id);

    // net_stake / price for a winning bet of a resolved market, zero otherwise.
    static Amount quote_payout(const Bet& bet, const Market& market);

private:
    LedgerStore& store_;
    WalletService& wallet_;

    Bet load_owned_bet(const std::string& bet_id, const std::string& requester_id);
    PayoutResult deliver_payout(PayoutResult result);
};

} // namespace settle
