#include "settlement/claim_processor.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <map>

namespace settle {

ClaimProcessor::ClaimProcessor(LedgerStore& store, WalletService& wallet)
    : store_(store)
    , wallet_(wallet)
{
}

Amount ClaimProcessor::quote_payout(const Bet& bet, const Market& market) {
    if (market.status != MarketStatus::RESOLVED || !market.outcome || *market.outcome != bet.side) {
        return Amount::zero();
    }
    return bet.net_stake.div_price(bet.price);
}

Bet ClaimProcessor::load_owned_bet(const std::string& bet_id, const std::string& requester_id) {
    auto bet = store_.get_bet(bet_id);
    if (!bet) {
        throw BetNotFoundError(bet_id);
    }
    if (bet->user_id != requester_id) {
        throw ForbiddenError("Bet " + bet_id + " belongs to another user");
    }
    return *bet;
}

PayoutResult ClaimProcessor::claim(const std::string& bet_id, const std::string& requester_id) {
    Bet bet = load_owned_bet(bet_id, requester_id);

    auto market = store_.get_market(bet.market_id);
    if (!market) {
        throw MarketNotFoundError(bet.market_id);
    }
    if (market->status != MarketStatus::RESOLVED) {
        throw NotResolvedError(bet.market_id);
    }
    if (bet.claimed) {
        throw AlreadyClaimedError(bet_id);
    }

    PayoutResult result;
    result.bet_id = bet_id;
    result.market_id = bet.market_id;
    result.user_id = bet.user_id;
    result.payout = quote_payout(bet, *market);
    result.won = result.payout.is_positive();
    result.idempotency_key = transfer_key(bet_id, TransferKind::PAYOUT);

    {
        LedgerStore::Transaction tx(store_);
        TransferStatus initial = result.won ? TransferStatus::PENDING : TransferStatus::NONE;
        if (!store_.claim_bet_if_unclaimed(bet_id, result.payout, initial, now_ms())) {
            throw AlreadyClaimedError(bet_id);
        }

        if (result.won) {
            Transfer t;
            t.transfer_id = result.idempotency_key;
            t.bet_id = bet_id;
            t.account_id = bet.user_id;
            t.kind = TransferKind::PAYOUT;
            t.amount = result.payout;
            t.status = TransferStatus::PENDING;
            t.created_at = now_ms();
            t.updated_at = t.created_at;
            store_.insert_transfer(t);
        }
        tx.commit();
    }

    SETTLE_COUNTER("claims").increment();

    if (!result.won) {
        result.transfer_status = TransferStatus::NONE;
        spdlog::info("Bet {} claimed: lost, nothing to pay", bet_id);
        return result;
    }

    return deliver_payout(std::move(result));
}

PayoutResult ClaimProcessor::retry_transfer(const std::string& bet_id, const std::string& requester_id) {
    Bet bet = load_owned_bet(bet_id, requester_id);
    if (!bet.claimed) {
        return claim(bet_id, requester_id);
    }

    PayoutResult result;
    result.bet_id = bet_id;
    result.market_id = bet.market_id;
    result.user_id = bet.user_id;
    result.payout = bet.payout.value_or(Amount::zero());
    result.won = result.payout.is_positive();
    result.idempotency_key = transfer_key(bet_id, TransferKind::PAYOUT);

    auto transfer = store_.get_transfer(result.idempotency_key);
    if (!transfer) {
        result.transfer_status = TransferStatus::NONE;
        return result;
    }
    if (transfer->status == TransferStatus::CONFIRMED) {
        result.transfer_status = TransferStatus::CONFIRMED;
        return result;
    }

    spdlog::info("Retrying payout {} (attempt {})", result.idempotency_key, transfer->attempts + 1);
    return deliver_payout(std::move(result));
}

PayoutResult ClaimProcessor::deliver_payout(PayoutResult result) {
    const std::string& key = result.idempotency_key;

    CreditResult credit = CreditResult::FAILED;
    try {
        credit = wallet_.credit(result.user_id, result.payout, key);
    } catch (const WalletUnavailableError& e) {
        store_.update_transfer_status(key, TransferStatus::PENDING, e.what(), true);
        SETTLE_COUNTER("payouts_pending").increment();
        spdlog::error("Payout {} unresolved: {}", key, e.what());
        throw SettlementPendingError(key, "Payout recorded; wallet credit outcome unknown");
    }

    TransferStatus status = transfer_status_for(credit);
    {
        LedgerStore::Transaction tx(store_);
        store_.update_transfer_status(key, status,
                                      credit == CreditResult::FAILED ? "wallet rejected credit" : "",
                                      true);
        store_.update_payout_status(result.bet_id, status);
        tx.commit();
    }

    if (credit == CreditResult::FAILED) {
        SETTLE_COUNTER("payouts_failed").increment();
        spdlog::error("Payout {} rejected by wallet", key);
        throw SettlementPendingError(key, "Payout recorded; wallet rejected the credit, retry with the token");
    }

    result.transfer_status = status;
    SETTLE_COUNTER("payout_volume_micros").increment(result.payout.micros());
    spdlog::info("Bet {} paid {} to {} ({})", result.bet_id, result.payout.to_string(),
                 result.user_id, to_string(status));
    return result;
}

UnclaimedWinnings ClaimProcessor::unclaimed_winnings(const std::string& user_id) {
    UnclaimedWinnings summary;
    summary.user_id = user_id;

    std::map<std::string, Market> markets;
    for (auto& bet : store_.get_unclaimed_winning_bets(user_id)) {
        auto it = markets.find(bet.market_id);
        if (it == markets.end()) {
            auto market = store_.get_market(bet.market_id);
            if (!market) continue;
            it = markets.emplace(bet.market_id, std::move(*market)).first;
        }

        Amount payout = quote_payout(bet, it->second);
        if (!payout.is_positive()) continue;

        summary.total += payout;
        summary.bets.push_back({std::move(bet), payout});
    }
    return summary;
}

} // namespace settle
