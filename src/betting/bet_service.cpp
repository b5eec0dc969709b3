#include "betting/bet_service.hpp"
#include "betting/fees.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace settle {

BetService::BetService(LedgerStore& store, PoolManager& pools, WalletService& wallet,
                       const Config& config)
    : store_(store)
    , pools_(pools)
    , wallet_(wallet)
    , config_(config)
{
}

Transfer BetService::make_transfer(const std::string& bet_id, TransferKind kind,
                                   const std::string& account_id, Amount amount) const {
    Transfer t;
    t.transfer_id = transfer_key(bet_id, kind);
    t.bet_id = bet_id;
    t.account_id = account_id;
    t.kind = kind;
    t.amount = amount;
    t.status = TransferStatus::PENDING;
    t.created_at = now_ms();
    t.updated_at = t.created_at;
    return t;
}

Bet BetService::place_bet(const std::string& market_id, const std::string& user_id,
                          Side side, Amount gross_amount) {
    ScopedLatency latency(SETTLE_HISTOGRAM("place_bet"));

    if (!gross_amount.is_positive()) {
        throw InvalidAmountError("Bet amount must be positive, got " + gross_amount.to_string());
    }
    if (user_id.empty()) {
        throw InvalidRequestError("user_id is required");
    }

    Bet bet;
    std::string creator_id;

    {
        auto held = pools_.lock(market_id);
        const Market& market = held.market();

        int64_t now = now_ms();
        if (market.status != MarketStatus::OPEN) {
            throw MarketClosedError("Market is resolved: " + market_id);
        }
        if (now >= market.end_date) {
            throw MarketClosedError("Market has ended: " + market_id);
        }

        Amount available = wallet_.balance(user_id);
        if (available < gross_amount) {
            throw InsufficientFundsError(fmt::format(
                "Balance {} is below bet amount {}", available.to_string(), gross_amount.to_string()));
        }

        auto fees = compute_fees(gross_amount, fee_schedule_for(market, config_.fees));
        if (!fees.net_stake.is_positive()) {
            throw AmountTooSmallError(fmt::format(
                "Bet amount {} leaves no stake after fees", gross_amount.to_string()));
        }

        bet.bet_id = generate_uuid();
        bet.market_id = market_id;
        bet.user_id = user_id;
        bet.side = side;
        bet.gross_amount = gross_amount;
        bet.platform_fee = fees.platform_fee;
        bet.creator_fee = fees.creator_fee;
        bet.net_stake = fees.net_stake;
        bet.price = held.price(side);
        bet.created_at = now;
        creator_id = market.creator_id;

        // Intent first, so an interrupted debit is always discoverable
        std::string debit_key = transfer_key(bet.bet_id, TransferKind::BET_DEBIT);
        store_.insert_transfer(make_transfer(bet.bet_id, TransferKind::BET_DEBIT, user_id, gross_amount));

        DebitResult debit = DebitResult::INSUFFICIENT;
        try {
            debit = wallet_.debit(user_id, gross_amount, debit_key);
        } catch (const WalletUnavailableError& e) {
            mark_transfer(debit_key, TransferStatus::PENDING, e.what(), true);
            SETTLE_COUNTER("bets_pending").increment();
            spdlog::error("Debit for bet {} unresolved: {}", bet.bet_id, e.what());
            throw SettlementPendingError(debit_key,
                "Wallet debit outcome unknown; the bet was not placed and any debit will be reversed");
        }

        if (debit == DebitResult::INSUFFICIENT) {
            mark_transfer(debit_key, TransferStatus::FAILED, "insufficient funds", true);
            throw InsufficientFundsError("Wallet rejected debit of " + gross_amount.to_string());
        }

        bool intent_voided = false;
        try {
            LedgerStore::Transaction tx(store_);
            // The reconciler may have reversed a slow intent; it owns the refund then
            if (!store_.update_transfer_status_if(debit_key, TransferStatus::PENDING,
                                                  TransferStatus::CONFIRMED, "", true)) {
                intent_voided = true;
            } else {
                held.apply_stake(side, bet.net_stake, gross_amount);
                store_.insert_bet(bet);
                if (bet.platform_fee.is_positive()) {
                    store_.insert_transfer(make_transfer(bet.bet_id, TransferKind::PLATFORM_FEE,
                                                         config_.fees.platform_account, bet.platform_fee));
                }
                if (bet.creator_fee.is_positive()) {
                    store_.insert_transfer(make_transfer(bet.bet_id, TransferKind::CREATOR_FEE,
                                                         creator_id, bet.creator_fee));
                }
                tx.commit();
            }
        } catch (const std::exception& e) {
            spdlog::error("Bet {} failed to commit after debit: {}", bet.bet_id, e.what());
            refund_debit(bet, e.what());
            throw;
        }

        if (intent_voided) {
            SETTLE_COUNTER("bets_voided").increment();
            spdlog::error("Debit intent {} was reversed before bet {} committed",
                          debit_key, bet.bet_id);
            throw SettlementPendingError(debit_key,
                "Wallet debit was reversed by reconciliation; the bet was not placed");
        }

        held.commit();
    }

    SETTLE_COUNTER("bets_placed").increment();
    SETTLE_COUNTER("bet_volume_micros").increment(gross_amount.micros());
    spdlog::info("Bet {} placed: market={} user={} side={} gross={} net={} price={}",
                 bet.bet_id, market_id, user_id, to_string(side),
                 gross_amount.to_string(), bet.net_stake.to_string(), bet.price.to_string());

    credit_fees(bet, creator_id);
    return bet;
}

void BetService::refund_debit(const Bet& bet, const std::string& reason) {
    std::string debit_key = transfer_key(bet.bet_id, TransferKind::BET_DEBIT);
    std::string refund_key = transfer_key(bet.bet_id, TransferKind::DEBIT_REFUND);

    try {
        store_.insert_transfer(make_transfer(bet.bet_id, TransferKind::DEBIT_REFUND,
                                             bet.user_id, bet.gross_amount));
    } catch (const StorageError& e) {
        // The intent is still pending; the reconciler will void it with the same key
        spdlog::error("Could not record refund for bet {}: {}", bet.bet_id, e.what());
        return;
    }

    try {
        CreditResult result = wallet_.credit(bet.user_id, bet.gross_amount, refund_key);
        mark_transfer(refund_key, transfer_status_for(result),
                      result == CreditResult::FAILED ? "wallet rejected refund" : "", true);
    } catch (const WalletUnavailableError& e) {
        mark_transfer(refund_key, TransferStatus::PENDING, e.what(), true);
        spdlog::error("Refund {} left for reconciliation: {}", refund_key, e.what());
    }

    mark_transfer(debit_key, TransferStatus::REVERSED, reason, false);
    SETTLE_COUNTER("debits_refunded").increment();
}

void BetService::credit_fees(const Bet& bet, const std::string& creator_id) {
    struct FeeCredit {
        TransferKind kind;
        std::string account;
        Amount amount;
    };
    const FeeCredit credits[] = {
        {TransferKind::PLATFORM_FEE, config_.fees.platform_account, bet.platform_fee},
        {TransferKind::CREATOR_FEE, creator_id, bet.creator_fee}
    };

    for (const auto& c : credits) {
        if (!c.amount.is_positive()) continue;

        std::string key = transfer_key(bet.bet_id, c.kind);
        try {
            CreditResult result = wallet_.credit(c.account, c.amount, key);
            mark_transfer(key, transfer_status_for(result),
                          result == CreditResult::FAILED ? "wallet rejected credit" : "", true);
        } catch (const WalletUnavailableError& e) {
            mark_transfer(key, TransferStatus::PENDING, e.what(), true);
            spdlog::warn("Fee credit {} deferred to reconciler: {}", key, e.what());
        }
    }
}

void BetService::mark_transfer(const std::string& transfer_id, TransferStatus status,
                               const std::string& error, bool count_attempt) {
    try {
        store_.update_transfer_status(transfer_id, status, error, count_attempt);
    } catch (const StorageError& e) {
        spdlog::error("Failed to record transfer {} as {}: {}",
                      transfer_id, to_string(status), e.what());
    }
}

} // namespace settle
