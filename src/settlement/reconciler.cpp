#include "settlement/reconciler.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <limits>

namespace settle {

std::string to_string(DiscrepancyType d) {
    switch (d) {
        case DiscrepancyType::POOL_CONSERVATION: return "POOL_CONSERVATION";
        case DiscrepancyType::VOLUME_MISMATCH: return "VOLUME_MISMATCH";
        case DiscrepancyType::BET_COUNT_MISMATCH: return "BET_COUNT_MISMATCH";
        case DiscrepancyType::FEE_CONSERVATION: return "FEE_CONSERVATION";
        case DiscrepancyType::FEE_TRANSFER_MISMATCH: return "FEE_TRANSFER_MISMATCH";
        case DiscrepancyType::RESOLVED_FLAG_MISMATCH: return "RESOLVED_FLAG_MISMATCH";
        case DiscrepancyType::REVERSED_DEBIT: return "REVERSED_DEBIT";
        case DiscrepancyType::TRANSFER_STUCK: return "TRANSFER_STUCK";
    }
    return "UNKNOWN";
}

bool AuditResult::has_critical_discrepancies() const {
    for (const auto& d : discrepancies) {
        if (d.is_critical) return true;
    }
    return false;
}

std::string AuditResult::summary() const {
    return fmt::format("Audit {}: {} markets, {} bets, {} discrepancies{}",
                       is_consistent() ? "CLEAN" : "DIRTY",
                       markets_checked, bets_checked, discrepancies.size(),
                       has_critical_discrepancies() ? " [CRITICAL]" : "");
}

std::string ReconcileRunResult::summary() const {
    return fmt::format(
        "credits retried={} confirmed={} failed={} unavailable={}; "
        "debits voided={} never_applied={} unavailable={}; stuck={}",
        credits_retried, credits_confirmed, credits_failed, credits_unavailable,
        debits_voided, debits_never_applied, debits_unavailable, stuck);
}

Reconciler::Reconciler(LedgerStore& store, WalletService& wallet, const ReconcilerConfig& config)
    : store_(store)
    , wallet_(wallet)
    , config_(config)
{
    spdlog::info("Reconciler initialized: interval={}s max_attempts={} debit_grace={}ms",
                 config_.interval_seconds, config_.max_attempts, config_.debit_grace_ms);
}

Reconciler::~Reconciler() {
    stop();
}

// ============================================================================
// RECONCILIATION PASS
// ============================================================================

ReconcileRunResult Reconciler::run_once() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    ScopedLatency latency(SETTLE_HISTOGRAM("reconcile_pass"));
    ReconcileRunResult result;

    for (const auto& transfer : store_.get_open_credit_transfers()) {
        if (transfer.attempts >= config_.max_attempts) {
            result.stuck++;
            spdlog::error("Transfer {} ({}, {} to {}) stuck after {} attempts: {}",
                          transfer.transfer_id, to_string(transfer.kind),
                          transfer.amount.to_string(), transfer.account_id,
                          transfer.attempts, transfer.last_error);
            continue;
        }
        retry_credit(transfer, result);
    }

    int64_t cutoff = now_ms() - config_.debit_grace_ms;
    for (const auto& intent : store_.get_stale_debit_intents(cutoff)) {
        void_debit_intent(intent, result);
    }

    SETTLE_GAUGE("transfers_stuck").set(result.stuck);
    if (result.credits_retried > 0 || result.debits_voided > 0 || result.debits_never_applied > 0 ||
        result.stuck > 0) {
        spdlog::info("Reconcile pass: {}", result.summary());
    }
    return result;
}

void Reconciler::retry_credit(const Transfer& transfer, ReconcileRunResult& result) {
    result.credits_retried++;

    CreditResult credit = CreditResult::FAILED;
    try {
        credit = wallet_.credit(transfer.account_id, transfer.amount, transfer.transfer_id);
    } catch (const WalletUnavailableError& e) {
        result.credits_unavailable++;
        store_.update_transfer_status(transfer.transfer_id, TransferStatus::PENDING, e.what(), true);
        spdlog::warn("Credit {} still unavailable: {}", transfer.transfer_id, e.what());
        return;
    }

    TransferStatus status = transfer_status_for(credit);
    {
        LedgerStore::Transaction tx(store_);
        store_.update_transfer_status(transfer.transfer_id, status,
                                      credit == CreditResult::FAILED ? "wallet rejected credit" : "",
                                      true);
        if (transfer.kind == TransferKind::PAYOUT) {
            store_.update_payout_status(transfer.bet_id, status);
        }
        tx.commit();
    }

    if (status == TransferStatus::CONFIRMED) {
        result.credits_confirmed++;
        SETTLE_COUNTER("reconciled_credits").increment();
        spdlog::info("Credit {} confirmed on attempt {}", transfer.transfer_id, transfer.attempts + 1);
    } else if (status == TransferStatus::FAILED) {
        result.credits_failed++;
        spdlog::warn("Credit {} rejected again (attempt {})", transfer.transfer_id, transfer.attempts + 1);
    }
}

void Reconciler::void_debit_intent(const Transfer& intent, ReconcileRunResult& result) {
    // A committed bet confirms its intent in the same transaction
    if (store_.get_bet(intent.bet_id)) {
        store_.update_transfer_status_if(intent.transfer_id, TransferStatus::PENDING,
                                         TransferStatus::CONFIRMED, "", false);
        return;
    }

    DebitResult debit = DebitResult::INSUFFICIENT;
    try {
        debit = wallet_.debit(intent.account_id, intent.amount, intent.transfer_id);
    } catch (const WalletUnavailableError& e) {
        result.debits_unavailable++;
        store_.update_transfer_status_if(intent.transfer_id, TransferStatus::PENDING,
                                         TransferStatus::PENDING, e.what(), true);
        spdlog::warn("Debit intent {} still unresolved: {}", intent.transfer_id, e.what());
        return;
    }

    if (debit == DebitResult::INSUFFICIENT) {
        if (store_.update_transfer_status_if(intent.transfer_id, TransferStatus::PENDING,
                                             TransferStatus::FAILED, "debit never applied", true)) {
            result.debits_never_applied++;
            spdlog::info("Debit intent {} never applied; marked failed", intent.transfer_id);
        }
        return;
    }

    std::string refund_key = transfer_key(intent.bet_id, TransferKind::DEBIT_REFUND);
    {
        LedgerStore::Transaction tx(store_);
        // Loses to a bet that committed while the debit was re-issued
        if (store_.get_bet(intent.bet_id) ||
            !store_.update_transfer_status_if(intent.transfer_id, TransferStatus::PENDING,
                                              TransferStatus::REVERSED, "bet never committed", true)) {
            spdlog::info("Debit intent {} settled by its bet; not voided", intent.transfer_id);
            return;
        }
        if (!store_.get_transfer(refund_key)) {
            Transfer refund;
            refund.transfer_id = refund_key;
            refund.bet_id = intent.bet_id;
            refund.account_id = intent.account_id;
            refund.kind = TransferKind::DEBIT_REFUND;
            refund.amount = intent.amount;
            refund.status = TransferStatus::PENDING;
            refund.created_at = now_ms();
            refund.updated_at = refund.created_at;
            store_.insert_transfer(refund);
        }
        tx.commit();
    }

    result.debits_voided++;
    SETTLE_COUNTER("debits_voided").increment();
    spdlog::warn("Debit intent {} voided; refunding {} to {}",
                 intent.transfer_id, intent.amount.to_string(), intent.account_id);

    auto refund = store_.get_transfer(refund_key);
    if (refund && !is_final(refund->status)) {
        retry_credit(*refund, result);
    }
}

// ============================================================================
// AUDIT
// ============================================================================

AuditResult Reconciler::audit() {
    AuditResult result;

    for (const auto& market : store_.list_markets(std::numeric_limits<int>::max())) {
        MarketTotals totals = store_.compute_market_totals(market.market_id);
        result.markets_checked++;
        result.bets_checked += totals.bet_count;

        Amount expected_pools = market.seed_liquidity + market.seed_liquidity + totals.net_stake;
        Amount actual_pools = market.yes_pool + market.no_pool;
        if (expected_pools != actual_pools) {
            result.discrepancies.push_back({DiscrepancyType::POOL_CONSERVATION, market.market_id,
                                            expected_pools.to_string(), actual_pools.to_string(), true});
        }

        if (market.total_volume != totals.gross) {
            result.discrepancies.push_back({DiscrepancyType::VOLUME_MISMATCH, market.market_id,
                                            totals.gross.to_string(), market.total_volume.to_string(), true});
        }

        if (market.bet_count != totals.bet_count) {
            result.discrepancies.push_back({DiscrepancyType::BET_COUNT_MISMATCH, market.market_id,
                                            std::to_string(totals.bet_count),
                                            std::to_string(market.bet_count), false});
        }

        if (totals.fee_mismatches > 0) {
            result.discrepancies.push_back({DiscrepancyType::FEE_CONSERVATION, market.market_id,
                                            "0", std::to_string(totals.fee_mismatches), true});
        }

        if (totals.fees != totals.fee_transfers) {
            result.discrepancies.push_back({DiscrepancyType::FEE_TRANSFER_MISMATCH, market.market_id,
                                            totals.fees.to_string(), totals.fee_transfers.to_string(), false});
        }

        if (totals.reversed_debits > 0) {
            result.discrepancies.push_back({DiscrepancyType::REVERSED_DEBIT, market.market_id,
                                            "0", std::to_string(totals.reversed_debits), true});
        }

        if (totals.resolved_mismatches > 0) {
            result.discrepancies.push_back({DiscrepancyType::RESOLVED_FLAG_MISMATCH, market.market_id,
                                            "0", std::to_string(totals.resolved_mismatches), true});
        }
    }

    for (const auto& transfer : store_.get_open_credit_transfers(std::numeric_limits<int>::max())) {
        if (transfer.attempts >= config_.max_attempts) {
            result.discrepancies.push_back({DiscrepancyType::TRANSFER_STUCK, transfer.transfer_id,
                                            "confirmed", to_string(transfer.status), false});
        }
    }

    if (!result.is_consistent()) {
        spdlog::warn("Found {} discrepancies during audit:", result.discrepancies.size());
        for (const auto& d : result.discrepancies) {
            spdlog::warn("  - {}: {} expected='{}' actual='{}' {}",
                         to_string(d.type), d.identifier, d.expected, d.actual,
                         d.is_critical ? "[CRITICAL]" : "");
        }
    }
    spdlog::info("{}", result.summary());
    return result;
}

// ============================================================================
// BACKGROUND LOOP
// ============================================================================

void Reconciler::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&Reconciler::worker_loop, this);
    spdlog::info("Reconciler started");
}

void Reconciler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Reconciler stopped");
}

void Reconciler::worker_loop() {
    auto interval = std::chrono::seconds(config_.interval_seconds);

    while (running_.load()) {
        try {
            run_once();
        } catch (const std::exception& e) {
            SETTLE_COUNTER("reconcile_errors").increment();
            spdlog::error("Reconcile pass failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    }
}

} // namespace settle
