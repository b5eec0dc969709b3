#include "pricing/pool_manager.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>

namespace settle {

Price price_for(Amount yes_pool, Amount no_pool, Side side) {
    Price yes = Price::from_ratio(yes_pool, yes_pool + no_pool);
    return side == Side::YES ? yes : yes.complement();
}

// ============================================================================
// MarketLock
// ============================================================================

PoolManager::MarketLock::MarketLock(LedgerStore& store, std::shared_ptr<Entry> entry,
                                    const std::string& market_id)
    : store_(store)
    , entry_(std::move(entry))
    , lock_(entry_->mutex)
{
    if (!entry_->cached) {
        entry_->cached = store_.get_market(market_id);
        if (!entry_->cached) {
            throw MarketNotFoundError(market_id);
        }
    }
    staged_ = *entry_->cached;
}

PoolManager::MarketLock::~MarketLock() {
    if (dirty_) {
        entry_->cached.reset();
    }
}

Price PoolManager::MarketLock::price(Side side) const {
    return price_for(staged_.yes_pool, staged_.no_pool, side);
}

std::pair<Amount, Amount> PoolManager::MarketLock::apply_stake(Side side, Amount net_stake,
                                                               Amount gross_amount) {
    if (!net_stake.is_positive()) {
        throw InvalidAmountError("Net stake must be positive, got " + net_stake.to_string());
    }

    Amount yes = staged_.yes_pool;
    Amount no = staged_.no_pool;
    if (side == Side::YES) yes += net_stake;
    else no += net_stake;

    Amount volume = staged_.total_volume;
    int64_t bets = staged_.bet_count;
    if (gross_amount.is_positive()) {
        volume += gross_amount;
        bets += 1;
    }

    dirty_ = true;
    if (!store_.update_market_pools(staged_.market_id, staged_.version, yes, no, volume, bets)) {
        SETTLE_COUNTER("pool_conflicts").increment();
        spdlog::warn("Pool CAS miss on market {} at version {}", staged_.market_id, staged_.version);
        reload();
        if (staged_.status != MarketStatus::OPEN) {
            throw MarketClosedError("Market is resolved: " + staged_.market_id);
        }
        throw PoolConflictError(staged_.market_id);
    }

    staged_.yes_pool = yes;
    staged_.no_pool = no;
    staged_.total_volume = volume;
    staged_.bet_count = bets;
    staged_.version += 1;
    return {yes, no};
}

void PoolManager::MarketLock::commit() {
    entry_->cached = staged_;
    dirty_ = false;
}

void PoolManager::MarketLock::reload() {
    auto fresh = store_.get_market(staged_.market_id);
    if (!fresh) {
        entry_->cached.reset();
        throw MarketNotFoundError(staged_.market_id);
    }
    entry_->cached = *fresh;
    staged_ = *fresh;
    dirty_ = false;
}

// ============================================================================
// PoolManager
// ============================================================================

PoolManager::PoolManager(LedgerStore& store)
    : store_(store)
{
}

std::shared_ptr<PoolManager::Entry> PoolManager::entry_for(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    auto it = entries_.find(market_id);
    if (it != entries_.end()) {
        return it->second;
    }

    // Unknown ids never get an entry
    if (!store_.get_market(market_id)) {
        throw MarketNotFoundError(market_id);
    }

    auto entry = std::make_shared<Entry>();
    entries_.emplace(market_id, entry);
    return entry;
}

PoolManager::MarketLock PoolManager::lock(const std::string& market_id) {
    return MarketLock(store_, entry_for(market_id), market_id);
}

Price PoolManager::current_price(const std::string& market_id, Side side) {
    auto held = lock(market_id);
    return held.price(side);
}

std::pair<Amount, Amount> PoolManager::apply_stake(const std::string& market_id, Side side,
                                                   Amount net_stake) {
    auto held = lock(market_id);
    LedgerStore::Transaction tx(store_);
    auto pools = held.apply_stake(side, net_stake);
    tx.commit();
    held.commit();
    return pools;
}

PoolSnapshot PoolManager::snapshot(const std::string& market_id) {
    auto held = lock(market_id);
    const Market& m = held.market();

    PoolSnapshot snap;
    snap.market_id = m.market_id;
    snap.yes_pool = m.yes_pool;
    snap.no_pool = m.no_pool;
    snap.total_volume = m.total_volume;
    snap.bet_count = m.bet_count;
    snap.version = m.version;
    snap.status = m.status;
    snap.yes_price = held.price(Side::YES);
    snap.no_price = held.price(Side::NO);
    snap.market = m;
    return snap;
}

void PoolManager::invalidate(const std::string& market_id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        auto it = entries_.find(market_id);
        if (it == entries_.end()) return;
        entry = it->second;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->cached.reset();
}

} // namespace settle
