#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <utility>
#include <unordered_map>
#include "common/types.hpp"
#include "persistence/ledger_store.hpp"

namespace settle {

// yes_pool / (yes_pool + no_pool) for YES, the exact complement for NO.
Price price_for(Amount yes_pool, Amount no_pool, Side side);

/**
 * Point-in-time view of a market's pools and derived prices.
 */
struct PoolSnapshot {
    std::string market_id;
    Amount yes_pool;
    Amount no_pool;
    Amount total_volume;
    int64_t bet_count{0};
    int64_t version{0};
    MarketStatus status{MarketStatus::OPEN};
    Price yes_price;
    Price no_price;
    Market market;       // Full cached row at the same instant
};

/**
 * Owns the in-process view of every market's pools and the per-market mutex
 * that serialises price reads, stake application and resolution.
 *
 * The store is authoritative. A cached Market is loaded on first use and is
 * replaced only when a MarketLock commits after its store transaction did.
 */
class PoolManager {
private:
    struct Entry {
        std::mutex mutex;
        std::optional<Market> cached;   // Guarded by mutex
    };

public:
    /**
     * Exclusive hold on one market. Stake changes are staged on the lock and
     * published to the cache by commit(); a lock released with staged but
     * uncommitted changes drops the cache so the next holder reloads.
     */
    class MarketLock {
    public:
        ~MarketLock();

        MarketLock(const MarketLock&) = delete;
        MarketLock& operator=(const MarketLock&) = delete;

        const Market& market() const { return staged_; }
        Price price(Side side) const;

        // Writes the new pools through the store's version CAS. A positive
        // gross_amount also counts one bet and adds to total volume.
        // Throws PoolConflictError on a CAS miss, after reloading.
        std::pair<Amount, Amount> apply_stake(Side side, Amount net_stake,
                                              Amount gross_amount = Amount::zero());

        // Publish staged changes; call after the enclosing transaction commits.
        void commit();

        // Re-read the market from the store into both cache and stage.
        void reload();

    private:
        friend class PoolManager;
        MarketLock(LedgerStore& store, std::shared_ptr<Entry> entry, const std::string& market_id);

        LedgerStore& store_;
        std::shared_ptr<Entry> entry_;
        std::unique_lock<std::mutex> lock_;
        Market staged_;
        bool dirty_{false};
    };

    explicit PoolManager(LedgerStore& store);

    // Throws MarketNotFoundError
    MarketLock lock(const std::string& market_id);

    Price current_price(const std::string& market_id, Side side);

    // Standalone pool mutation in its own transaction; returns (yes, no).
    std::pair<Amount, Amount> apply_stake(const std::string& market_id, Side side, Amount net_stake);

    PoolSnapshot snapshot(const std::string& market_id);

    // Drop a cached market, e.g. after an out-of-process write
    void invalidate(const std::string& market_id);

private:
    LedgerStore& store_;

    std::mutex entries_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    std::shared_ptr<Entry> entry_for(const std::string& market_id);
};

} // namespace settle
