#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "pricing/pool_manager.hpp"
#include "test_support.hpp"

using namespace settle;
using settle::testing_support::TempDbTest;
using settle::testing_support::make_market;

class PoolManagerTest : public TempDbTest {
protected:
    void SetUp() override {
        TempDbTest::SetUp();
        store_ = std::make_unique<LedgerStore>(test_db_path_);
        pools_ = std::make_unique<PoolManager>(*store_);
        market_ = make_market("carol");
        store_->insert_market(market_);
    }

    void TearDown() override {
        pools_.reset();
        store_.reset();
        TempDbTest::TearDown();
    }

    std::unique_ptr<LedgerStore> store_;
    std::unique_ptr<PoolManager> pools_;
    Market market_;
};

TEST_F(PoolManagerTest, FreshMarketPricesAtHalf) {
    EXPECT_EQ(pools_->current_price(market_.market_id, Side::YES).to_string(), "0.5");
    EXPECT_EQ(pools_->current_price(market_.market_id, Side::NO).to_string(), "0.5");
}

TEST_F(PoolManagerTest, UnknownMarketThrows) {
    EXPECT_THROW(pools_->lock("missing"), MarketNotFoundError);
    EXPECT_THROW(pools_->current_price("missing", Side::YES), MarketNotFoundError);
}

TEST_F(PoolManagerTest, StakeMovesPriceTowardsBackedSide) {
    auto [yes, no] = pools_->apply_stake(market_.market_id, Side::YES, Amount::from_units(88));
    EXPECT_EQ(yes, Amount::from_units(1088));
    EXPECT_EQ(no, Amount::from_units(1000));

    Price yes_price = pools_->current_price(market_.market_id, Side::YES);
    EXPECT_GT(yes_price, Price::parse("0.5"));

    auto persisted = store_->get_market(market_.market_id);
    EXPECT_EQ(persisted->yes_pool, Amount::from_units(1088));
    EXPECT_EQ(persisted->version, 1);
}

TEST_F(PoolManagerTest, NonPositiveStakeRejected) {
    EXPECT_THROW(pools_->apply_stake(market_.market_id, Side::YES, Amount::zero()), InvalidAmountError);
    EXPECT_THROW(pools_->apply_stake(market_.market_id, Side::NO, Amount::parse("-1")), InvalidAmountError);
}

TEST_F(PoolManagerTest, UncommittedStakeIsDiscarded) {
    {
        auto held = pools_->lock(market_.market_id);
        LedgerStore::Transaction tx(*store_);
        held.apply_stake(Side::YES, Amount::from_units(500));
        // No commit on either
    }
    auto snap = pools_->snapshot(market_.market_id);
    EXPECT_EQ(snap.yes_pool, Amount::from_units(1000));
    EXPECT_EQ(snap.version, 0);
}

TEST_F(PoolManagerTest, SnapshotCarriesMarketRow) {
    pools_->apply_stake(market_.market_id, Side::NO, Amount::from_units(1000));

    auto snap = pools_->snapshot(market_.market_id);
    EXPECT_EQ(snap.market.market_id, market_.market_id);
    EXPECT_EQ(snap.market.title, market_.title);
    EXPECT_EQ(snap.market.no_pool, Amount::from_units(2000));
    EXPECT_EQ(snap.no_price, price_for(snap.market.yes_pool, snap.market.no_pool, Side::NO));
}

TEST_F(PoolManagerTest, OutOfBandWriteSurfacesAsConflict) {
    pools_->snapshot(market_.market_id);  // Warm the cache
    store_->update_market_pools(market_.market_id, 0, Amount::from_units(1100),
                                Amount::from_units(1000), Amount::zero(), 0);

    EXPECT_THROW(pools_->apply_stake(market_.market_id, Side::YES, Amount::from_units(1)),
                 PoolConflictError);
    // The failed attempt reloaded the market
    EXPECT_EQ(pools_->snapshot(market_.market_id).yes_pool, Amount::from_units(1100));
}

TEST_F(PoolManagerTest, ResolvedMarketRejectsStake) {
    pools_->snapshot(market_.market_id);
    store_->resolve_market_if_open(market_.market_id, Side::NO, now_ms(), "");
    EXPECT_THROW(pools_->apply_stake(market_.market_id, Side::YES, Amount::from_units(1)),
                 MarketClosedError);
}

TEST_F(PoolManagerTest, ConcurrentStakesConservePools) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&, t] {
            Side side = t % 2 == 0 ? Side::YES : Side::NO;
            for (int i = 0; i < kPerThread; i++) {
                pools_->apply_stake(market_.market_id, side, Amount::from_units(1));
            }
        });
    }
    for (auto& th : threads) th.join();

    auto snap = pools_->snapshot(market_.market_id);
    EXPECT_EQ(snap.yes_pool + snap.no_pool, Amount::from_units(2000 + kThreads * kPerThread));
    EXPECT_EQ(snap.version, kThreads * kPerThread);
    EXPECT_EQ(snap.yes_price.nanos() + snap.no_price.nanos(), Price::kScale);
}
