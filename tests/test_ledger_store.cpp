#include <gtest/gtest.h>
#include "persistence/ledger_store.hpp"
#include "test_support.hpp"

using namespace settle;
using settle::testing_support::TempDbTest;
using settle::testing_support::make_market;

class LedgerStoreTest : public TempDbTest {
protected:
    Bet make_bet(const Market& market, const std::string& user, Side side, Amount gross) {
        Bet bet;
        bet.bet_id = generate_uuid();
        bet.market_id = market.market_id;
        bet.user_id = user;
        bet.side = side;
        bet.gross_amount = gross;
        bet.platform_fee = gross.mul_bps(200);
        bet.creator_fee = gross.mul_bps(1000);
        bet.net_stake = gross - bet.platform_fee - bet.creator_fee;
        bet.price = Price::parse("0.5");
        bet.created_at = now_ms();
        return bet;
    }

    Transfer make_transfer(const std::string& bet_id, TransferKind kind, Amount amount,
                           int64_t created_at = now_ms()) {
        Transfer t;
        t.transfer_id = transfer_key(bet_id, kind);
        t.bet_id = bet_id;
        t.account_id = "alice";
        t.kind = kind;
        t.amount = amount;
        t.created_at = created_at;
        t.updated_at = created_at;
        return t;
    }
};

// ============================================================================
// Schema
// ============================================================================

TEST_F(LedgerStoreTest, OpensAndInitializesSchema) {
    LedgerStore store(test_db_path_);
    EXPECT_TRUE(store.is_open());
    EXPECT_EQ(store.get_schema_version(), 1);
}

TEST_F(LedgerStoreTest, ReopeningKeepsData) {
    Market market = make_market("carol");
    {
        LedgerStore store(test_db_path_);
        store.insert_market(market);
    }
    LedgerStore reopened(test_db_path_);
    auto loaded = reopened.get_market(market.market_id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->title, market.title);
    EXPECT_EQ(reopened.get_schema_version(), 1);
}

// ============================================================================
// Markets
// ============================================================================

TEST_F(LedgerStoreTest, MarketRoundTripsAllFields) {
    LedgerStore store(test_db_path_);
    Market market = make_market("carol", Amount::parse("250.5"));
    market.platform_fee_bps = 150;
    store.insert_market(market);

    auto loaded = store.get_market(market.market_id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->creator_id, "carol");
    EXPECT_EQ(loaded->yes_pool, Amount::parse("250.5"));
    EXPECT_EQ(loaded->no_pool, Amount::parse("250.5"));
    EXPECT_EQ(loaded->status, MarketStatus::OPEN);
    EXPECT_FALSE(loaded->outcome.has_value());
    ASSERT_TRUE(loaded->platform_fee_bps.has_value());
    EXPECT_EQ(*loaded->platform_fee_bps, 150);
    EXPECT_FALSE(loaded->creator_fee_bps.has_value());
    EXPECT_EQ(loaded->end_date, market.end_date);
}

TEST_F(LedgerStoreTest, MissingMarketIsNullopt) {
    LedgerStore store(test_db_path_);
    EXPECT_FALSE(store.get_market("nope").has_value());
}

TEST_F(LedgerStoreTest, PoolUpdateIsCompareAndSet) {
    LedgerStore store(test_db_path_);
    Market market = make_market("carol");
    store.insert_market(market);

    EXPECT_TRUE(store.update_market_pools(market.market_id, 0, Amount::from_units(1088),
                                          Amount::from_units(1000), Amount::from_units(100), 1));
    // Stale version loses
    EXPECT_FALSE(store.update_market_pools(market.market_id, 0, Amount::from_units(2000),
                                           Amount::from_units(1000), Amount::from_units(100), 1));

    auto loaded = store.get_market(market.market_id);
    EXPECT_EQ(loaded->yes_pool, Amount::from_units(1088));
    EXPECT_EQ(loaded->version, 1);
    EXPECT_EQ(loaded->bet_count, 1);
}

TEST_F(LedgerStoreTest, ResolutionHappensOnce) {
    LedgerStore store(test_db_path_);
    Market market = make_market("carol");
    store.insert_market(market);
    Bet bet = make_bet(market, "alice", Side::YES, Amount::from_units(10));
    store.insert_bet(bet);

    EXPECT_TRUE(store.resolve_market_if_open(market.market_id, Side::YES, now_ms(), "it rained"));
    EXPECT_FALSE(store.resolve_market_if_open(market.market_id, Side::NO, now_ms(), "changed mind"));

    auto loaded = store.get_market(market.market_id);
    EXPECT_EQ(loaded->status, MarketStatus::RESOLVED);
    ASSERT_TRUE(loaded->outcome.has_value());
    EXPECT_EQ(*loaded->outcome, Side::YES);
    EXPECT_EQ(loaded->resolution_note, "it rained");
    EXPECT_TRUE(store.get_bet(bet.bet_id)->resolved);

    // Resolved markets reject pool writes
    EXPECT_FALSE(store.update_market_pools(market.market_id, loaded->version, Amount::from_units(1),
                                           Amount::from_units(1), Amount::zero(), 0));
}

// ============================================================================
// Bets
// ============================================================================

TEST_F(LedgerStoreTest, BetRequiresExistingMarket) {
    LedgerStore store(test_db_path_);
    Market ghost = make_market("carol");
    Bet bet = make_bet(ghost, "alice", Side::YES, Amount::from_units(10));
    EXPECT_THROW(store.insert_bet(bet), StorageError);
}

TEST_F(LedgerStoreTest, ClaimIsConditional) {
    LedgerStore store(test_db_path_);
    Market market = make_market("carol");
    store.insert_market(market);
    Bet bet = make_bet(market, "alice", Side::YES, Amount::from_units(100));
    store.insert_bet(bet);

    EXPECT_TRUE(store.claim_bet_if_unclaimed(bet.bet_id, Amount::from_units(176),
                                             TransferStatus::PENDING, now_ms()));
    EXPECT_FALSE(store.claim_bet_if_unclaimed(bet.bet_id, Amount::from_units(999),
                                              TransferStatus::PENDING, now_ms()));

    auto loaded = store.get_bet(bet.bet_id);
    EXPECT_TRUE(loaded->claimed);
    ASSERT_TRUE(loaded->payout.has_value());
    EXPECT_EQ(*loaded->payout, Amount::from_units(176));
    EXPECT_EQ(loaded->payout_status, TransferStatus::PENDING);
}

TEST_F(LedgerStoreTest, UnclaimedWinningBetsOnlyListsWinners) {
    LedgerStore store(test_db_path_);
    Market market = make_market("carol");
    store.insert_market(market);
    Bet winner = make_bet(market, "alice", Side::YES, Amount::from_units(10));
    Bet loser = make_bet(market, "alice", Side::NO, Amount::from_units(10));
    store.insert_bet(winner);
    store.insert_bet(loser);

    EXPECT_TRUE(store.get_unclaimed_winning_bets("alice").empty());

    store.resolve_market_if_open(market.market_id, Side::YES, now_ms(), "");
    auto bets = store.get_unclaimed_winning_bets("alice");
    ASSERT_EQ(bets.size(), 1u);
    EXPECT_EQ(bets[0].bet_id, winner.bet_id);
    EXPECT_TRUE(store.get_unclaimed_winning_bets("bob").empty());
}

TEST_F(LedgerStoreTest, MarketTotalsSumBetsAndFeeTransfers) {
    LedgerStore store(test_db_path_);
    Market market = make_market("carol");
    store.insert_market(market);

    for (int i = 0; i < 3; i++) {
        Bet bet = make_bet(market, "alice", Side::YES, Amount::from_units(100));
        store.insert_bet(bet);
        store.insert_transfer(make_transfer(bet.bet_id, TransferKind::PLATFORM_FEE, bet.platform_fee));
        store.insert_transfer(make_transfer(bet.bet_id, TransferKind::CREATOR_FEE, bet.creator_fee));
    }

    MarketTotals totals = store.compute_market_totals(market.market_id);
    EXPECT_EQ(totals.bet_count, 3);
    EXPECT_EQ(totals.gross, Amount::from_units(300));
    EXPECT_EQ(totals.net_stake, Amount::from_units(264));
    EXPECT_EQ(totals.fees, Amount::from_units(36));
    EXPECT_EQ(totals.fee_transfers, Amount::from_units(36));
    EXPECT_EQ(totals.fee_mismatches, 0);
    EXPECT_EQ(totals.resolved_mismatches, 0);
}

// ============================================================================
// Transfers
// ============================================================================

TEST_F(LedgerStoreTest, TransferStatusAndAttempts) {
    LedgerStore store(test_db_path_);
    store.insert_transfer(make_transfer("bet-1", TransferKind::PAYOUT, Amount::from_units(5)));

    std::string key = transfer_key("bet-1", TransferKind::PAYOUT);
    store.update_transfer_status(key, TransferStatus::FAILED, "rejected", true);
    store.update_transfer_status(key, TransferStatus::FAILED, "rejected again", true);

    auto t = store.get_transfer(key);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->status, TransferStatus::FAILED);
    EXPECT_EQ(t->attempts, 2);
    EXPECT_EQ(t->last_error, "rejected again");

    EXPECT_THROW(store.update_transfer_status("missing", TransferStatus::CONFIRMED, "", false),
                 StorageError);
}

TEST_F(LedgerStoreTest, ConditionalTransferUpdateMatchesExpectedStatus) {
    LedgerStore store(test_db_path_);
    store.insert_transfer(make_transfer("bet-1", TransferKind::BET_DEBIT, Amount::from_units(5)));
    std::string key = transfer_key("bet-1", TransferKind::BET_DEBIT);

    EXPECT_TRUE(store.update_transfer_status_if(key, TransferStatus::PENDING,
                                                TransferStatus::REVERSED, "voided", true));
    EXPECT_FALSE(store.update_transfer_status_if(key, TransferStatus::PENDING,
                                                 TransferStatus::CONFIRMED, "", true));
    EXPECT_FALSE(store.update_transfer_status_if("missing", TransferStatus::PENDING,
                                                 TransferStatus::CONFIRMED, "", false));

    auto t = store.get_transfer(key);
    EXPECT_EQ(t->status, TransferStatus::REVERSED);
    EXPECT_EQ(t->attempts, 1);
    EXPECT_EQ(t->last_error, "voided");
}

TEST_F(LedgerStoreTest, DuplicateTransferKeyRejected) {
    LedgerStore store(test_db_path_);
    store.insert_transfer(make_transfer("bet-1", TransferKind::PAYOUT, Amount::from_units(5)));
    EXPECT_THROW(store.insert_transfer(make_transfer("bet-1", TransferKind::PAYOUT, Amount::from_units(5))),
                 StorageError);
}

TEST_F(LedgerStoreTest, OpenCreditsExcludeDebitsAndFinalStates) {
    LedgerStore store(test_db_path_);
    store.insert_transfer(make_transfer("b1", TransferKind::PAYOUT, Amount::from_units(1)));
    store.insert_transfer(make_transfer("b2", TransferKind::CREATOR_FEE, Amount::from_units(1)));
    store.insert_transfer(make_transfer("b3", TransferKind::BET_DEBIT, Amount::from_units(1)));
    store.insert_transfer(make_transfer("b4", TransferKind::PLATFORM_FEE, Amount::from_units(1)));
    store.update_transfer_status(transfer_key("b4", TransferKind::PLATFORM_FEE),
                                 TransferStatus::CONFIRMED, "", true);

    auto open = store.get_open_credit_transfers();
    ASSERT_EQ(open.size(), 2u);
    for (const auto& t : open) {
        EXPECT_NE(t.kind, TransferKind::BET_DEBIT);
        EXPECT_FALSE(is_final(t.status));
    }
}

TEST_F(LedgerStoreTest, StaleDebitIntentsRespectCutoff) {
    LedgerStore store(test_db_path_);
    int64_t now = now_ms();
    store.insert_transfer(make_transfer("old", TransferKind::BET_DEBIT, Amount::from_units(1), now - 120'000));
    store.insert_transfer(make_transfer("new", TransferKind::BET_DEBIT, Amount::from_units(1), now));

    auto stale = store.get_stale_debit_intents(now - 60'000);
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].bet_id, "old");
}

// ============================================================================
// Transactions
// ============================================================================

TEST_F(LedgerStoreTest, UncommittedTransactionRollsBack) {
    LedgerStore store(test_db_path_);
    Market market = make_market("carol");
    {
        LedgerStore::Transaction tx(store);
        store.insert_market(market);
    }
    EXPECT_FALSE(store.get_market(market.market_id).has_value());
}

TEST_F(LedgerStoreTest, NestedRollbackKeepsOuterWork) {
    LedgerStore store(test_db_path_);
    Market outer = make_market("carol");
    Market inner = make_market("dave");
    {
        LedgerStore::Transaction tx(store);
        store.insert_market(outer);
        {
            LedgerStore::Transaction nested(store);
            store.insert_market(inner);
        }
        tx.commit();
    }
    EXPECT_TRUE(store.get_market(outer.market_id).has_value());
    EXPECT_FALSE(store.get_market(inner.market_id).has_value());
}

TEST_F(LedgerStoreTest, AccountsAndWalletJournal) {
    LedgerStore store(test_db_path_);
    EXPECT_FALSE(store.get_account("alice").has_value());

    store.upsert_account("alice", Amount::from_units(50));
    store.upsert_account("alice", Amount::from_units(40));
    EXPECT_EQ(store.get_account("alice")->balance, Amount::from_units(40));

    EXPECT_FALSE(store.get_wallet_operation("k1").has_value());
    store.insert_wallet_operation("k1", "alice", "debit", Amount::from_units(10), "ok");
    EXPECT_EQ(store.get_wallet_operation("k1").value_or(""), "ok");
}
