#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "settlement/claim_processor.hpp"
#include "resolution/resolution_service.hpp"
#include "betting/bet_service.hpp"
#include "test_support.hpp"

using namespace settle;
using settle::testing_support::TempDbTest;
using settle::testing_support::ScriptedWallet;
using settle::testing_support::make_market;

class ClaimProcessorTest : public TempDbTest {
protected:
    void SetUp() override {
        TempDbTest::SetUp();
        config_.db_path = test_db_path_;
        store_ = std::make_unique<LedgerStore>(test_db_path_);
        pools_ = std::make_unique<PoolManager>(*store_);
        wallet_ = std::make_unique<ScriptedWallet>(*store_);
        bets_ = std::make_unique<BetService>(*store_, *pools_, *wallet_, config_);
        resolution_ = std::make_unique<ResolutionService>(*store_, *pools_, config_);
        claims_ = std::make_unique<ClaimProcessor>(*store_, *wallet_);

        market_ = make_market("carol");
        store_->insert_market(market_);
        wallet_->fund("alice", Amount::from_units(100));
        wallet_->fund("bob", Amount::from_units(100));
    }

    void TearDown() override {
        claims_.reset();
        resolution_.reset();
        bets_.reset();
        wallet_.reset();
        pools_.reset();
        store_.reset();
        TempDbTest::TearDown();
    }

    Config config_;
    std::unique_ptr<LedgerStore> store_;
    std::unique_ptr<PoolManager> pools_;
    std::unique_ptr<ScriptedWallet> wallet_;
    std::unique_ptr<BetService> bets_;
    std::unique_ptr<ResolutionService> resolution_;
    std::unique_ptr<ClaimProcessor> claims_;
    Market market_;
};

// ============================================================================
// End-to-end scenario: seed 1000/1000, 100 on YES, YES wins
// ============================================================================

TEST_F(ClaimProcessorTest, WinningBetPaysLockedOdds) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(100));
    EXPECT_EQ(bet.net_stake, Amount::from_units(88));
    EXPECT_EQ(bet.price.to_string(), "0.5");
    EXPECT_EQ(store_->get_market(market_.market_id)->yes_pool, Amount::from_units(1088));

    resolution_->resolve(market_.market_id, Side::YES, "carol");
    PayoutResult result = claims_->claim(bet.bet_id, "alice");

    EXPECT_TRUE(result.won);
    EXPECT_EQ(result.payout, Amount::from_units(176));
    EXPECT_EQ(result.transfer_status, TransferStatus::CONFIRMED);
    EXPECT_EQ(result.idempotency_key, bet.bet_id + ":payout");
    EXPECT_EQ(wallet_->balance("alice"), Amount::from_units(176));

    auto stored = store_->get_bet(bet.bet_id);
    EXPECT_TRUE(stored->claimed);
    EXPECT_EQ(*stored->payout, Amount::from_units(176));
    EXPECT_EQ(stored->payout_status, TransferStatus::CONFIRMED);
}

TEST_F(ClaimProcessorTest, LosingBetClaimsZero) {
    Bet bet = bets_->place_bet(market_.market_id, "bob", Side::NO, Amount::from_units(50));
    resolution_->resolve(market_.market_id, Side::YES, "carol");

    PayoutResult result = claims_->claim(bet.bet_id, "bob");
    EXPECT_FALSE(result.won);
    EXPECT_EQ(result.payout, Amount::zero());
    EXPECT_EQ(result.transfer_status, TransferStatus::NONE);
    EXPECT_EQ(wallet_->credit_calls.load(), 2);  // Fee credits only
    EXPECT_TRUE(store_->get_bet(bet.bet_id)->claimed);
}

// ============================================================================
// Preconditions
// ============================================================================

TEST_F(ClaimProcessorTest, UnknownBet) {
    EXPECT_THROW(claims_->claim("missing", "alice"), BetNotFoundError);
}

TEST_F(ClaimProcessorTest, OnlyOwnerMayClaim) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(10));
    resolution_->resolve(market_.market_id, Side::YES, "carol");
    EXPECT_THROW(claims_->claim(bet.bet_id, "bob"), ForbiddenError);
}

TEST_F(ClaimProcessorTest, OpenMarketNotClaimable) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(10));
    EXPECT_THROW(claims_->claim(bet.bet_id, "alice"), NotResolvedError);
    EXPECT_FALSE(store_->get_bet(bet.bet_id)->claimed);
}

TEST_F(ClaimProcessorTest, SecondClaimRejected) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(100));
    resolution_->resolve(market_.market_id, Side::YES, "carol");

    claims_->claim(bet.bet_id, "alice");
    EXPECT_THROW(claims_->claim(bet.bet_id, "alice"), AlreadyClaimedError);
    EXPECT_EQ(wallet_->balance("alice"), Amount::from_units(176));
}

TEST_F(ClaimProcessorTest, ConcurrentClaimsPayOnce) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(100));
    resolution_->resolve(market_.market_id, Side::YES, "carol");

    constexpr int kThreads = 10;
    std::atomic<int> paid{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&] {
            try {
                claims_->claim(bet.bet_id, "alice");
                paid++;
            } catch (const AlreadyClaimedError&) {
                rejected++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(paid.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_EQ(wallet_->balance("alice"), Amount::from_units(176));
}

// ============================================================================
// Payout delivery failures
// ============================================================================

TEST_F(ClaimProcessorTest, UnavailableWalletLeavesClaimPending) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(100));
    resolution_->resolve(market_.market_id, Side::YES, "carol");
    wallet_->credit_unavailable = 1;

    try {
        claims_->claim(bet.bet_id, "alice");
        FAIL() << "expected SettlementPendingError";
    } catch (const SettlementPendingError& e) {
        EXPECT_EQ(e.retry_token(), bet.bet_id + ":payout");
    }

    auto stored = store_->get_bet(bet.bet_id);
    EXPECT_TRUE(stored->claimed);
    EXPECT_EQ(stored->payout_status, TransferStatus::PENDING);
    EXPECT_EQ(wallet_->balance("alice"), Amount::zero());

    // Claim again is refused; retry delivers with the same key
    EXPECT_THROW(claims_->claim(bet.bet_id, "alice"), AlreadyClaimedError);
    PayoutResult retried = claims_->retry_transfer(bet.bet_id, "alice");
    EXPECT_EQ(retried.transfer_status, TransferStatus::CONFIRMED);
    EXPECT_EQ(wallet_->balance("alice"), Amount::from_units(176));

    // Further retries are no-ops
    PayoutResult again = claims_->retry_transfer(bet.bet_id, "alice");
    EXPECT_EQ(again.transfer_status, TransferStatus::CONFIRMED);
    EXPECT_EQ(wallet_->balance("alice"), Amount::from_units(176));
}

TEST_F(ClaimProcessorTest, RejectedCreditIsRetryable) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(100));
    resolution_->resolve(market_.market_id, Side::YES, "carol");
    wallet_->credit_rejections = 1;

    EXPECT_THROW(claims_->claim(bet.bet_id, "alice"), SettlementPendingError);
    auto transfer = store_->get_transfer(bet.bet_id + ":payout");
    ASSERT_TRUE(transfer.has_value());
    EXPECT_EQ(transfer->status, TransferStatus::FAILED);
    EXPECT_EQ(transfer->attempts, 1);

    PayoutResult retried = claims_->retry_transfer(bet.bet_id, "alice");
    EXPECT_EQ(retried.transfer_status, TransferStatus::CONFIRMED);
    EXPECT_EQ(store_->get_transfer(bet.bet_id + ":payout")->attempts, 2);
}

TEST_F(ClaimProcessorTest, RetryBeforeClaimClaims) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(100));
    resolution_->resolve(market_.market_id, Side::YES, "carol");

    PayoutResult result = claims_->retry_transfer(bet.bet_id, "alice");
    EXPECT_EQ(result.payout, Amount::from_units(176));
    EXPECT_TRUE(store_->get_bet(bet.bet_id)->claimed);
}

// ============================================================================
// Unclaimed winnings
// ============================================================================

TEST_F(ClaimProcessorTest, UnclaimedWinningsSumsWinners) {
    Bet win1 = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(10));
    Bet win2 = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(10));
    bets_->place_bet(market_.market_id, "alice", Side::NO, Amount::from_units(10));
    resolution_->resolve(market_.market_id, Side::YES, "carol");

    UnclaimedWinnings before = claims_->unclaimed_winnings("alice");
    ASSERT_EQ(before.bets.size(), 2u);
    Amount expected = win1.net_stake.div_price(win1.price) + win2.net_stake.div_price(win2.price);
    EXPECT_EQ(before.total, expected);

    claims_->claim(win1.bet_id, "alice");
    UnclaimedWinnings after = claims_->unclaimed_winnings("alice");
    ASSERT_EQ(after.bets.size(), 1u);
    EXPECT_EQ(after.bets[0].bet.bet_id, win2.bet_id);
}

TEST_F(ClaimProcessorTest, QuoteIsZeroForOpenOrLosingBets) {
    Bet bet = bets_->place_bet(market_.market_id, "alice", Side::YES, Amount::from_units(10));
    Market open = *store_->get_market(market_.market_id);
    EXPECT_EQ(ClaimProcessor::quote_payout(bet, open), Amount::zero());

    Market resolved_no = open;
    resolved_no.status = MarketStatus::RESOLVED;
    resolved_no.outcome = Side::NO;
    EXPECT_EQ(ClaimProcessor::quote_payout(bet, resolved_no), Amount::zero());
}
