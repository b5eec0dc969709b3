#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <set>
#include <nlohmann/json.hpp>
#include "api/api_router.hpp"
#include "core/engine.hpp"
#include "utils/time_utils.hpp"
#include "test_support.hpp"

using namespace settle;
using namespace settle::api;
using settle::testing_support::TempDbTest;
using json = nlohmann::json;

class ApiRouterTest : public TempDbTest {
protected:
    void SetUp() override {
        TempDbTest::SetUp();
        Config config;
        config.db_path = test_db_path_;
        config.admin_users = {"admin"};
        config.reconciler.enabled = false;
        engine_ = std::make_unique<Engine>(config);
        router_ = std::make_unique<ApiRouter>(*engine_);

        engine_->deposit("alice", Amount::from_units(500), "seed-alice");
        engine_->deposit("bob", Amount::from_units(500), "seed-bob");
    }

    void TearDown() override {
        router_.reset();
        engine_.reset();
        TempDbTest::TearDown();
    }

    ApiResponse call(const std::string& method, const std::string& target,
                     const std::string& user = "", const json& body = nullptr) {
        ApiRequest req;
        req.method = method;
        req.target = target;
        if (!user.empty()) req.headers["x-user-id"] = user;
        if (!body.is_null()) req.body = body.dump();
        return router_->handle(req);
    }

    json parse(const ApiResponse& res) {
        return json::parse(res.body);
    }

    std::string create_market(const std::string& creator = "carol") {
        auto res = call("POST", "/markets", creator, {
            {"title", "Will the bridge open on time?"},
            {"categoryId", "infra"},
            {"endDate", time_utils::to_iso8601(now_ms() + 3'600'000)}
        });
        EXPECT_EQ(res.status, 200) << res.body;
        return parse(res)["marketId"].get<std::string>();
    }

    std::unique_ptr<Engine> engine_;
    std::unique_ptr<ApiRouter> router_;
};

// ============================================================================
// Service routes
// ============================================================================

TEST_F(ApiRouterTest, Health) {
    auto res = call("GET", "/health");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(parse(res)["status"], "ok");
}

TEST_F(ApiRouterTest, MetricsArePrometheusText) {
    call("GET", "/health");
    auto res = call("GET", "/metrics");
    EXPECT_EQ(res.status, 200);
    EXPECT_NE(res.content_type.find("text/plain"), std::string::npos);
    EXPECT_NE(res.body.find("settle_api_requests"), std::string::npos);
}

TEST_F(ApiRouterTest, UnknownRoute) {
    EXPECT_EQ(call("GET", "/nope").status, 404);
    EXPECT_EQ(call("DELETE", "/bets").status, 404);
}

// ============================================================================
// Markets
// ============================================================================

TEST_F(ApiRouterTest, CreateAndFetchMarket) {
    std::string id = create_market();

    auto res = call("GET", "/markets/" + id);
    ASSERT_EQ(res.status, 200);
    json body = parse(res);
    EXPECT_EQ(body["creatorId"], "carol");
    EXPECT_EQ(body["status"], "open");
    EXPECT_EQ(body["yesPool"], "1000.00");
    EXPECT_EQ(body["yesPrice"], "0.5");
    EXPECT_TRUE(body["outcome"].is_null());
}

TEST_F(ApiRouterTest, CreateMarketValidates) {
    auto past = call("POST", "/markets", "carol", {
        {"title", "Already over"},
        {"endDate", time_utils::to_iso8601(now_ms() - 1000)}
    });
    EXPECT_EQ(past.status, 400);
    EXPECT_EQ(parse(past)["error"], "invalid_request");

    auto untitled = call("POST", "/markets", "carol", {{"endDate", now_ms() + 3'600'000}});
    EXPECT_EQ(untitled.status, 400);

    auto bad_seed = call("POST", "/markets", "carol", {
        {"title", "x"}, {"endDate", now_ms() + 3'600'000}, {"seedLiquidity", "0"}
    });
    EXPECT_EQ(bad_seed.status, 400);
    EXPECT_EQ(parse(bad_seed)["error"], "invalid_amount");
}

TEST_F(ApiRouterTest, MissingMarketIs404) {
    auto res = call("GET", "/markets/missing");
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(parse(res)["error"], "market_not_found");
    EXPECT_EQ(parse(res)["category"], "not_found");
}

// ============================================================================
// Bets
// ============================================================================

TEST_F(ApiRouterTest, PlaceBet) {
    std::string id = create_market();
    auto res = call("POST", "/bets", "alice", {{"marketId", id}, {"side", "yes"}, {"grossAmount", "100"}});

    ASSERT_EQ(res.status, 200) << res.body;
    json bet = parse(res);
    EXPECT_EQ(bet["side"], "YES");
    EXPECT_EQ(bet["netStake"], "88.00");
    EXPECT_EQ(bet["platformFee"], "2.00");
    EXPECT_EQ(bet["creatorFee"], "10.00");
    EXPECT_EQ(bet["price"], "0.5");

    json market = parse(call("GET", "/markets/" + id));
    EXPECT_EQ(market["yesPool"], "1088.00");
    EXPECT_EQ(market["betCount"], 1);
    EXPECT_EQ(market["yesPrice"], "0.521072797");
    EXPECT_EQ(market["yesPrice"], engine_->pools().snapshot(id).yes_price.to_string());
}

TEST_F(ApiRouterTest, MutatingRoutesRequireUser) {
    std::string id = create_market();
    auto res = call("POST", "/bets", "", {{"marketId", id}, {"side", "YES"}, {"grossAmount", "1"}});
    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(parse(res)["error"], "unauthenticated");
}

TEST_F(ApiRouterTest, BetErrorMapping) {
    std::string id = create_market();

    EXPECT_EQ(call("POST", "/bets", "alice", {{"marketId", id}, {"side", "YES"}, {"grossAmount", "0"}}).status, 400);
    EXPECT_EQ(call("POST", "/bets", "alice", {{"marketId", id}, {"side", "MAYBE"}, {"grossAmount", "1"}}).status, 400);
    EXPECT_EQ(call("POST", "/bets", "alice", {{"marketId", "missing"}, {"side", "YES"}, {"grossAmount", "1"}}).status, 404);
    EXPECT_EQ(call("POST", "/bets", "alice", {{"marketId", id}, {"side", "YES"}, {"grossAmount", "501"}}).status, 402);

    ApiRequest malformed;
    malformed.method = "POST";
    malformed.target = "/bets";
    malformed.headers["x-user-id"] = "alice";
    malformed.body = "{not json";
    auto res = router_->handle(malformed);
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(parse(res)["error"], "invalid_request");
}

TEST_F(ApiRouterTest, OutOfRangeAmountsAreRejected) {
    std::string id = create_market();

    auto wrapped = call("POST", "/bets", "alice", {{"marketId", id}, {"side", "YES"},
                                                   {"grossAmount", 18'446'744'073'710}});
    EXPECT_EQ(wrapped.status, 400);
    EXPECT_EQ(parse(wrapped)["error"], "invalid_amount");

    auto unsigned_max = call("POST", "/bets", "alice", {{"marketId", id}, {"side", "YES"},
                                                        {"grossAmount", std::numeric_limits<uint64_t>::max()}});
    EXPECT_EQ(unsigned_max.status, 400);

    auto huge_float = call("POST", "/bets", "alice", {{"marketId", id}, {"side", "YES"}, {"grossAmount", 1e300}});
    EXPECT_EQ(huge_float.status, 400);

    // Nothing was placed and the pools did not move
    json market = parse(call("GET", "/markets/" + id));
    EXPECT_EQ(market["yesPool"], "1000.00");
    EXPECT_EQ(market["betCount"], 0);
    EXPECT_EQ(engine_->wallet().balance("alice"), Amount::from_units(500));
}

TEST_F(ApiRouterTest, FeeOverridesAreBounded) {
    json base = {{"title", "Fee bounds"}, {"endDate", now_ms() + 3'600'000}};

    json overflowing = base;
    overflowing["platformFeeBps"] = std::numeric_limits<int64_t>::max();
    overflowing["creatorFeeBps"] = 1;
    EXPECT_EQ(call("POST", "/markets", "carol", overflowing).status, 400);

    json unsigned_bps = base;
    unsigned_bps["creatorFeeBps"] = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(call("POST", "/markets", "carol", unsigned_bps).status, 400);

    json valid = base;
    valid["platformFeeBps"] = 100;
    valid["creatorFeeBps"] = 500;
    EXPECT_EQ(call("POST", "/markets", "carol", valid).status, 200);
}

TEST_F(ApiRouterTest, BetsAreVisibleToOwnerAndAdmin) {
    std::string id = create_market();
    json bet = parse(call("POST", "/bets", "alice", {{"marketId", id}, {"side", "NO"}, {"grossAmount", "10"}}));
    std::string bet_id = bet["betId"];

    EXPECT_EQ(call("GET", "/bets/" + bet_id, "alice").status, 200);
    EXPECT_EQ(call("GET", "/bets/" + bet_id, "admin").status, 200);
    EXPECT_EQ(call("GET", "/bets/" + bet_id, "bob").status, 403);
    EXPECT_EQ(call("GET", "/bets/missing", "alice").status, 404);
}

TEST_F(ApiRouterTest, ListsBetsByMarket) {
    std::string id = create_market();
    call("POST", "/bets", "alice", {{"marketId", id}, {"side", "YES"}, {"grossAmount", "10"}});
    call("POST", "/bets", "bob", {{"marketId", id}, {"side", "NO"}, {"grossAmount", "20"}});

    auto res = call("GET", "/markets/" + id + "/bets");
    ASSERT_EQ(res.status, 200);
    json body = parse(res);
    EXPECT_EQ(body["marketId"], id);
    ASSERT_EQ(body["bets"].size(), 2u);
    std::set<std::string> users;
    for (const auto& bet : body["bets"]) {
        EXPECT_EQ(bet["marketId"], id);
        users.insert(bet["userId"].get<std::string>());
    }
    EXPECT_EQ(users, (std::set<std::string>{"alice", "bob"}));

    EXPECT_EQ(call("GET", "/markets/missing/bets").status, 404);
}

TEST_F(ApiRouterTest, ListsBetsByUser) {
    std::string first = create_market();
    std::string second = create_market();
    call("POST", "/bets", "alice", {{"marketId", first}, {"side", "YES"}, {"grossAmount", "10"}});
    call("POST", "/bets", "alice", {{"marketId", second}, {"side", "NO"}, {"grossAmount", "5"}});
    call("POST", "/bets", "bob", {{"marketId", first}, {"side", "NO"}, {"grossAmount", "7"}});

    auto own = call("GET", "/users/alice/bets", "alice");
    ASSERT_EQ(own.status, 200);
    EXPECT_EQ(parse(own)["bets"].size(), 2u);

    EXPECT_EQ(parse(call("GET", "/users/bob/bets", "admin"))["bets"].size(), 1u);
    EXPECT_EQ(call("GET", "/users/alice/bets", "bob").status, 403);
    EXPECT_EQ(call("GET", "/users/alice/bets").status, 401);
}

// ============================================================================
// Resolution and claims
// ============================================================================

TEST_F(ApiRouterTest, FullLifecycle) {
    std::string id = create_market();
    json bet = parse(call("POST", "/bets", "alice", {{"marketId", id}, {"side", "YES"}, {"grossAmount", "100"}}));
    std::string bet_id = bet["betId"];

    // Claims before resolution conflict
    auto early = call("POST", "/claims/" + bet_id, "alice");
    EXPECT_EQ(early.status, 409);
    EXPECT_EQ(parse(early)["error"], "not_resolved");

    EXPECT_EQ(call("PATCH", "/markets/" + id + "/resolve", "bob", {{"outcome", "YES"}}).status, 403);

    auto resolved = call("PATCH", "/markets/" + id + "/resolve", "carol", {{"outcome", "YES"}, {"note", "opened"}});
    ASSERT_EQ(resolved.status, 200);
    EXPECT_EQ(parse(resolved)["status"], "resolved");
    EXPECT_EQ(parse(resolved)["outcome"], "YES");

    auto again = call("PATCH", "/markets/" + id + "/resolve", "admin", {{"outcome", "NO"}});
    EXPECT_EQ(again.status, 409);
    EXPECT_EQ(parse(again)["error"], "already_resolved");

    auto late_bet = call("POST", "/bets", "bob", {{"marketId", id}, {"side", "NO"}, {"grossAmount", "5"}});
    EXPECT_EQ(late_bet.status, 403);
    EXPECT_EQ(parse(late_bet)["error"], "market_closed");

    auto unclaimed = call("GET", "/users/alice/unclaimed", "alice");
    ASSERT_EQ(unclaimed.status, 200);
    EXPECT_EQ(parse(unclaimed)["total"], "176.00");
    EXPECT_EQ(call("GET", "/users/alice/unclaimed", "bob").status, 403);

    EXPECT_EQ(call("POST", "/claims/" + bet_id, "bob").status, 403);

    auto claim = call("POST", "/claims/" + bet_id, "alice");
    ASSERT_EQ(claim.status, 200) << claim.body;
    json payout = parse(claim);
    EXPECT_EQ(payout["won"], true);
    EXPECT_EQ(payout["payout"], "176.00");
    EXPECT_EQ(payout["transferStatus"], "confirmed");
    EXPECT_EQ(engine_->wallet().balance("alice"), Amount::from_units(576));

    auto twice = call("POST", "/claims/" + bet_id, "alice");
    EXPECT_EQ(twice.status, 409);
    EXPECT_EQ(parse(twice)["error"], "already_claimed");

    auto retry = call("POST", "/claims/" + bet_id + "/retry", "alice");
    EXPECT_EQ(retry.status, 200);
    EXPECT_EQ(engine_->wallet().balance("alice"), Amount::from_units(576));
}

TEST_F(ApiRouterTest, PendingSettlementCarriesRetryToken) {
    SettlementPendingError pending("bet-1:payout", "credit unresolved");
    EXPECT_EQ(http_status_for(pending.code()), 503);

    json body = error_body(pending);
    EXPECT_EQ(body["error"], "settlement_pending");
    EXPECT_EQ(body["category"], "dependency");
    EXPECT_EQ(body["retryToken"], "bet-1:payout");
}

TEST_F(ApiRouterTest, HeaderLookupIsCaseInsensitive) {
    ApiRequest req;
    req.headers["x-user-id"] = "alice";
    EXPECT_EQ(req.header("X-User-Id"), "alice");
    EXPECT_EQ(req.header("X-Missing"), "");
}
