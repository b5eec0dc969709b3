#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"

using namespace settle;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = "/tmp/test_settle_config_" + generate_uuid() + ".json";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        unsetenv("SETTLE_DB_PATH");
        unsetenv("SETTLE_WALLET_API_KEY");
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.fees.platform_fee_bps, 200);
    EXPECT_EQ(config.fees.creator_fee_bps, 1000);
    EXPECT_EQ(config.markets.seed_liquidity, Amount::from_units(1000));
    EXPECT_EQ(config.wallet.mode, "ledger");
}

TEST_F(ConfigTest, SaveLoadRoundTrip) {
    Config config;
    config.db_path = "/var/lib/settle/ledger.db";
    config.admin_users = {"ops", "root"};
    config.fees.platform_fee_bps = 150;
    config.markets.seed_liquidity = Amount::parse("250.75");
    config.server.port = 9000;
    config.reconciler.interval_seconds = 5;
    config.save(path_);

    Config loaded = Config::load(path_);
    EXPECT_EQ(loaded.db_path, "/var/lib/settle/ledger.db");
    EXPECT_EQ(loaded.admin_users.size(), 2u);
    EXPECT_TRUE(loaded.is_admin("ops"));
    EXPECT_FALSE(loaded.is_admin("alice"));
    EXPECT_EQ(loaded.fees.platform_fee_bps, 150);
    EXPECT_EQ(loaded.markets.seed_liquidity, Amount::parse("250.75"));
    EXPECT_EQ(loaded.server.port, 9000);
    EXPECT_EQ(loaded.reconciler.interval_seconds, 5);
}

TEST_F(ConfigTest, CredentialsAreNotSaved) {
    Config config;
    config.wallet.api_key = "key";
    config.wallet.api_secret = "secret";

    nlohmann::json j;
    to_json(j, config);
    EXPECT_FALSE(j["wallet"].contains("api_key"));
    EXPECT_FALSE(j["wallet"].contains("api_secret"));
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    write(R"({"fees": {"creator_fee_bps": 500}, "markets": {"seed_liquidity": 50}})");
    Config loaded = Config::load(path_);
    EXPECT_EQ(loaded.fees.creator_fee_bps, 500);
    EXPECT_EQ(loaded.fees.platform_fee_bps, 200);
    EXPECT_EQ(loaded.markets.seed_liquidity, Amount::from_units(50));
    EXPECT_EQ(loaded.server.port, 8080);
}

TEST_F(ConfigTest, RejectsNonPositiveSeed) {
    Config config;
    config.markets.seed_liquidity = Amount::zero();
    EXPECT_FALSE(config.validate());

    write(R"({"markets": {"seed_liquidity": "-1"}})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, RejectsFeesOfHundredPercent) {
    Config config;
    config.fees.platform_fee_bps = 5000;
    config.fees.creator_fee_bps = 5000;
    EXPECT_FALSE(config.validate());

    config.fees.creator_fee_bps = 4999;
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, DebitGraceMustOutlastWalletRetries) {
    Config config;
    // 3 attempts of 5000ms plus 100ms and 200ms of backoff
    EXPECT_EQ(config.wallet.worst_case_call_ms(), 15'300);

    config.reconciler.debit_grace_ms = 1;
    EXPECT_FALSE(config.validate());

    config.reconciler.debit_grace_ms = 15'300;
    EXPECT_FALSE(config.validate());

    config.reconciler.debit_grace_ms = 15'301;
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, RejectsUnknownWalletMode) {
    Config config;
    config.wallet.mode = "carrier-pigeon";
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::load("/tmp/definitely-not-here.json"), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("SETTLE_DB_PATH", "/tmp/override.db", 1);
    setenv("SETTLE_WALLET_API_KEY", "env-key", 1);

    Config config;
    config.apply_env_overrides();
    EXPECT_EQ(config.db_path, "/tmp/override.db");
    EXPECT_EQ(config.wallet.api_key, "env-key");
    EXPECT_TRUE(config.wallet.api_secret.empty());
}
