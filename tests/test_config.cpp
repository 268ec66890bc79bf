#include "mm/config.hpp"
#include "temp_dir.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <fstream>
#include <map>

using Catch::Approx;

namespace {

mm::EnvLookup env_of(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("defaults apply when nothing is set") {
    const auto config = mm::load_mm_config(env_of({}));
    CHECK(config.mm_cycle_seconds == 10);
    CHECK(config.mm_delta_min == Approx(1.5));
    CHECK(config.mm_delta_max == Approx(8.0));
    CHECK(config.mm_max_markets == 10);
    CHECK(config.use_as_engine());
    CHECK(config.mm_hanging_orders);
    CHECK(config.mm_cross_cooldown_max_seconds == 600);
}

TEST_CASE("variables override defaults and derived configs follow") {
    const auto config = mm::load_mm_config(env_of({
        {"MM_CYCLE_SECONDS", " 5 "},
        {"MM_PRICING_ENGINE", "Legacy"},
        {"MM_POST_ONLY", "false"},
        {"MM_TWO_SIDED", "0"},
        {"MM_MAX_SPREAD_PTS", "9.5"},
        {"MM_DD_KILL_PCT", "30"},
        {"MM_AS_GAMMA_BASE", "0.2"},
        {"MM_MULTI_LEVEL_COUNT", ""},
    }));

    CHECK(config.mm_cycle_seconds == 5);
    CHECK(config.mm_pricing_engine == "legacy");
    CHECK_FALSE(config.use_as_engine());
    CHECK_FALSE(config.mm_post_only);
    CHECK_FALSE(config.mm_two_sided);
    CHECK(config.mm_multi_level_count == 1);

    CHECK(config.risk().max_spread_pts == Approx(9.5));
    CHECK(config.risk().dd_kill_pct == Approx(30.0));
    CHECK_FALSE(config.quoter().post_only);
    CHECK(config.as_params().gamma_base == Approx(0.2));
    CHECK(config.as_params().max_spread_pts == Approx(9.5));
}

TEST_CASE("arbitrage settings are read and handed to the executor") {
    const auto defaults = mm::load_mm_config(env_of({}));
    CHECK_FALSE(defaults.mm_arb_enabled);
    CHECK(defaults.arbitrage().min_profit_pct == Approx(0.5));
    CHECK(defaults.arbitrage().settle_wait.count() == 2000);

    const auto config = mm::load_mm_config(env_of({
        {"MM_ARB_ENABLED", "yes"},
        {"MM_ARB_MIN_PROFIT_PCT", "1.25"},
        {"MM_ARB_MAX_SIZE_USD", "20"},
        {"MM_ARB_GAS_COST_USD", "0.01"},
        {"MM_ARB_SETTLE_MS", "0"},
    }));
    CHECK(config.mm_arb_enabled);
    const auto arb = config.arbitrage();
    CHECK(arb.min_profit_pct == Approx(1.25));
    CHECK(arb.max_size_usd == Approx(20.0));
    CHECK(arb.gas_cost_usd == Approx(0.01));
    CHECK(arb.settle_wait.count() == 0);

    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_ARB_MAX_SIZE_USD", "0"}})), mm::ConfigError);
    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_ARB_SETTLE_MS", "-1"}})), mm::ConfigError);
}

TEST_CASE("malformed values name the variable") {
    try {
        mm::load_mm_config(env_of({{"MM_DELTA_MIN", "wide"}}));
        FAIL("expected ConfigError");
    } catch (const mm::ConfigError& ex) {
        CHECK(std::string(ex.what()).find("MM_DELTA_MIN") != std::string::npos);
    }

    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_MAX_MARKETS", "10x"}})), mm::ConfigError);
    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_HANGING_ORDERS", "maybe"}})), mm::ConfigError);
    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_PRICING_ENGINE", "glft"}})), mm::ConfigError);
}

TEST_CASE("inconsistent settings are rejected") {
    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_CYCLE_SECONDS", "0"}})), mm::ConfigError);
    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_DELTA_MIN", "9"}})), mm::ConfigError);
    CHECK_THROWS_AS(mm::load_mm_config(env_of({{"MM_DD_RESUME_PCT", "25"}})), mm::ConfigError);
}

TEST_CASE("app config reads venue and storage settings") {
    const auto config = mm::load_app_config(env_of({
        {"CLOB_BASE_URL", "http://localhost:8080"},
        {"CLOB_API_KEY", "key"},
        {"MM_DATA_DIR", "/tmp/mm"},
    }));
    CHECK(config.venue.base_url == "http://localhost:8080");
    CHECK(config.venue.api_key == "key");
    CHECK(config.venue.order_gateway_url.empty());
    CHECK(config.data_dir == "/tmp/mm");
    CHECK(config.markets_file == "markets.json");
}

TEST_CASE("env file lines are exported to the process") {
    mm::test::TempDir dir;
    const auto path = dir.path() / ".env";
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "POLYMM_TEST_PLAIN = value\n";
        out << "POLYMM_TEST_QUOTED=\"quoted value\"\n";
        out << "not a pair\n";
    }

    mm::load_env_file(path.string());
    CHECK(mm::process_env("POLYMM_TEST_PLAIN") == std::optional<std::string>("value"));
    CHECK(mm::process_env("POLYMM_TEST_QUOTED") == std::optional<std::string>("quoted value"));

    mm::load_env_file((dir.path() / "missing.env").string());
    unsetenv("POLYMM_TEST_PLAIN");
    unsetenv("POLYMM_TEST_QUOTED");
}
