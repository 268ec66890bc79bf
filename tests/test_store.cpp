#include "mm/store.hpp"
#include "temp_dir.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using Catch::Approx;

namespace {

mm::JsonlStoreConfig config_in(const mm::test::TempDir& dir) {
    mm::JsonlStoreConfig config;
    config.data_dir = dir.path() / "data";
    return config;
}

mm::QuotePair live_pair(const std::string& market_id) {
    mm::QuotePair pair;
    pair.market_id = market_id;
    pair.token_id = market_id + "-yes";
    pair.bid_price = 0.45;
    pair.ask_price = 0.55;
    pair.bid_size = 10.0;
    pair.ask_size = 10.0;
    pair.bid_order_id = std::string("b-") + market_id;
    pair.ask_order_id = std::string("a-") + market_id;
    pair.bid_state = mm::OrderState::Live;
    pair.ask_state = mm::OrderState::Partial;
    pair.ask_reported = 3.0;
    pair.created_at = mm::from_epoch_ms(1700000000000LL);
    return pair;
}

mm::FillRecord fill_of(const std::string& order_id, double cumulative, long long ms) {
    mm::FillRecord fill;
    fill.order_id = order_id;
    fill.market_id = "m1";
    fill.token_id = "m1-yes";
    fill.side = clob::Side::Sell;
    fill.price = 0.55;
    fill.size = cumulative;
    fill.cumulative_matched = cumulative;
    fill.timestamp = mm::from_epoch_ms(ms);
    return fill;
}

} // namespace

TEST_CASE("quote upserts assign ids once and survive a reload") {
    mm::test::TempDir dir;
    mm::JsonlStore store{config_in(dir)};
    CHECK(store.load() == 0);

    auto pair = live_pair("m1");
    const auto id = store.upsert_quote(pair);
    CHECK(id == 1);
    CHECK(store.upsert_quote(live_pair("m2")) == 2);

    pair.record_id = id;
    pair.bid_state = mm::OrderState::Filled;
    CHECK(store.upsert_quote(pair) == id);

    mm::JsonlStore reloaded{config_in(dir)};
    CHECK(reloaded.load() == 3);
    const auto quotes = reloaded.active_quotes("m1");
    REQUIRE(quotes.size() == 1);
    CHECK(quotes[0].bid_state == mm::OrderState::Filled);
    CHECK(quotes[0].ask_state == mm::OrderState::Partial);
    CHECK(quotes[0].ask_reported == Approx(3.0));
    REQUIRE(quotes[0].ask_order_id.has_value());
    CHECK(*quotes[0].ask_order_id == "a-m1");
    CHECK(quotes[0].created_at == mm::from_epoch_ms(1700000000000LL));
    CHECK(reloaded.active_quotes().size() == 2);

    // Ids continue after the highest replayed one.
    CHECK(reloaded.upsert_quote(live_pair("m3")) == 3);
}

TEST_CASE("terminal quotes drop out of the active set") {
    mm::test::TempDir dir;
    mm::JsonlStore store{config_in(dir)};
    store.load();

    auto pair = live_pair("m1");
    pair.record_id = store.upsert_quote(pair);
    pair.bid_state = mm::OrderState::Cancelled;
    pair.ask_state = mm::OrderState::Filled;
    store.upsert_quote(pair);
    CHECK(store.active_quotes().empty());
}

TEST_CASE("fills are keyed by order and cumulative quantity") {
    mm::test::TempDir dir;
    mm::JsonlStore store{config_in(dir)};
    store.load();

    CHECK(store.record_fill(fill_of("o1", 4.0, 1700000001000LL)));
    CHECK_FALSE(store.record_fill(fill_of("o1", 4.0, 1700000009000LL)));
    CHECK(store.record_fill(fill_of("o1", 10.0, 1700000002000LL)));
    CHECK(mm::fill_key("o1", 4.0) == "o1@4.000000");

    const auto fills = store.fills_since(mm::from_epoch_ms(1700000000000LL));
    REQUIRE(fills.size() == 2);
    CHECK(fills[0].cumulative_matched == Approx(4.0));
    CHECK(fills[1].side == clob::Side::Sell);
    CHECK(store.fills_since(mm::from_epoch_ms(1700000001500LL)).size() == 1);

    mm::JsonlStore reloaded{config_in(dir)};
    reloaded.load();
    CHECK_FALSE(reloaded.record_fill(fill_of("o1", 10.0, 1700000003000LL)));
}

TEST_CASE("inventory records are keyed by market and token") {
    mm::test::TempDir dir;
    mm::JsonlStore store{config_in(dir)};
    store.load();

    store.upsert_inventory({"m1", "yes", 10.0, 0.45, 0.0});
    store.upsert_inventory({"m1", "no", 5.0, 0.50, 0.0, mm::Leg::No});
    store.upsert_inventory({"m1", "yes", 4.0, 0.45, 0.6});
    store.upsert_inventory({"m2", "yes", 1.0, 0.30, 0.0});

    const auto m1 = store.inventory("m1");
    REQUIRE(m1.size() == 2);
    CHECK(store.inventory().size() == 3);

    mm::JsonlStore reloaded{config_in(dir)};
    reloaded.load();
    const auto records = reloaded.inventory("m1");
    REQUIRE(records.size() == 2);
    for (const auto& record : records) {
        if (record.token_id == "yes") {
            CHECK(record.leg == mm::Leg::Yes);
            CHECK(record.position == Approx(4.0));
            CHECK(record.realized_pnl == Approx(0.6));
        } else {
            CHECK(record.leg == mm::Leg::No);
        }
    }
}

TEST_CASE("daily metrics are upserted by date") {
    mm::test::TempDir dir;
    mm::JsonlStore store{config_in(dir)};
    store.load();

    mm::DailyMetrics day;
    day.date = "2026-01-02";
    day.start_value = 100.0;
    day.end_value = 101.0;
    day.fills = 3;
    store.upsert_daily_metrics(day);
    day.end_value = 102.0;
    day.fills = 5;
    store.upsert_daily_metrics(day);

    day.date = "2026-01-01";
    store.upsert_daily_metrics(day);

    const auto stored = store.daily_metrics("2026-01-02");
    REQUIRE(stored.has_value());
    CHECK(stored->end_value == Approx(102.0));
    CHECK(stored->fills == 5);
    CHECK_FALSE(store.daily_metrics("2026-01-03").has_value());

    const auto history = store.metrics_history();
    REQUIRE(history.size() == 2);
    CHECK(history[0].date == "2026-01-01");
}

TEST_CASE("malformed journal lines are skipped on load") {
    mm::test::TempDir dir;
    const auto config = config_in(dir);
    {
        mm::JsonlStore store{config};
        store.load();
        store.set_high_water_mark(150.0);
    }
    {
        std::ofstream journal(config.data_dir / config.journal_name, std::ios::app);
        journal << "{not json\n";
        journal << "\n";
    }

    mm::JsonlStore store{config};
    CHECK(store.load() == 1);
    REQUIRE(store.high_water_mark().has_value());
    CHECK(*store.high_water_mark() == Approx(150.0));
}

namespace {

std::size_t journal_lines(const mm::JsonlStore& store) {
    std::ifstream input(store.journal_path());
    std::size_t count = 0;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty()) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST_CASE("compaction keeps one line per live key and round-trips") {
    mm::test::TempDir dir;
    auto config = config_in(dir);
    config.compact_every = 0;
    {
        mm::JsonlStore store{config};
        store.load();

        auto done = live_pair("m1");
        done.record_id = store.upsert_quote(done);
        done.bid_state = mm::OrderState::Filled;
        done.ask_state = mm::OrderState::Cancelled;
        store.upsert_quote(done);

        auto live = live_pair("m2");
        live.record_id = store.upsert_quote(live);
        live.bid_reported = 2.0;
        store.upsert_quote(live);

        store.record_fill(fill_of("o1", 4.0, 1700000001000LL));
        store.upsert_inventory({"m2", "m2-yes", 3.0, 0.45, 0.0});
        store.upsert_inventory({"m2", "m2-yes", 6.0, 0.46, 0.1});
        store.upsert_inventory({"m2", "m2-no", 2.0, 0.50, 0.0, mm::Leg::No});
        store.set_high_water_mark(120.0);
        store.set_high_water_mark(125.0);
        CHECK(journal_lines(store) == 10);

        // meta, one live quote, one fill, two inventory legs, hwm.
        CHECK(store.compact() == 6);
        CHECK(journal_lines(store) == 6);
        CHECK_FALSE(std::filesystem::exists(store.journal_path().string() + ".tmp"));
    }

    mm::JsonlStore reloaded{config};
    CHECK(reloaded.load() == 6);
    const auto quotes = reloaded.active_quotes();
    REQUIRE(quotes.size() == 1);
    CHECK(quotes[0].market_id == "m2");
    CHECK(quotes[0].bid_reported == Approx(2.0));
    REQUIRE(reloaded.high_water_mark().has_value());
    CHECK(*reloaded.high_water_mark() == Approx(125.0));
    CHECK_FALSE(reloaded.record_fill(fill_of("o1", 4.0, 1700000005000LL)));

    const auto legs = reloaded.inventory("m2");
    REQUIRE(legs.size() == 2);
    for (const auto& leg : legs) {
        if (leg.token_id == "m2-yes") {
            CHECK(leg.position == Approx(6.0));
            CHECK(leg.leg == mm::Leg::Yes);
        } else {
            CHECK(leg.leg == mm::Leg::No);
        }
    }

    // The dropped terminal quote still holds its id.
    CHECK(reloaded.upsert_quote(live_pair("m3")) == 3);
}

TEST_CASE("journal compacts itself after enough appends") {
    mm::test::TempDir dir;
    auto config = config_in(dir);
    config.compact_every = 4;
    mm::JsonlStore store{config};
    store.load();

    for (int i = 1; i <= 4; ++i) {
        store.set_high_water_mark(100.0 + i);
    }
    // meta and hwm.
    CHECK(journal_lines(store) == 2);
    store.set_high_water_mark(200.0);
    CHECK(journal_lines(store) == 3);

    mm::JsonlStore reloaded{config};
    reloaded.load();
    REQUIRE(reloaded.high_water_mark().has_value());
    CHECK(*reloaded.high_water_mark() == Approx(200.0));
}

TEST_CASE("compaction drops fills past the retention window") {
    mm::test::TempDir dir;
    auto config = config_in(dir);
    config.compact_every = 0;
    config.fill_retention_days = 1;
    mm::JsonlStore store{config};
    store.load();

    const long long day_ms = 24LL * 3600 * 1000;
    store.record_fill(fill_of("old", 1.0, 1700000000000LL));
    store.record_fill(fill_of("recent", 1.0, 1700000000000LL + day_ms));
    store.record_fill(fill_of("newest", 1.0, 1700000000000LL + 2 * day_ms - 1000));
    store.compact();

    const auto fills = store.fills_since(mm::from_epoch_ms(0));
    REQUIRE(fills.size() == 2);
    CHECK(fills[0].order_id == "recent");
    CHECK(fills[1].order_id == "newest");
}

TEST_CASE("status snapshot is replaced whole") {
    mm::test::TempDir dir;
    mm::JsonlStore store{config_in(dir)};
    store.load();

    store.write_status(nlohmann::json{{"cycle", 1}});
    store.write_status(nlohmann::json{{"cycle", 2}});

    std::ifstream input(store.status_path());
    const auto status = nlohmann::json::parse(input);
    CHECK(status["cycle"] == 2);
    CHECK_FALSE(std::filesystem::exists(store.status_path().string() + ".tmp"));
}

TEST_CASE("store without a data directory refuses to load") {
    mm::JsonlStoreConfig config;
    config.data_dir.clear();
    mm::JsonlStore store{config};
    CHECK_THROWS_AS(store.load(), std::runtime_error);
}
