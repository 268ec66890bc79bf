#include "fake_venue.hpp"
#include "mm/arbitrage.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using Catch::Approx;

namespace {

clob::BookSummary book(double best_bid, double best_ask, double depth = 100.0) {
    clob::BookSummary summary;
    summary.best_bid = best_bid;
    summary.best_ask = best_ask;
    summary.spread = best_ask - best_bid;
    summary.mid = (best_bid + best_ask) / 2.0;
    summary.bid_depth = depth;
    summary.ask_depth = depth;
    return summary;
}

mm::MarketInfo market() {
    mm::MarketInfo info;
    info.market_id = "m1";
    info.token_id = "m1-yes";
    info.no_token_id = "m1-no";
    info.condition_id = "m1-cond";
    return info;
}

mm::ArbitrageConfig instant_config() {
    mm::ArbitrageConfig config;
    config.settle_wait = std::chrono::milliseconds(0);
    return config;
}

mm::ArbOpportunity opportunity(mm::ArbType type, double yes_price, double no_price, double size) {
    mm::ArbOpportunity opp;
    opp.market_id = "m1";
    opp.condition_id = "m1-cond";
    opp.yes_token_id = "m1-yes";
    opp.no_token_id = "m1-no";
    opp.type = type;
    opp.yes_price = yes_price;
    opp.no_price = no_price;
    opp.max_size = size;
    return opp;
}

bool cancelled(const mm::test::FakeVenue& venue, const std::string& token_id) {
    for (const auto& id : venue.cancels) {
        const auto it = venue.orders.find(id);
        if (it != venue.orders.end() && it->second.request.token_id == token_id) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST_CASE("asks summing below one are a buy-merge") {
    const auto opp = mm::scan_for_arbitrage(book(0.40, 0.45), book(0.45, 0.50), market(), mm::ArbitrageConfig{});
    REQUIRE(opp.has_value());
    CHECK(opp->type == mm::ArbType::BuyMerge);
    CHECK(opp->yes_price == Approx(0.45));
    CHECK(opp->no_price == Approx(0.50));
    CHECK(opp->max_size == Approx(200.0));
    CHECK(opp->gross_profit_pct == Approx(0.05 / 0.95 * 100.0));
    CHECK(opp->net_profit_pct == Approx((0.05 * 200.0 - 0.005) / (0.95 * 200.0) * 100.0));
    CHECK(opp->condition_id == "m1-cond");
    CHECK(opp->no_token_id == "m1-no");
}

TEST_CASE("bids summing above one are a split-sell") {
    const auto opp = mm::scan_for_arbitrage(book(0.55, 0.60), book(0.50, 0.55), market(), mm::ArbitrageConfig{});
    REQUIRE(opp.has_value());
    CHECK(opp->type == mm::ArbType::SplitSell);
    CHECK(opp->yes_price == Approx(0.55));
    CHECK(opp->no_price == Approx(0.50));
    CHECK(opp->max_size == Approx(100.0 / 0.55));
    CHECK(opp->gross_profit_pct == Approx(5.0));
}

TEST_CASE("a fair book has no arbitrage") {
    const mm::ArbitrageConfig config;
    CHECK_FALSE(mm::scan_for_arbitrage(book(0.48, 0.52), book(0.48, 0.52), market(), config).has_value());
    CHECK_FALSE(mm::scan_for_arbitrage(book(0.0, 0.45), book(0.45, 0.50), market(), config).has_value());
}

TEST_CASE("thin books and gas costs suppress an opportunity") {
    mm::ArbitrageConfig config;
    CHECK_FALSE(mm::scan_for_arbitrage(book(0.40, 0.45, 2.0), book(0.45, 0.50, 2.0), market(), config).has_value());
    CHECK_FALSE(mm::scan_for_arbitrage(book(0.40, 0.499), book(0.45, 0.50), market(), config).has_value());

    config.gas_cost_usd = 20.0;
    CHECK_FALSE(mm::scan_for_arbitrage(book(0.40, 0.45), book(0.45, 0.50), market(), config).has_value());
}

TEST_CASE("buy-merge takes both asks and merges the pairs") {
    mm::test::FakeVenue venue;
    venue.fill_on_place["m1-yes"] = 10.0;
    venue.fill_on_place["m1-no"] = 10.0;
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::BuyMerge, 0.45, 0.50, 10.0));
    CHECK(result.success);
    CHECK(result.error.empty());
    CHECK(result.merged == Approx(10.0));
    CHECK(result.profit_usd == Approx(0.5));

    REQUIRE(venue.requests.size() == 2);
    CHECK(venue.requests[0].side == clob::Side::Buy);
    CHECK_FALSE(venue.requests[0].post_only);
    CHECK(venue.requests[1].token_id == "m1-no");
    REQUIRE(venue.merges.size() == 1);
    CHECK(venue.merges[0].first == "m1-cond");
    CHECK(venue.merges[0].second == Approx(10.0));

    const auto inv = ledger.get("m1");
    CHECK(inv.yes_position == Approx(0.0));
    CHECK(inv.no_position == Approx(0.0));
}

TEST_CASE("buy-merge books partial fills before giving up") {
    mm::test::FakeVenue venue;
    venue.fill_on_place["m1-yes"] = 10.0;
    venue.fill_on_place["m1-no"] = 3.0;
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::BuyMerge, 0.45, 0.50, 10.0));
    CHECK_FALSE(result.success);
    CHECK(result.error == "insufficient_fills");
    CHECK(result.yes_filled == Approx(10.0));
    CHECK(result.no_filled == Approx(3.0));
    CHECK(venue.merges.empty());
    CHECK(cancelled(venue, "m1-no"));
    CHECK_FALSE(cancelled(venue, "m1-yes"));

    const auto inv = ledger.get("m1");
    CHECK(inv.yes_token_id == "m1-yes");
    CHECK(inv.yes_position == Approx(10.0));
    CHECK(inv.yes_avg_entry == Approx(0.45));
    CHECK(inv.no_token_id == "m1-no");
    CHECK(inv.no_position == Approx(3.0));
    CHECK(inv.no_avg_entry == Approx(0.50));
}

TEST_CASE("a refused NO buy cancels the YES leg and keeps what it filled") {
    mm::test::FakeVenue venue;
    venue.reject_tokens.insert("m1-no");
    venue.fill_on_place["m1-yes"] = 4.0;
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::BuyMerge, 0.45, 0.50, 10.0));
    CHECK(result.error == "no_buy_failed");
    CHECK(result.yes_filled == Approx(4.0));
    CHECK(cancelled(venue, "m1-yes"));
    CHECK(ledger.get("m1").yes_position == Approx(4.0));
    CHECK(ledger.get("m1").no_position == Approx(0.0));
}

TEST_CASE("a refused YES buy leaves nothing behind") {
    mm::test::FakeVenue venue;
    venue.reject_tokens.insert("m1-yes");
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::BuyMerge, 0.45, 0.50, 10.0));
    CHECK(result.error == "yes_buy_failed");
    CHECK(venue.place_calls == 1);
    CHECK(ledger.snapshots().empty());
}

TEST_CASE("a failed merge keeps both legs in inventory") {
    mm::test::FakeVenue venue;
    venue.fill_on_place["m1-yes"] = 10.0;
    venue.fill_on_place["m1-no"] = 10.0;
    venue.merge_ok = false;
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::BuyMerge, 0.45, 0.50, 10.0));
    CHECK(result.error == "merge_failed");
    CHECK(ledger.get("m1").yes_position == Approx(10.0));
    CHECK(ledger.get("m1").no_position == Approx(10.0));
}

TEST_CASE("split-sell sells both legs of the split") {
    mm::test::FakeVenue venue;
    venue.fill_on_place["m1-yes"] = 10.0;
    venue.fill_on_place["m1-no"] = 10.0;
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::SplitSell, 0.55, 0.50, 10.0));
    CHECK(result.success);
    CHECK(result.profit_usd == Approx(0.5));
    REQUIRE(venue.splits.size() == 1);
    CHECK(venue.splits[0].second == Approx(10.0));
    CHECK(std::all_of(venue.requests.begin(), venue.requests.end(),
                      [](const clob::OrderRequest& r) { return r.side == clob::Side::Sell; }));

    const auto inv = ledger.get("m1");
    CHECK(inv.yes_position == Approx(0.0));
    CHECK(inv.no_position == Approx(0.0));
}

TEST_CASE("split-sell with one leg short records the sells and cancels the rest") {
    mm::test::FakeVenue venue;
    venue.fill_on_place["m1-yes"] = 10.0;
    venue.fill_on_place["m1-no"] = 2.0;
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::SplitSell, 0.55, 0.50, 10.0));
    CHECK_FALSE(result.success);
    CHECK(result.error == "partial_fills");
    CHECK(result.profit_usd == Approx(10.0 * 0.55 + 2.0 * 0.50 - 10.0));
    CHECK(cancelled(venue, "m1-no"));

    const auto inv = ledger.get("m1");
    CHECK(inv.yes_position == Approx(0.0));
    CHECK(inv.no_position == Approx(8.0));
}

TEST_CASE("a failed split places no orders") {
    mm::test::FakeVenue venue;
    venue.split_ok = false;
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    const auto result = executor.execute(opportunity(mm::ArbType::SplitSell, 0.55, 0.50, 10.0));
    CHECK(result.error == "split_failed");
    CHECK(venue.place_calls == 0);
    CHECK(ledger.snapshots().empty());
}

TEST_CASE("execution size is capped and rounded to a tenth") {
    mm::test::FakeVenue venue;
    venue.reject_tokens.insert("m1-yes");
    mm::InventoryLedger ledger;
    mm::ArbitrageExecutor executor{venue, ledger, instant_config()};

    CHECK(executor.execute(opportunity(mm::ArbType::BuyMerge, 0.45, 0.50, 123.4)).size == Approx(50.0));
    CHECK(executor.execute(opportunity(mm::ArbType::BuyMerge, 0.45, 0.50, 7.26)).size == Approx(7.3));
    REQUIRE(venue.requests.size() == 2);
    CHECK(venue.requests[1].size == Approx(7.3));
}
