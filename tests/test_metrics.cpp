#include "mm/metrics.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using Catch::Approx;
using clob::Side;

namespace {

mm::FillRecord fill(Side side, double price, double size, double mid = 0.0, double fees = 0.0) {
    mm::FillRecord record;
    record.side = side;
    record.price = price;
    record.size = size;
    record.mid_at_fill = mid;
    record.fees = fees;
    return record;
}

} // namespace

TEST_CASE("fill quality rewards buying under and selling over the mid") {
    CHECK(mm::fill_quality_bps(0.49, 0.50, Side::Buy) == Approx(200.0));
    CHECK(mm::fill_quality_bps(0.51, 0.50, Side::Sell) == Approx(200.0));
    CHECK(mm::fill_quality_bps(0.51, 0.50, Side::Buy) == Approx(-200.0));
    CHECK(mm::fill_quality_bps(0.51, 0.0, Side::Buy) == Approx(0.0));
}

TEST_CASE("adverse selection is positive when the mid runs against the fill") {
    CHECK(mm::adverse_selection_bps(0.50, 0.48, Side::Buy) == Approx(400.0));
    CHECK(mm::adverse_selection_bps(0.50, 0.52, Side::Sell) == Approx(400.0));
    CHECK(mm::adverse_selection_bps(0.50, 0.52, Side::Buy) == Approx(-400.0));
}

TEST_CASE("average fill quality skips fills without a mid") {
    const std::vector<mm::FillRecord> fills{
        fill(Side::Buy, 0.49, 10.0, 0.50),
        fill(Side::Sell, 0.50, 10.0, 0.50),
        fill(Side::Sell, 0.90, 10.0, 0.0),
    };
    CHECK(mm::average_fill_quality_bps(fills) == Approx(100.0));
    CHECK(mm::average_fill_quality_bps({}) == Approx(0.0));
}

TEST_CASE("pnl counts matched round trips net of fees") {
    const std::vector<mm::FillRecord> fills{
        fill(Side::Buy, 0.45, 10.0, 0.0, 0.01),
        fill(Side::Sell, 0.55, 10.0, 0.0, 0.01),
    };
    const auto pnl = mm::compute_pnl(fills);
    CHECK(pnl.gross_pnl == Approx(1.0));
    CHECK(pnl.net_pnl == Approx(0.98));
    CHECK(pnl.num_round_trips == 10);

    const auto one_sided = mm::compute_pnl({fill(Side::Buy, 0.45, 10.0)});
    CHECK(one_sided.gross_pnl == Approx(0.0));
    CHECK(one_sided.total_buy_size == Approx(10.0));
}

TEST_CASE("daily return is a percentage of the start value") {
    CHECK(mm::daily_return_pct(100.0, 102.0) == Approx(2.0));
    CHECK(mm::daily_return_pct(0.0, 102.0) == Approx(0.0));
}

TEST_CASE("sharpe ratio annualises daily percentage returns") {
    CHECK(mm::sharpe_ratio({1.0}) == Approx(0.0));

    const std::vector<double> returns{1.0, 2.0, 3.0};
    // mean 2, sample stddev 1
    CHECK(mm::sharpe_ratio(returns) == Approx(2.0 * std::sqrt(365.0)));

    const std::vector<double> flat{1.0, 1.0};
    CHECK(mm::sharpe_ratio(flat) == Approx(1.0 / 0.001 * std::sqrt(365.0)));
}

TEST_CASE("profit factor") {
    CHECK(mm::profit_factor_from_round_trips({2.0, -1.0, 1.0}) == Approx(3.0));
    CHECK(mm::profit_factor_from_round_trips({1.0}) == std::numeric_limits<double>::infinity());
    CHECK(mm::profit_factor_from_round_trips({}) == Approx(0.0));
}

TEST_CASE("inventory turn rate scales fills to a day") {
    CHECK(mm::inventory_turn_rate(12, 10.0, 12.0) == Approx(1.2));
    CHECK(mm::inventory_turn_rate(12, 0.0, 12.0) == Approx(0.0));
}

TEST_CASE("rolling sharpe reads the most recent days only") {
    std::vector<mm::DailyMetrics> history;
    for (double r : {-50.0, 1.0, 2.0, 1.0, 2.0}) {
        mm::DailyMetrics day;
        day.daily_return_pct = r;
        history.push_back(day);
    }

    CHECK(mm::rolling_sharpe(history, 4) == Approx(mm::sharpe_ratio({1.0, 2.0, 1.0, 2.0})));
    CHECK(mm::rolling_sharpe(history, 4) > 0.0);
    CHECK(mm::rolling_sharpe(history) < 0.0);
    CHECK(mm::rolling_sharpe({}, 7) == Approx(0.0));
}

TEST_CASE("round trips pair buys and sells in price order") {
    std::vector<mm::FillRecord> fills;
    const auto add = [&fills](clob::Side side, double price) {
        mm::FillRecord fill;
        fill.side = side;
        fill.price = price;
        fill.size = 1.0;
        fills.push_back(fill);
    };
    add(clob::Side::Sell, 0.55);
    add(clob::Side::Buy, 0.50);
    add(clob::Side::Buy, 0.40);
    add(clob::Side::Sell, 0.45);
    add(clob::Side::Buy, 0.60);

    const auto pnls = mm::round_trip_pnls(fills);
    REQUIRE(pnls.size() == 2);
    CHECK(pnls[0] == Approx(0.05));
    CHECK(pnls[1] == Approx(0.05));
    CHECK(std::isinf(mm::profit_factor_from_round_trips(pnls)));
}
