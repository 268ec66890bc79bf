#pragma once

#include "clob/venue.hpp"
#include "mm/store.hpp"

#include <cstddef>
#include <vector>

namespace mm {

struct PnlSummary {
    double gross_pnl = 0.0;
    double net_pnl = 0.0;
    double total_fees = 0.0;
    int num_round_trips = 0;
    double total_buy_size = 0.0;
    double total_sell_size = 0.0;
};

// Basis points of price improvement against the mid. Positive is favourable.
double fill_quality_bps(double fill_price, double mid_at_fill, clob::Side side);

// Basis points the mid moved against the fill afterwards. Positive is adverse.
double adverse_selection_bps(double mid_at_fill, double mid_later, clob::Side side);

// Mean fill quality over fills that carry a mid.
double average_fill_quality_bps(const std::vector<FillRecord>& fills);

PnlSummary compute_pnl(const std::vector<FillRecord>& fills);

// Percentage change of portfolio value over the day; 0 without a start value.
// Every return series in this module uses this convention.
double daily_return_pct(double start_value, double end_value);

// Annualised (365 days) from daily percentage returns.
double sharpe_ratio(const std::vector<double>& daily_returns_pct, double risk_free_rate_pct = 0.0);

// Sharpe over the daily returns of the last `days` records, oldest first.
double rolling_sharpe(const std::vector<DailyMetrics>& history, std::size_t days = 7);

// Per-share P&L of buys and sells matched in price order, lowest with lowest.
std::vector<double> round_trip_pnls(const std::vector<FillRecord>& fills);

// Gross gains over gross losses; infinity with gains but no losses.
double profit_factor_from_round_trips(const std::vector<double>& round_trip_pnls);

double inventory_turn_rate(int fills_count, double avg_inventory, double period_hours);

} // namespace mm
