#include "mm/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mm {
namespace {

constexpr double kBps = 10000.0;
constexpr double kTradingDays = 365.0;
constexpr double kMinStdDev = 0.001;

} // namespace

double fill_quality_bps(double fill_price, double mid_at_fill, clob::Side side) {
    if (mid_at_fill <= 0.0) {
        return 0.0;
    }
    const double improvement = side == clob::Side::Buy ? (mid_at_fill - fill_price) / mid_at_fill
                                                       : (fill_price - mid_at_fill) / mid_at_fill;
    return improvement * kBps;
}

double adverse_selection_bps(double mid_at_fill, double mid_later, clob::Side side) {
    if (mid_at_fill <= 0.0) {
        return 0.0;
    }
    const double movement = side == clob::Side::Buy ? (mid_at_fill - mid_later) / mid_at_fill
                                                    : (mid_later - mid_at_fill) / mid_at_fill;
    return movement * kBps;
}

double average_fill_quality_bps(const std::vector<FillRecord>& fills) {
    double total = 0.0;
    int count = 0;
    for (const auto& fill : fills) {
        if (fill.mid_at_fill <= 0.0) {
            continue;
        }
        total += fill_quality_bps(fill.price, fill.mid_at_fill, fill.side);
        ++count;
    }
    return count > 0 ? total / count : 0.0;
}

PnlSummary compute_pnl(const std::vector<FillRecord>& fills) {
    double buy_cost = 0.0;
    double sell_revenue = 0.0;
    PnlSummary summary;

    for (const auto& fill : fills) {
        summary.total_fees += fill.fees;
        if (fill.side == clob::Side::Buy) {
            buy_cost += fill.price * fill.size;
            summary.total_buy_size += fill.size;
        } else {
            sell_revenue += fill.price * fill.size;
            summary.total_sell_size += fill.size;
        }
    }

    const double matched = std::min(summary.total_buy_size, summary.total_sell_size);
    summary.gross_pnl = matched > 0.0 ? sell_revenue - buy_cost : 0.0;
    summary.net_pnl = summary.gross_pnl - summary.total_fees;
    summary.num_round_trips = matched > 0.0 ? static_cast<int>(matched) : 0;
    return summary;
}

double daily_return_pct(double start_value, double end_value) {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value * 100.0;
}

double sharpe_ratio(const std::vector<double>& daily_returns_pct, double risk_free_rate_pct) {
    if (daily_returns_pct.size() < 2) {
        return 0.0;
    }
    const double daily_rf = risk_free_rate_pct / kTradingDays;
    double mean = 0.0;
    for (double r : daily_returns_pct) {
        mean += r - daily_rf;
    }
    mean /= static_cast<double>(daily_returns_pct.size());

    double variance = 0.0;
    for (double r : daily_returns_pct) {
        const double diff = (r - daily_rf) - mean;
        variance += diff * diff;
    }
    variance /= static_cast<double>(daily_returns_pct.size() - 1);
    const double stddev = variance > 0.0 ? std::sqrt(variance) : kMinStdDev;
    return mean / stddev * std::sqrt(kTradingDays);
}

double rolling_sharpe(const std::vector<DailyMetrics>& history, std::size_t days) {
    const std::size_t first = history.size() > days ? history.size() - days : 0;
    std::vector<double> returns;
    returns.reserve(history.size() - first);
    for (std::size_t i = first; i < history.size(); ++i) {
        returns.push_back(history[i].daily_return_pct);
    }
    return sharpe_ratio(returns);
}

std::vector<double> round_trip_pnls(const std::vector<FillRecord>& fills) {
    std::vector<double> buys;
    std::vector<double> sells;
    for (const auto& fill : fills) {
        (fill.side == clob::Side::Buy ? buys : sells).push_back(fill.price);
    }
    std::sort(buys.begin(), buys.end());
    std::sort(sells.begin(), sells.end());

    std::vector<double> pnls;
    const std::size_t pairs = std::min(buys.size(), sells.size());
    pnls.reserve(pairs);
    for (std::size_t i = 0; i < pairs; ++i) {
        pnls.push_back(sells[i] - buys[i]);
    }
    return pnls;
}

double profit_factor_from_round_trips(const std::vector<double>& round_trip_pnls) {
    double gains = 0.0;
    double losses = 0.0;
    for (double pnl : round_trip_pnls) {
        if (pnl > 0.0) {
            gains += pnl;
        } else if (pnl < 0.0) {
            losses -= pnl;
        }
    }
    if (losses == 0.0) {
        return gains > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return gains / losses;
}

double inventory_turn_rate(int fills_count, double avg_inventory, double period_hours) {
    if (avg_inventory <= 0.0 || period_hours <= 0.0) {
        return 0.0;
    }
    const double daily_fills = fills_count * (24.0 / period_hours);
    return daily_fills / (2.0 * avg_inventory);
}

} // namespace mm
