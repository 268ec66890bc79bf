#pragma once

#include "clob/venue.hpp"
#include "mm/clock.hpp"
#include "mm/order_state.hpp"

#include <optional>
#include <utility>

namespace mm {

// Prices live on a 0.01 grid inside [0.01, 0.99]. "Points" are hundredths of a dollar.
constexpr double kTickSize = 0.01;
constexpr double kMinPrice = 0.01;
constexpr double kMaxPrice = 0.99;

struct BidAsk {
    double bid = 0.0;
    double ask = 0.0;
};

struct DeltaWeights {
    double a = 0.3;   // volatility
    double b = 0.2;   // book imbalance
    double c = 0.3;   // staleness
    double d = 0.2;   // fee buffer
};

double round_to_tick(double price);

double clamp(double value, double low, double high);

// Depth-weighted mid leaning toward the heavier side. Empty when the book is
// one-sided or crossed.
std::optional<double> compute_weighted_mid(const clob::BookSummary& book);

// Half-spread in points: clamp(a*vol + b*|imb|*10 + c*stale*5 + d*1, min, max).
double compute_dynamic_delta(double vol_short,
                             double book_imbalance,
                             double stale_risk,
                             double delta_min = 1.5,
                             double delta_max = 8.0,
                             const DeltaWeights& weights = {},
                             double tracked_vol = 0.0);

// Inventory shift in points: -r*k1 - sign(r)*r^2*k2, r clamped to [-1, 1].
double compute_skew(double net_inventory,
                    double max_inventory,
                    double skew_factor = 0.5,
                    double quadratic_factor = 0.3);

BidAsk compute_bid_ask(double mid, double delta_pts, double skew_pts = 0.0);

// Quote size in collateral, zero once inventory reaches capacity.
double compute_quote_size(double capital,
                          double max_per_market,
                          double current_inventory_usdc,
                          double max_inventory,
                          double base_size_usd = 5.0);

// Compares against the mid observed at quote time when it was recorded.
bool should_requote(const QuotePair* current, double new_mid, double threshold_pts = 0.5);

// EWMA of squared mid changes in points; reports the standard deviation.
class VolTracker {
public:
    explicit VolTracker(int halflife = 20);

    double update(double mid);
    [[nodiscard]] double vol() const;
    void reset();

private:
    double alpha_;
    std::optional<double> ewma_var_;
    std::optional<double> last_mid_;
};

// 0 when the mid just moved, 1 once it has been flat for the threshold.
class StaleTracker {
public:
    explicit StaleTracker(double threshold_seconds = 60.0);

    void update_if_changed(double mid, TimePoint now = system_now());
    [[nodiscard]] double staleness(TimePoint now = system_now()) const;
    void reset();

private:
    double threshold_seconds_;
    std::optional<double> last_mid_;
    std::optional<TimePoint> last_change_;
};

} // namespace mm
