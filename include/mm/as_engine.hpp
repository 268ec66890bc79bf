#pragma once

#include "mm/clock.hpp"
#include "mm/pricing_engine.hpp"

#include <deque>

namespace mm {

// Avellaneda-Stoikov inventory model on the 0..1 price scale.
//   reservation r = mid - q * gamma * sigma^2 * T
//   spread      s = gamma * sigma^2 * T + (2 / gamma) * ln(1 + gamma / kappa)
//   gamma         = gamma_base * (1 + gamma_alpha * |q|)
// with q = inventory / max_inventory and sigma = vol_pts / 100.
struct ASParams {
    double gamma_base = 0.1;
    double gamma_alpha = 0.5;
    double kappa = 1.5;
    double T = 1.0;
    double min_spread_pts = 1.0;
    double max_spread_pts = 15.0;
};

struct ASQuote {
    double bid = 0.0;
    double ask = 0.0;
    double reservation_price = 0.0;
    double spread_pts = 0.0;
};

double compute_dynamic_gamma(double gamma_base, double alpha, double inventory_ratio);

double compute_reservation_price(double mid, double inventory, double max_inventory,
                                 double gamma, double vol_pts, double T);

// Spread in price units. Falls back to two ticks for non-positive gamma or kappa.
double compute_optimal_spread(double gamma, double vol_pts, double T, double kappa);

// Never quotes the ask below avg_entry + 1 tick while long.
ASQuote compute_as_quotes(double mid,
                          double inventory,
                          double max_inventory,
                          double vol_pts,
                          double T,
                          const ASParams& params,
                          double avg_entry_price = 0.0);

// Days to resolution normalised into (0, 1].
double estimate_time_remaining(double days_to_resolution, double max_days = 30.0);

// Fill-arrival intensity from a sliding window of fill timestamps.
class KappaEstimator {
public:
    explicit KappaEstimator(int window_minutes = 60, double default_kappa = 1.5);

    void record_fill(TimePoint now = system_now());
    [[nodiscard]] double kappa(TimePoint now = system_now()) const;
    [[nodiscard]] std::size_t fill_count() const { return fills_.size(); }
    void reset();

private:
    void prune(TimePoint now);

    std::chrono::seconds window_;
    double default_kappa_;
    std::deque<TimePoint> fills_;
};

} // namespace mm
