#include "mm/as_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace mm {
namespace {

constexpr double kMinKappa = 0.5;
constexpr double kMaxKappa = 10.0;

double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

double compute_dynamic_gamma(double gamma_base, double alpha, double inventory_ratio) {
    return gamma_base * (1.0 + alpha * std::fabs(inventory_ratio));
}

double compute_reservation_price(double mid, double inventory, double max_inventory,
                                 double gamma, double vol_pts, double T) {
    if (max_inventory <= 0.0) {
        return mid;
    }
    const double q = inventory / max_inventory;
    const double sigma = vol_pts / 100.0;
    return mid - q * gamma * sigma * sigma * T;
}

double compute_optimal_spread(double gamma, double vol_pts, double T, double kappa) {
    if (gamma <= 0.0 || kappa <= 0.0) {
        return 0.02;
    }
    const double sigma = vol_pts / 100.0;
    const double inventory_component = gamma * sigma * sigma * T;
    const double arrival_component = (2.0 / gamma) * std::log(1.0 + gamma / kappa);
    return inventory_component + arrival_component;
}

ASQuote compute_as_quotes(double mid,
                          double inventory,
                          double max_inventory,
                          double vol_pts,
                          double T,
                          const ASParams& params,
                          double avg_entry_price) {
    const double ratio = max_inventory > 0.0 ? inventory / max_inventory : 0.0;
    const double gamma = compute_dynamic_gamma(params.gamma_base, params.gamma_alpha, ratio);

    ASQuote quote;
    quote.reservation_price = compute_reservation_price(mid, inventory, max_inventory, gamma, vol_pts, T);
    quote.spread_pts = clamp(compute_optimal_spread(gamma, vol_pts, T, params.kappa) * 100.0,
                             params.min_spread_pts, params.max_spread_pts);
    const double half = quote.spread_pts / 200.0;

    double bid = quote.reservation_price - half;
    double ask = quote.reservation_price + half;
    if (avg_entry_price > 0.0 && inventory > 0.0) {
        ask = std::max(ask, avg_entry_price + kTickSize);
    }

    bid = clamp(round_cents(bid), kMinPrice, kMaxPrice);
    ask = clamp(round_cents(ask), kMinPrice, kMaxPrice);
    if (bid >= ask) {
        const double centre = (bid + ask) / 2.0;
        bid = std::max(kMinPrice, round_cents(centre - kTickSize));
        ask = std::min(kMaxPrice, round_cents(centre + kTickSize));
    }

    quote.bid = bid;
    quote.ask = ask;
    return quote;
}

double estimate_time_remaining(double days_to_resolution, double max_days) {
    if (days_to_resolution <= 0.0) {
        return 0.01;
    }
    return std::min(days_to_resolution / max_days, 1.0);
}

KappaEstimator::KappaEstimator(int window_minutes, double default_kappa)
    : window_(std::chrono::minutes(window_minutes)),
      default_kappa_(default_kappa) {}

void KappaEstimator::record_fill(TimePoint now) {
    fills_.push_back(now);
    prune(now);
}

void KappaEstimator::prune(TimePoint now) {
    const auto cutoff = now - window_;
    while (!fills_.empty() && fills_.front() < cutoff) {
        fills_.pop_front();
    }
}

double KappaEstimator::kappa(TimePoint now) const {
    const auto cutoff = now - window_;
    const auto first = std::find_if(fills_.begin(), fills_.end(), [&](TimePoint t) { return t >= cutoff; });
    const auto recent = static_cast<std::size_t>(std::distance(first, fills_.end()));
    if (recent < 2) {
        return default_kappa_;
    }

    const double span = seconds_between(*first, fills_.back());
    if (span <= 0.0) {
        return default_kappa_;
    }
    const double rate_per_minute = static_cast<double>(recent - 1) / (span / 60.0);
    return clamp(rate_per_minute, kMinKappa, kMaxKappa);
}

void KappaEstimator::reset() {
    fills_.clear();
}

} // namespace mm
