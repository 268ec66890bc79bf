#include "mm/pricing_engine.hpp"

#include <algorithm>
#include <cmath>

namespace mm {
namespace {

constexpr double kMidChangeEpsilon = 1e-6;

double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

double round_to_tick(double price) {
    return round_cents(std::round(price / kTickSize) * kTickSize);
}

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

std::optional<double> compute_weighted_mid(const clob::BookSummary& book) {
    if (book.best_bid <= 0.0 || book.best_ask <= 0.0 || book.best_ask <= book.best_bid) {
        return std::nullopt;
    }
    const double total_depth = book.bid_depth + book.ask_depth;
    if (total_depth <= 0.0) {
        return (book.best_bid + book.best_ask) / 2.0;
    }
    // More resting bids push the fair price toward the ask.
    const double w_bid = book.ask_depth / total_depth;
    const double w_ask = book.bid_depth / total_depth;
    return w_bid * book.best_bid + w_ask * book.best_ask;
}

double compute_dynamic_delta(double vol_short,
                             double book_imbalance,
                             double stale_risk,
                             double delta_min,
                             double delta_max,
                             const DeltaWeights& weights,
                             double tracked_vol) {
    if (tracked_vol > 0.0) {
        vol_short = tracked_vol;
    }
    const double raw = weights.a * vol_short
                     + weights.b * std::fabs(book_imbalance) * 10.0
                     + weights.c * stale_risk * 5.0
                     + weights.d * 1.0;
    return clamp(raw, delta_min, delta_max);
}

double compute_skew(double net_inventory, double max_inventory, double skew_factor, double quadratic_factor) {
    if (max_inventory <= 0.0) {
        return 0.0;
    }
    const double ratio = clamp(net_inventory / max_inventory, -1.0, 1.0);
    const double linear = -ratio * skew_factor;
    const double sign = ratio > 0.0 ? -1.0 : 1.0;
    return linear + sign * ratio * ratio * quadratic_factor;
}

BidAsk compute_bid_ask(double mid, double delta_pts, double skew_pts) {
    const double delta = delta_pts / 100.0;
    const double skew = skew_pts / 100.0;

    BidAsk quote;
    quote.bid = round_to_tick(clamp(mid - delta + skew, kMinPrice, kMaxPrice));
    quote.ask = round_to_tick(clamp(mid + delta + skew, kMinPrice, kMaxPrice));

    if (quote.bid >= quote.ask) {
        const double mid_tick = round_to_tick(mid);
        quote.bid = round_to_tick(mid_tick - kTickSize);
        quote.ask = round_to_tick(mid_tick + kTickSize);
    }
    return quote;
}

double compute_quote_size(double capital,
                          double max_per_market,
                          double current_inventory_usdc,
                          double max_inventory,
                          double base_size_usd) {
    const double remaining_capacity = max_inventory - std::fabs(current_inventory_usdc);
    if (remaining_capacity <= 0.0) {
        return 0.0;
    }
    const double size = std::min({base_size_usd, max_per_market, capital * 0.1, remaining_capacity});
    return std::max(0.0, round_cents(size));
}

bool should_requote(const QuotePair* current, double new_mid, double threshold_pts) {
    if (current == nullptr) {
        return true;
    }
    const double reference = current->quoted_mid > 0.0 ? current->quoted_mid : current->mid();
    return std::fabs(new_mid - reference) * 100.0 >= threshold_pts;
}

VolTracker::VolTracker(int halflife)
    : alpha_(1.0 - std::pow(0.5, 1.0 / static_cast<double>(std::max(halflife, 1)))) {}

double VolTracker::update(double mid) {
    const auto last = last_mid_;
    last_mid_ = mid;
    if (!last || *last <= 0.0 || mid <= 0.0) {
        return 0.0;
    }

    const double change = (mid - *last) * 100.0;
    const double squared = change * change;
    const double previous = ewma_var_.value_or(squared);
    ewma_var_ = alpha_ * squared + (1.0 - alpha_) * previous;
    return std::sqrt(*ewma_var_);
}

double VolTracker::vol() const {
    return std::sqrt(ewma_var_.value_or(0.0));
}

void VolTracker::reset() {
    ewma_var_.reset();
    last_mid_.reset();
}

StaleTracker::StaleTracker(double threshold_seconds)
    : threshold_seconds_(threshold_seconds) {}

void StaleTracker::update_if_changed(double mid, TimePoint now) {
    if (!last_mid_ || std::fabs(mid - *last_mid_) > kMidChangeEpsilon || !last_change_) {
        last_change_ = now;
    }
    last_mid_ = mid;
}

double StaleTracker::staleness(TimePoint now) const {
    if (!last_change_ || threshold_seconds_ <= 0.0) {
        return 0.0;
    }
    const double elapsed = std::max(0.0, seconds_between(*last_change_, now));
    return std::min(elapsed / threshold_seconds_, 1.0);
}

void StaleTracker::reset() {
    last_mid_.reset();
    last_change_.reset();
}

} // namespace mm
