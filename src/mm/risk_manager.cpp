#include "mm/risk_manager.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace mm {
namespace {

constexpr double kMinSpreadPts = 1.0;

std::string fmt(double value, int precision = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

QuoteCheck reject(std::string reason) {
    return QuoteCheck{false, std::move(reason)};
}

} // namespace

const char* to_string(RiskMode mode) {
    switch (mode) {
        case RiskMode::Ok: return "ok";
        case RiskMode::Reduce: return "reduce";
        case RiskMode::Kill: return "kill";
    }
    return "ok";
}

RiskManager::RiskManager(RiskConfig config, Store* store, ClockFn clock)
    : config_(config),
      store_(store),
      clock_(std::move(clock)) {
    if (store_) {
        if (const auto persisted = store_->high_water_mark()) {
            high_water_mark_ = *persisted;
            std::cout << "[Risk] Restored high-water mark $" << fmt(high_water_mark_) << std::endl;
        }
    }
}

QuoteCheck RiskManager::validate_mm_quote(double bid, double ask, double mid, double max_delta) const {
    if (is_paused()) {
        return reject("Trading paused");
    }
    if (bid >= ask) {
        return reject("Invalid quote: bid " + fmt(bid) + " >= ask " + fmt(ask));
    }
    if (bid < 0.01 || ask > 0.99) {
        return reject("Quote out of range: bid=" + fmt(bid) + ", ask=" + fmt(ask));
    }

    const double spread = std::round((ask - bid) * 100.0 * 100.0) / 100.0;
    const double max_spread = std::min(2.0 * max_delta + 1.0, config_.max_spread_pts);
    if (spread > max_spread) {
        return reject("Spread too wide: " + fmt(spread, 1) + "pts > " + fmt(max_spread, 1) + "pts");
    }

    const double bid_delta = std::fabs(mid - bid) * 100.0;
    const double ask_delta = std::fabs(ask - mid) * 100.0;
    const double hard_cap = max_delta * 2.0;
    if (bid_delta > hard_cap || ask_delta > hard_cap) {
        return reject("Delta too wide: bid_delta=" + fmt(bid_delta, 1) + "pts, ask_delta=" + fmt(ask_delta, 1)
                      + "pts, hard_cap=" + fmt(hard_cap, 1) + "pts");
    }

    if (spread < kMinSpreadPts) {
        return reject("Spread too tight: " + fmt(spread, 1) + "pts < 1.0pts minimum");
    }
    return QuoteCheck{true, "OK"};
}

void RiskManager::raise_high_water_mark(double portfolio_value) {
    if (portfolio_value <= high_water_mark_) {
        return;
    }
    high_water_mark_ = portfolio_value;
    if (store_) {
        store_->set_high_water_mark(portfolio_value);
    }
}

void RiskManager::update_high_water_mark(double portfolio_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    raise_high_water_mark(portfolio_value);
}

double RiskManager::high_water_mark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_mark_;
}

double RiskManager::drawdown_pct(double portfolio_value) const {
    if (high_water_mark_ <= 0.0) {
        return 0.0;
    }
    return (high_water_mark_ - portfolio_value) / high_water_mark_ * 100.0;
}

RiskMode RiskManager::check_intraday_dd(double portfolio_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    raise_high_water_mark(portfolio_value);
    const double dd = drawdown_pct(portfolio_value);

    if (dd >= config_.dd_kill_pct) {
        paused_ = true;
        if (!kill_triggered_at_) {
            kill_triggered_at_ = clock_();
        }
        if (!kill_logged_) {
            std::cerr << "[Risk] MM KILL SWITCH: DD " << fmt(dd, 1) << "% >= " << fmt(config_.dd_kill_pct, 1)
                      << "% (peak=$" << fmt(high_water_mark_) << ", current=$" << fmt(portfolio_value) << ")"
                      << std::endl;
            kill_logged_ = true;
        }
        mode_ = RiskMode::Kill;
        return mode_;
    }

    if (dd >= config_.dd_reduce_pct) {
        if (!reduce_logged_) {
            std::cerr << "[Risk] MM REDUCE: DD " << fmt(dd, 1) << "% >= " << fmt(config_.dd_reduce_pct, 1)
                      << "% (peak=$" << fmt(high_water_mark_) << ", current=$" << fmt(portfolio_value) << ")"
                      << std::endl;
            reduce_logged_ = true;
        }
        mode_ = RiskMode::Reduce;
        return mode_;
    }

    kill_logged_ = false;
    reduce_logged_ = false;
    mode_ = RiskMode::Ok;
    return mode_;
}

bool RiskManager::try_auto_resume(double portfolio_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paused_ || !kill_triggered_at_) {
        return false;
    }

    const double dd = drawdown_pct(portfolio_value);
    if (dd >= config_.dd_resume_pct) {
        return false;
    }

    const auto now = clock_();
    const double elapsed = seconds_between(*kill_triggered_at_, now);
    if (elapsed < config_.dd_cooldown_minutes * 60.0) {
        return false;
    }

    const auto today = utc_date(now);
    if (auto_recovery_date_ != today) {
        auto_recoveries_today_ = 0;
        auto_recovery_date_ = today;
    }
    if (auto_recoveries_today_ >= config_.dd_max_recoveries_per_day) {
        return false;
    }

    paused_ = false;
    ++auto_recoveries_today_;
    kill_triggered_at_.reset();
    kill_logged_ = false;
    reduce_logged_ = false;
    mode_ = dd >= config_.dd_reduce_pct ? RiskMode::Reduce : RiskMode::Ok;
    std::cout << "[Risk] MM AUTO-RESUME: DD " << fmt(dd, 1) << "% < " << fmt(config_.dd_resume_pct, 1)
              << "% after " << fmt(elapsed / 60.0, 0) << "min cooldown (recovery " << auto_recoveries_today_
              << "/" << config_.dd_max_recoveries_per_day << " today)" << std::endl;
    return true;
}

bool RiskManager::check_stop_loss(double total_pnl, double portfolio_value) {
    if (portfolio_value <= 0.0 || total_pnl >= 0.0) {
        return false;
    }
    const double loss_pct = std::fabs(total_pnl / portfolio_value) * 100.0;
    if (loss_pct < config_.stop_loss_percent) {
        return false;
    }
    paused_ = true;
    std::cerr << "[Risk] DAILY STOP-LOSS triggered: " << fmt(loss_pct, 1) << "% loss" << std::endl;
    return true;
}

DrawdownCheck RiskManager::check_drawdown_stop_loss(double portfolio_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    raise_high_water_mark(portfolio_value);
    const double dd = drawdown_pct(portfolio_value);

    if (dd >= config_.drawdown_stop_loss_percent) {
        paused_ = true;
        if (!drawdown_logged_) {
            std::cerr << "[Risk] DRAWDOWN STOP-LOSS triggered: " << fmt(dd, 1) << "% from peak (peak=$"
                      << fmt(high_water_mark_) << ", current=$" << fmt(portfolio_value) << ")" << std::endl;
            drawdown_logged_ = true;
        }
        return DrawdownCheck{true, dd};
    }
    drawdown_logged_ = false;
    return DrawdownCheck{false, dd};
}

ExposureCheck RiskManager::check_global_exposure(double balance, double total_exposure) const {
    if (balance <= 0.0) {
        return ExposureCheck{true, 0.0};
    }
    const double portfolio = balance + total_exposure;
    const double pct = portfolio > 0.0 ? total_exposure / portfolio * 100.0 : 0.0;
    return ExposureCheck{pct <= config_.max_total_exposure_pct, std::round(pct * 10.0) / 10.0};
}

void RiskManager::set_paused(bool paused) {
    paused_ = paused;
    std::cout << "[Risk] Trading " << (paused ? "paused" : "resumed") << " via command" << std::endl;
}

void RiskManager::resume_trading() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        kill_triggered_at_.reset();
        kill_logged_ = false;
        reduce_logged_ = false;
    }
    paused_ = false;
    std::cout << "[Risk] Trading resumed manually" << std::endl;
}

RiskMode RiskManager::risk_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

int RiskManager::auto_recoveries_today() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auto_recoveries_today_;
}

std::optional<TimePoint> RiskManager::kill_triggered_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kill_triggered_at_;
}

} // namespace mm
