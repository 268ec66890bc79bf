#pragma once

#include "mm/clock.hpp"
#include "mm/store.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace mm {

enum class RiskMode { Ok, Reduce, Kill };

const char* to_string(RiskMode mode);

struct RiskConfig {
    double max_spread_pts = 12.0;
    double dd_reduce_pct = 15.0;
    double dd_kill_pct = 25.0;
    double dd_resume_pct = 20.0;
    int dd_cooldown_minutes = 30;
    int dd_max_recoveries_per_day = 3;
    double stop_loss_percent = 10.0;
    double drawdown_stop_loss_percent = 30.0;
    double max_total_exposure_pct = 80.0;
};

struct QuoteCheck {
    bool ok = false;
    std::string reason;
};

struct DrawdownCheck {
    bool triggered = false;
    double drawdown_pct = 0.0;
};

struct ExposureCheck {
    bool within_limit = true;
    double exposure_pct = 0.0;
};

// Quote gating plus the drawdown kill switch. The high-water mark is mirrored
// into the store when one is attached.
class RiskManager {
public:
    explicit RiskManager(RiskConfig config, Store* store = nullptr, ClockFn clock = system_now);

    [[nodiscard]] QuoteCheck validate_mm_quote(double bid, double ask, double mid, double max_delta) const;

    void update_high_water_mark(double portfolio_value);
    [[nodiscard]] double high_water_mark() const;

    // Raises the high-water mark, then classifies the drawdown from it. Kill
    // pauses trading and latches the kill time.
    RiskMode check_intraday_dd(double portfolio_value);

    // Resumes after a kill once drawdown is back under the resume threshold,
    // the cooldown has passed and today's recovery budget is not spent.
    bool try_auto_resume(double portfolio_value);

    bool check_stop_loss(double total_pnl, double portfolio_value);
    DrawdownCheck check_drawdown_stop_loss(double portfolio_value);
    [[nodiscard]] ExposureCheck check_global_exposure(double balance, double total_exposure) const;

    [[nodiscard]] bool is_paused() const { return paused_.load(); }
    void set_paused(bool paused);
    void resume_trading();
    [[nodiscard]] RiskMode risk_mode() const;
    [[nodiscard]] int auto_recoveries_today() const;
    [[nodiscard]] std::optional<TimePoint> kill_triggered_at() const;
    [[nodiscard]] const RiskConfig& config() const { return config_; }

private:
    double drawdown_pct(double portfolio_value) const;
    void raise_high_water_mark(double portfolio_value);

    RiskConfig config_;
    Store* store_;
    ClockFn clock_;

    std::atomic<bool> paused_{false};
    mutable std::mutex mutex_;
    double high_water_mark_ = 0.0;
    RiskMode mode_ = RiskMode::Ok;
    bool kill_logged_ = false;
    bool reduce_logged_ = false;
    bool drawdown_logged_ = false;
    std::optional<TimePoint> kill_triggered_at_;
    int auto_recoveries_today_ = 0;
    std::string auto_recovery_date_;
};

} // namespace mm
