#pragma once

#include "mm/arbitrage.hpp"
#include "mm/as_engine.hpp"
#include "mm/inventory.hpp"
#include "mm/quoter.hpp"
#include "mm/risk_manager.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace mm {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MarketMakingConfig {
    int mm_cycle_seconds = 10;
    double mm_delta_min = 1.5;
    double mm_delta_max = 8.0;
    double mm_quote_size_usd = 5.0;
    double mm_requote_threshold = 0.5;
    bool mm_post_only = true;
    int mm_cross_reject_threshold = 3;
    int mm_cross_cooldown_seconds = 300;
    int mm_cross_cooldown_max_seconds = 600;
    int mm_max_markets = 10;

    double mm_dd_reduce_pct = 15.0;
    double mm_dd_kill_pct = 25.0;
    double mm_dd_resume_pct = 20.0;
    int mm_dd_cooldown_minutes = 30;
    int mm_dd_max_recoveries_per_day = 3;

    bool mm_two_sided = true;
    bool mm_use_split_merge = true;
    double mm_split_size_usd = 5.0;
    double mm_merge_threshold = 10.0;
    int mm_min_quote_lifetime_seconds = 10;

    double mm_max_spread_pts = 12.0;
    int mm_scanner_concurrency = 10;
    double mm_stale_threshold_seconds = 60.0;

    std::string mm_pricing_engine = "as";   // "as" or "legacy"
    double mm_as_gamma_base = 0.1;
    double mm_as_gamma_alpha = 0.5;
    double mm_as_kappa_default = 1.5;
    int mm_as_kappa_window_minutes = 60;
    bool mm_as_feedback_enabled = true;
    double mm_as_feedback_threshold_bps = 50.0;
    int mm_adverse_selection_window = 120;

    int mm_multi_level_count = 1;
    double mm_level_spread_mult = 1.5;
    double mm_level_size_mult = 2.0;
    bool mm_hanging_orders = true;
    double mm_vol_widen_threshold = 5.0;
    double mm_event_risk_widen_pct = 50.0;

    int mm_circuit_breaker_threshold = 5;
    int mm_circuit_breaker_cooldown = 300;
    double mm_inventory_skew_factor = 0.5;

    bool mm_arb_enabled = false;
    double mm_arb_min_profit_pct = 0.5;
    double mm_arb_max_size_usd = 50.0;
    double mm_arb_gas_cost_usd = 0.005;
    int mm_arb_settle_ms = 2000;

    double stop_loss_percent = 10.0;
    double drawdown_stop_loss_percent = 30.0;
    double max_total_exposure_pct = 80.0;

    [[nodiscard]] bool use_as_engine() const { return mm_pricing_engine == "as"; }
    [[nodiscard]] RiskConfig risk() const;
    [[nodiscard]] QuoterConfig quoter() const;
    [[nodiscard]] ASParams as_params() const;
    [[nodiscard]] ArbitrageConfig arbitrage() const;
};

struct VenueSettings {
    std::string base_url = "https://clob.polymarket.com";
    std::string order_gateway_url;
    std::string api_key;
    std::string api_secret;
    std::string passphrase;
    std::string address;
};

struct AppConfig {
    MarketMakingConfig mm;
    VenueSettings venue;
    std::string data_dir = "data";
    std::string markets_file = "markets.json";
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

// KEY=VALUE lines into the process environment. Missing files are ignored.
void load_env_file(const std::string& path);

// Throws ConfigError naming the variable for malformed values.
MarketMakingConfig load_mm_config(const EnvLookup& env = process_env);

AppConfig load_app_config(const EnvLookup& env = process_env);

} // namespace mm
