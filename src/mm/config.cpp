#include "mm/config.hpp"

#include "clob/util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace mm {
namespace {

std::string lower_copy(std::string value) {
    for (auto& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

class EnvReader {
public:
    explicit EnvReader(const EnvLookup& env) : env_(env) {}

    void read(const char* name, double& target) const {
        const auto raw = lookup(name);
        if (!raw) {
            return;
        }
        try {
            std::size_t consumed = 0;
            const double value = std::stod(*raw, &consumed);
            if (consumed != raw->size()) {
                throw std::invalid_argument("trailing characters");
            }
            target = value;
        } catch (const std::logic_error&) {
            throw ConfigError(std::string(name) + ": expected a number, got '" + *raw + "'");
        }
    }

    void read(const char* name, int& target) const {
        const auto raw = lookup(name);
        if (!raw) {
            return;
        }
        try {
            std::size_t consumed = 0;
            const int value = std::stoi(*raw, &consumed);
            if (consumed != raw->size()) {
                throw std::invalid_argument("trailing characters");
            }
            target = value;
        } catch (const std::logic_error&) {
            throw ConfigError(std::string(name) + ": expected an integer, got '" + *raw + "'");
        }
    }

    void read(const char* name, bool& target) const {
        const auto raw = lookup(name);
        if (!raw) {
            return;
        }
        const auto value = lower_copy(*raw);
        if (value == "true" || value == "1" || value == "yes") {
            target = true;
        } else if (value == "false" || value == "0" || value == "no") {
            target = false;
        } else {
            throw ConfigError(std::string(name) + ": expected a boolean, got '" + *raw + "'");
        }
    }

    void read(const char* name, std::string& target) const {
        if (const auto raw = lookup(name)) {
            target = *raw;
        }
    }

private:
    std::optional<std::string> lookup(const char* name) const {
        auto raw = env_(name);
        if (!raw) {
            return std::nullopt;
        }
        auto trimmed = clob::trim_copy(*raw);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

    const EnvLookup& env_;
};

void require_positive(const char* name, double value) {
    if (value <= 0.0) {
        throw ConfigError(std::string(name) + ": must be positive");
    }
}

} // namespace

RiskConfig MarketMakingConfig::risk() const {
    RiskConfig config;
    config.max_spread_pts = mm_max_spread_pts;
    config.dd_reduce_pct = mm_dd_reduce_pct;
    config.dd_kill_pct = mm_dd_kill_pct;
    config.dd_resume_pct = mm_dd_resume_pct;
    config.dd_cooldown_minutes = mm_dd_cooldown_minutes;
    config.dd_max_recoveries_per_day = mm_dd_max_recoveries_per_day;
    config.stop_loss_percent = stop_loss_percent;
    config.drawdown_stop_loss_percent = drawdown_stop_loss_percent;
    config.max_total_exposure_pct = max_total_exposure_pct;
    return config;
}

QuoterConfig MarketMakingConfig::quoter() const {
    QuoterConfig config;
    config.post_only = mm_post_only;
    return config;
}

ASParams MarketMakingConfig::as_params() const {
    ASParams params;
    params.gamma_base = mm_as_gamma_base;
    params.gamma_alpha = mm_as_gamma_alpha;
    params.kappa = mm_as_kappa_default;
    params.max_spread_pts = mm_max_spread_pts;
    return params;
}

ArbitrageConfig MarketMakingConfig::arbitrage() const {
    ArbitrageConfig config;
    config.min_profit_pct = mm_arb_min_profit_pct;
    config.max_size_usd = mm_arb_max_size_usd;
    config.gas_cost_usd = mm_arb_gas_cost_usd;
    config.settle_wait = std::chrono::milliseconds(mm_arb_settle_ms);
    return config;
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = clob::trim_copy(line.substr(0, pos));
        auto value = clob::trim_copy(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

MarketMakingConfig load_mm_config(const EnvLookup& env) {
    const EnvReader reader(env);
    MarketMakingConfig config;

    reader.read("MM_CYCLE_SECONDS", config.mm_cycle_seconds);
    reader.read("MM_DELTA_MIN", config.mm_delta_min);
    reader.read("MM_DELTA_MAX", config.mm_delta_max);
    reader.read("MM_QUOTE_SIZE_USD", config.mm_quote_size_usd);
    reader.read("MM_REQUOTE_THRESHOLD", config.mm_requote_threshold);
    reader.read("MM_POST_ONLY", config.mm_post_only);
    reader.read("MM_CROSS_REJECT_THRESHOLD", config.mm_cross_reject_threshold);
    reader.read("MM_CROSS_COOLDOWN_SECONDS", config.mm_cross_cooldown_seconds);
    reader.read("MM_CROSS_COOLDOWN_MAX_SECONDS", config.mm_cross_cooldown_max_seconds);
    reader.read("MM_MAX_MARKETS", config.mm_max_markets);

    reader.read("MM_DD_REDUCE_PCT", config.mm_dd_reduce_pct);
    reader.read("MM_DD_KILL_PCT", config.mm_dd_kill_pct);
    reader.read("MM_DD_RESUME_PCT", config.mm_dd_resume_pct);
    reader.read("MM_DD_COOLDOWN_MINUTES", config.mm_dd_cooldown_minutes);
    reader.read("MM_DD_MAX_RECOVERIES_PER_DAY", config.mm_dd_max_recoveries_per_day);

    reader.read("MM_TWO_SIDED", config.mm_two_sided);
    reader.read("MM_USE_SPLIT_MERGE", config.mm_use_split_merge);
    reader.read("MM_SPLIT_SIZE_USD", config.mm_split_size_usd);
    reader.read("MM_MERGE_THRESHOLD", config.mm_merge_threshold);
    reader.read("MM_MIN_QUOTE_LIFETIME_SECONDS", config.mm_min_quote_lifetime_seconds);

    reader.read("MM_MAX_SPREAD_PTS", config.mm_max_spread_pts);
    reader.read("MM_SCANNER_CONCURRENCY", config.mm_scanner_concurrency);
    reader.read("MM_STALE_THRESHOLD_SECONDS", config.mm_stale_threshold_seconds);

    reader.read("MM_PRICING_ENGINE", config.mm_pricing_engine);
    reader.read("MM_AS_GAMMA_BASE", config.mm_as_gamma_base);
    reader.read("MM_AS_GAMMA_ALPHA", config.mm_as_gamma_alpha);
    reader.read("MM_AS_KAPPA_DEFAULT", config.mm_as_kappa_default);
    reader.read("MM_AS_KAPPA_WINDOW_MINUTES", config.mm_as_kappa_window_minutes);
    reader.read("MM_AS_FEEDBACK_ENABLED", config.mm_as_feedback_enabled);
    reader.read("MM_AS_FEEDBACK_THRESHOLD_BPS", config.mm_as_feedback_threshold_bps);
    reader.read("MM_ADVERSE_SELECTION_WINDOW", config.mm_adverse_selection_window);

    reader.read("MM_MULTI_LEVEL_COUNT", config.mm_multi_level_count);
    reader.read("MM_LEVEL_SPREAD_MULT", config.mm_level_spread_mult);
    reader.read("MM_LEVEL_SIZE_MULT", config.mm_level_size_mult);
    reader.read("MM_HANGING_ORDERS", config.mm_hanging_orders);
    reader.read("MM_VOL_WIDEN_THRESHOLD", config.mm_vol_widen_threshold);
    reader.read("MM_EVENT_RISK_WIDEN_PCT", config.mm_event_risk_widen_pct);

    reader.read("MM_CIRCUIT_BREAKER_THRESHOLD", config.mm_circuit_breaker_threshold);
    reader.read("MM_CIRCUIT_BREAKER_COOLDOWN", config.mm_circuit_breaker_cooldown);
    reader.read("MM_INVENTORY_SKEW_FACTOR", config.mm_inventory_skew_factor);

    reader.read("MM_ARB_ENABLED", config.mm_arb_enabled);
    reader.read("MM_ARB_MIN_PROFIT_PCT", config.mm_arb_min_profit_pct);
    reader.read("MM_ARB_MAX_SIZE_USD", config.mm_arb_max_size_usd);
    reader.read("MM_ARB_GAS_COST_USD", config.mm_arb_gas_cost_usd);
    reader.read("MM_ARB_SETTLE_MS", config.mm_arb_settle_ms);

    reader.read("STOP_LOSS_PERCENT", config.stop_loss_percent);
    reader.read("DRAWDOWN_STOP_LOSS_PERCENT", config.drawdown_stop_loss_percent);
    reader.read("MAX_TOTAL_EXPOSURE_PCT", config.max_total_exposure_pct);

    config.mm_pricing_engine = lower_copy(config.mm_pricing_engine);
    if (config.mm_pricing_engine != "as" && config.mm_pricing_engine != "legacy") {
        throw ConfigError("MM_PRICING_ENGINE: expected 'as' or 'legacy', got '" + config.mm_pricing_engine + "'");
    }
    require_positive("MM_CYCLE_SECONDS", config.mm_cycle_seconds);
    require_positive("MM_SCANNER_CONCURRENCY", config.mm_scanner_concurrency);
    require_positive("MM_MAX_MARKETS", config.mm_max_markets);
    require_positive("MM_ARB_MAX_SIZE_USD", config.mm_arb_max_size_usd);
    if (config.mm_arb_settle_ms < 0) {
        throw ConfigError("MM_ARB_SETTLE_MS: must not be negative");
    }
    if (config.mm_delta_min > config.mm_delta_max) {
        throw ConfigError("MM_DELTA_MIN: must not exceed MM_DELTA_MAX");
    }
    if (config.mm_dd_resume_pct >= config.mm_dd_kill_pct) {
        throw ConfigError("MM_DD_RESUME_PCT: must be below MM_DD_KILL_PCT");
    }
    return config;
}

AppConfig load_app_config(const EnvLookup& env) {
    AppConfig config;
    config.mm = load_mm_config(env);

    const EnvReader reader(env);
    reader.read("CLOB_BASE_URL", config.venue.base_url);
    reader.read("CLOB_ORDER_GATEWAY_URL", config.venue.order_gateway_url);
    reader.read("CLOB_API_KEY", config.venue.api_key);
    reader.read("CLOB_API_SECRET", config.venue.api_secret);
    reader.read("CLOB_PASSPHRASE", config.venue.passphrase);
    reader.read("CLOB_ADDRESS", config.venue.address);
    reader.read("MM_DATA_DIR", config.data_dir);
    reader.read("MM_MARKETS_FILE", config.markets_file);

    std::cout << "[Config] engine=" << config.mm.mm_pricing_engine << " cycle=" << config.mm.mm_cycle_seconds
              << "s max_markets=" << config.mm.mm_max_markets << " data_dir=" << config.data_dir << std::endl;
    return config;
}

} // namespace mm
