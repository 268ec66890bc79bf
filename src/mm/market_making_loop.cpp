#include "mm/market_making_loop.hpp"

#include "clob/http_client.hpp"
#include "clob/util.hpp"
#include "mm/metrics.hpp"
#include "mm/proposal.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <set>
#include <utility>

namespace mm {
namespace {

constexpr int kVolHalflife = 20;
constexpr int kRetiredPolls = 3;
constexpr std::size_t kMarkoutWindow = 50;
constexpr double kMinMid = 0.02;
constexpr double kMaxMid = 0.98;
constexpr double kMinOrderShares = 5.0;
constexpr double kUrgencySkew = 0.3;
constexpr double kFeedbackScaleBps = 200.0;
constexpr double kProfitFactorCap = 999.9;
constexpr double kMinMetricsHours = 0.1;
constexpr std::size_t kSharpeDays = 7;

constexpr int kMergeEveryCycles = 6;
constexpr int kArbEveryCycles = 3;
constexpr int kFeedbackEveryCycles = 30;
constexpr int kStoreReconcileEveryCycles = 60;
constexpr int kMetricsEveryCycles = 20;
constexpr int kSummaryEveryCycles = 10;

const std::string kCrossReject = "post_only_cross";

double round_shares(double shares) {
    return std::round(shares * 10.0) / 10.0;
}

std::string money(double value) {
    return clob::format_decimal(value, 2);
}

bool is_cross_reject(const std::optional<QuoteFailure>& failure) {
    if (!failure) {
        return false;
    }
    return (failure->bid_error && failure->bid_error->code == kCrossReject)
           || (failure->ask_error && failure->ask_error->code == kCrossReject);
}

bool side_working(const std::optional<std::string>& order_id, OrderState state) {
    return order_id.has_value() && is_working(state);
}

// A retired pair is worth polling only while a cancelled order could still report a late fill.
bool may_fill_late(const QuotePair& pair) {
    return (pair.bid_order_id && pair.bid_state != OrderState::Filled)
           || (pair.ask_order_id && pair.ask_state != OrderState::Filled);
}

} // namespace

int cooldown_seconds_for_streak(int streak, int threshold, int base_seconds, int max_seconds) {
    threshold = std::max(1, threshold);
    if (streak < threshold) {
        return 0;
    }
    const int level = 1 + std::max(0, (streak - threshold) / threshold);
    return std::min(max_seconds, base_seconds * level);
}

double compute_locked_capital(const std::vector<QuotePair>& pairs) {
    double locked = 0.0;
    for (const auto& pair : pairs) {
        if (side_working(pair.bid_order_id, pair.bid_state)) {
            locked += pair.bid_size * pair.bid_price;
        }
    }
    return locked;
}

struct MarketMakingLoop::MarketSlot {
    struct Retired {
        QuotePair pair;
        int polls_left = kRetiredPolls;
    };

    MarketSlot(MarketInfo market, clob::VenueApi& venue, const MarketMakingConfig& config, const ClockFn& clock)
        : info(std::move(market)),
          quoter(venue, config.quoter(), clock),
          vol(kVolHalflife),
          stale(config.mm_stale_threshold_seconds),
          kappa(config.mm_as_kappa_window_minutes, config.mm_as_kappa_default) {}

    MarketInfo info;
    Quoter quoter;
    std::map<int, QuotePair> quotes;   // by level
    std::vector<Retired> retired;
    VolTracker vol;
    StaleTracker stale;
    KappaEstimator kappa;
    std::optional<double> last_mid;
    int cross_streak = 0;
    int error_count = 0;
    std::optional<TimePoint> cooldown_until;
    std::optional<TimePoint> circuit_until;
    bool split_failed = false;
    bool selected = false;
};

struct MarketMakingLoop::CycleContext {
    TimePoint now{};
    bool diag = false;
    int max_markets = 0;
    double max_per_market = 0.0;
    double quote_size_usd = 0.0;
    std::map<std::string, ScoreDecision> scores;
    std::map<std::string, EventRiskAssessment> guard;

    std::atomic<std::size_t> markets_quoted{0};
    std::atomic<std::size_t> quotes_placed{0};

    bool reserve(double amount) {
        std::lock_guard<std::mutex> lock(budget_mutex);
        if (committed + amount > free_capital) {
            return false;
        }
        committed += amount;
        return true;
    }

    double remaining() {
        std::lock_guard<std::mutex> lock(budget_mutex);
        return std::max(0.0, free_capital - committed);
    }

    // Shrinks the bids to what is left and books their cost in one step.
    void constrain(QuoteProposal& proposal, double min_size) {
        std::lock_guard<std::mutex> lock(budget_mutex);
        apply_budget_constraint(proposal, free_capital, committed, min_size, AskFunding::Inventory);
        for (const auto& bid : proposal.bids) {
            committed += bid.price * bid.size;
        }
    }

    std::mutex budget_mutex;
    double free_capital = 0.0;
    double committed = 0.0;
};

MarketMakingLoop::MarketMakingLoop(MarketMakingConfig config,
                                   clob::VenueApi& venue,
                                   Store& store,
                                   RiskManager& risk,
                                   MarketSource& markets,
                                   EventRiskGuard& guard,
                                   MarketScorer& scorer,
                                   ClockFn clock)
    : config_(std::move(config)),
      venue_(venue),
      store_(store),
      risk_(risk),
      markets_(markets),
      guard_(guard),
      scorer_(scorer),
      clock_(std::move(clock)),
      limiter_(static_cast<std::size_t>(config_.mm_scanner_concurrency)),
      throttled_(venue_, limiter_),
      pool_(static_cast<std::size_t>(config_.mm_scanner_concurrency)),
      arbitrage_(throttled_, inventory_, config_.arbitrage(), clock_),
      as_params_(config_.as_params()) {
    as_params_.min_spread_pts = config_.mm_delta_min * 2.0;
    try {
        inventory_.load(store_.inventory());
    } catch (const std::runtime_error& ex) {
        std::cerr << "[Loop] Failed to load inventory from store: " << ex.what() << std::endl;
    }
}

MarketMakingLoop::~MarketMakingLoop() {
    stop();
}

MarketMakingLoop::MarketSlot& MarketMakingLoop::slot_for(const MarketInfo& info) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(info.market_id);
    if (it == slots_.end()) {
        it = slots_.emplace(info.market_id, std::make_unique<MarketSlot>(info, throttled_, config_, clock_)).first;
    } else {
        it->second->info = info;
    }
    return *it->second;
}

MarketMakingLoop::MarketSlot* MarketMakingLoop::find_slot(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    const auto it = slots_.find(market_id);
    return it == slots_.end() ? nullptr : it->second.get();
}

void MarketMakingLoop::for_each_slot(const std::function<void(MarketSlot&)>& work) {
    std::vector<MarketSlot*> targets;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto& kv : slots_) {
            targets.push_back(kv.second.get());
        }
    }

    std::vector<std::pair<MarketSlot*, std::future<void>>> pending;
    pending.reserve(targets.size());
    for (auto* slot : targets) {
        pending.emplace_back(slot, pool_.enqueue([&work, slot]() { work(*slot); }));
    }
    for (auto& task : pending) {
        try {
            task.second.get();
        } catch (const std::exception& ex) {
            std::cerr << "[Loop] Task failed for " << task.first->info.market_id << ": " << ex.what() << std::endl;
        }
    }
}

std::size_t MarketMakingLoop::recover_open_orders() {
    const auto live = throttled_.get_open_orders();
    if (live.empty()) {
        return 0;
    }

    const auto persisted = store_.active_quotes();
    std::map<std::string, const QuotePair*> by_order;
    for (const auto& pair : persisted) {
        if (pair.bid_order_id) {
            by_order[*pair.bid_order_id] = &pair;
        }
        if (pair.ask_order_id) {
            by_order[*pair.ask_order_id] = &pair;
        }
    }

    std::map<std::string, std::map<int, QuotePair>> recovered;
    std::vector<std::string> orphans;
    for (const auto& order : live) {
        if (order.id.empty()) {
            continue;
        }
        const auto it = by_order.find(order.id);
        if (it == by_order.end()) {
            orphans.push_back(order.id);
            continue;
        }

        const QuotePair& source = *it->second;
        auto& levels = recovered[source.market_id];
        auto existing = levels.find(source.level);
        if (existing == levels.end()) {
            QuotePair pair = source;
            pair.bid_order_id.reset();
            pair.ask_order_id.reset();
            pair.bid_state = OrderState::Cancelled;
            pair.ask_state = OrderState::Cancelled;
            existing = levels.emplace(source.level, std::move(pair)).first;
        }

        QuotePair& pair = existing->second;
        const auto state = order.size_matched > 0.0 ? OrderState::Partial : OrderState::Live;
        if (source.bid_order_id && *source.bid_order_id == order.id) {
            pair.bid_order_id = order.id;
            pair.bid_state = state;
        } else {
            pair.ask_order_id = order.id;
            pair.ask_state = state;
        }
    }

    for (const auto& order_id : orphans) {
        if (!throttled_.cancel_order(order_id)) {
            std::cerr << "[Loop] Failed to cancel orphan order " << order_id << std::endl;
        }
    }
    if (!orphans.empty()) {
        std::cerr << "[Loop] Cancelled " << orphans.size() << " orphan orders" << std::endl;
    }

    std::size_t count = 0;
    for (auto& market : recovered) {
        const auto& first = market.second.begin()->second;
        MarketInfo info;
        info.market_id = first.market_id;
        info.token_id = first.token_id;
        info.no_token_id = first.no_token_id;
        info.condition_id = first.condition_id;
        auto& slot = slot_for(info);
        for (auto& level : market.second) {
            slot.quotes[level.first] = std::move(level.second);
            ++count;
        }
    }
    if (count > 0) {
        std::cout << "[Loop] Recovered " << count << " quote pairs from open orders" << std::endl;
    }
    return count;
}

double MarketMakingLoop::portfolio_value(double balance) const {
    double value = balance;
    for (const auto& snapshot : inventory_.snapshots()) {
        std::optional<double> mid;
        if (const auto* slot = find_slot(snapshot.market_id)) {
            mid = slot->last_mid;
        }
        const double yes_mark = mid ? *mid : snapshot.yes_avg_entry;
        const double no_mark = mid ? 1.0 - *mid : snapshot.no_avg_entry;
        value += snapshot.yes_position * yes_mark + snapshot.no_position * no_mark;
    }
    return value;
}

void MarketMakingLoop::record_daily_metrics(double end_value) {
    DailyMetrics metrics;
    metrics.date = day_;
    metrics.start_value = day_start_value_;
    metrics.end_value = end_value;
    metrics.realized_pnl = inventory_.total_realized_pnl();
    metrics.daily_return_pct = daily_return_pct(day_start_value_, end_value);
    metrics.fills = fills_today_.load();
    metrics.quotes_placed = quotes_today_.load();

    const auto fills = store_.fills_since(day_started_at_);
    metrics.fill_quality_bps = average_fill_quality_bps(fills);
    metrics.adverse_selection_bps = rolling_adverse_selection_bps();

    const auto pnl = compute_pnl(fills);
    metrics.pnl_gross = pnl.gross_pnl;
    metrics.pnl_net = pnl.net_pnl;
    metrics.profit_factor = std::min(kProfitFactorCap, profit_factor_from_round_trips(round_trip_pnls(fills)));

    for (const auto& snapshot : inventory_.snapshots()) {
        metrics.max_inventory = std::max({metrics.max_inventory, std::fabs(snapshot.yes_position),
                                          std::fabs(snapshot.no_position)});
    }
    const double hours = std::max(kMinMetricsHours, seconds_between(day_started_at_, clock_()) / 3600.0);
    const double avg_inventory = metrics.max_inventory > 0.0 ? metrics.max_inventory / 2.0 : 1.0;
    metrics.inventory_turns = inventory_turn_rate(static_cast<int>(fills.size()), avg_inventory, hours);

    // Today's record replaces any earlier snapshot of the same day in the window.
    auto history = store_.metrics_history();
    history.erase(std::remove_if(history.begin(), history.end(),
                                 [&metrics](const DailyMetrics& day) { return day.date == metrics.date; }),
                  history.end());
    history.push_back(metrics);
    metrics.sharpe_7d = rolling_sharpe(history, kSharpeDays);

    store_.upsert_daily_metrics(metrics);
}

void MarketMakingLoop::refresh_daily_state(double value, TimePoint now) {
    const auto today = utc_date(now);
    if (today == day_) {
        return;
    }
    if (!day_.empty()) {
        record_daily_metrics(value);
    }
    day_ = today;
    day_started_at_ = now;
    day_start_value_ = value;
    fills_today_ = 0;
    quotes_today_ = 0;
}

void MarketMakingLoop::gate_risk(CycleReport& report, TimePoint now) {
    report.balance = throttled_.get_collateral_balance();
    if (!report.balance) {
        std::cerr << "[Loop] Collateral balance unavailable" << std::endl;
    } else {
        const double value = portfolio_value(*report.balance);
        report.portfolio_value = value;
        refresh_daily_state(value, now);

        risk_.check_drawdown_stop_loss(value);
        risk_.check_intraday_dd(value);
        if (risk_.is_paused()) {
            risk_.try_auto_resume(value);
        }
    }

    report.risk_mode = risk_.risk_mode();
    report.paused = risk_.is_paused();
    if (report.paused) {
        cancel_all_quotes(report.risk_mode == RiskMode::Kill ? "kill switch" : "paused");
    }
}

std::vector<MarketInfo> MarketMakingLoop::select_markets(CycleReport& report, CycleContext& ctx) {
    ctx.max_markets = config_.mm_max_markets;
    ctx.quote_size_usd = config_.mm_quote_size_usd;
    if (report.risk_mode == RiskMode::Reduce) {
        ctx.max_markets = std::max(1, config_.mm_max_markets / 2);
        ctx.quote_size_usd = config_.mm_quote_size_usd / 2.0;
        if (ctx.diag) {
            std::cerr << "[Loop] REDUCE mode: " << ctx.max_markets << " markets, $" << money(ctx.quote_size_usd)
                      << " quotes" << std::endl;
        }
    }

    auto candidates = markets_.markets();
    if (candidates.size() > static_cast<std::size_t>(ctx.max_markets)) {
        candidates.resize(static_cast<std::size_t>(ctx.max_markets));
    }

    ctx.scores = consult_scorer(scorer_, candidates);
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&ctx](const MarketInfo& info) {
                                        const auto it = ctx.scores.find(info.market_id);
                                        return it != ctx.scores.end() && !it->second.approved;
                                    }),
                     candidates.end());
    ctx.guard = consult_guard(guard_, candidates);

    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto& kv : slots_) {
            kv.second->selected = false;
        }
    }

    std::vector<MarketInfo> selected;
    for (const auto& info : candidates) {
        const auto verdict = ctx.guard.find(info.market_id);
        if (verdict != ctx.guard.end() && verdict->second.kill) {
            continue;
        }
        slot_for(info).selected = true;
        selected.push_back(info);
    }
    report.markets_considered = selected.size();
    return selected;
}

void MarketMakingLoop::retire_pair(MarketSlot& slot, QuotePair pair) {
    if (may_fill_late(pair)) {
        slot.retired.push_back(MarketSlot::Retired{std::move(pair), kRetiredPolls});
    }
}

void MarketMakingLoop::persist_quote(QuotePair& pair) {
    pair.record_id = store_.upsert_quote(pair);
}

void MarketMakingLoop::persist_legs(const std::string& market_id) {
    for (const auto& record : inventory_.leg_records(market_id)) {
        store_.upsert_inventory(record);
    }
}

bool MarketMakingLoop::cancel_slot(MarketSlot& slot, const std::string& reason) {
    bool all_cancelled = true;
    for (auto it = slot.quotes.begin(); it != slot.quotes.end();) {
        const bool cancelled = slot.quoter.cancel_quote_pair(it->second);
        persist_quote(it->second);
        if (!cancelled) {
            all_cancelled = false;
            ++it;
            continue;
        }
        retire_pair(slot, std::move(it->second));
        it = slot.quotes.erase(it);
    }
    std::cout << "[Loop] Cancelled quotes on " << slot.info.market_id << " (" << reason << ")" << std::endl;
    return all_cancelled;
}

void MarketMakingLoop::cancel_all_quotes(const std::string& reason) {
    for_each_slot([this, &reason](MarketSlot& slot) {
        if (!slot.quotes.empty()) {
            cancel_slot(slot, reason);
        }
    });
}

void MarketMakingLoop::apply_fill(MarketSlot& slot, const FillEvent& fill, double mid_at_fill, TimePoint now) {
    FillRecord record;
    record.order_id = fill.order_id;
    record.market_id = fill.market_id;
    record.token_id = fill.token_id;
    record.side = fill.side;
    record.price = fill.price;
    record.size = fill.size;
    record.fees = fill.fees;
    record.cumulative_matched = fill.cumulative_matched;
    record.mid_at_fill = mid_at_fill;
    record.timestamp = now;
    if (!store_.record_fill(record)) {
        std::cout << "[Loop] Fill " << fill_key(fill.order_id, fill.cumulative_matched) << " already recorded"
                  << std::endl;
        return;
    }

    inventory_.process_fill(fill.market_id, fill.token_id, fill.side, fill.price, fill.size, Leg::Yes, now);
    persist_legs(fill.market_id);
    slot.kappa.record_fill(now);
    ++fills_today_;

    if (mid_at_fill > 0.0) {
        std::lock_guard<std::mutex> lock(markout_mutex_);
        pending_markouts_.push_back(PendingMarkout{
            fill.market_id, fill.side, mid_at_fill, now + std::chrono::seconds(config_.mm_adverse_selection_window)});
    }

    std::cout << "[FILL] " << clob::to_string(fill.side) << " " << clob::format_decimal(fill.size, 1) << " @ "
              << money(fill.price) << " on " << fill.market_id << " (level " << fill.level << ")" << std::endl;
}

std::size_t MarketMakingLoop::reconcile_slot(MarketSlot& slot, TimePoint now) {
    std::size_t count = 0;
    const auto mid_for = [&slot](const QuotePair& pair) {
        return slot.last_mid.value_or(pair.quoted_mid > 0.0 ? pair.quoted_mid : pair.mid());
    };

    for (auto it = slot.quotes.begin(); it != slot.quotes.end();) {
        QuotePair& pair = it->second;
        const auto fills = slot.quoter.reconcile_quote(pair);
        for (const auto& fill : fills) {
            apply_fill(slot, fill, mid_for(pair), now);
            ++count;
        }
        if (!fills.empty() || pair.is_terminal()) {
            persist_quote(pair);
        }
        if (pair.is_terminal()) {
            retire_pair(slot, std::move(pair));
            it = slot.quotes.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = slot.retired.begin(); it != slot.retired.end();) {
        const auto fills = slot.quoter.reconcile_quote(it->pair, true);
        for (const auto& fill : fills) {
            apply_fill(slot, fill, mid_for(it->pair), now);
            ++count;
        }
        if (!fills.empty()) {
            persist_quote(it->pair);
        }
        if (--it->polls_left <= 0 || !may_fill_late(it->pair)) {
            it = slot.retired.erase(it);
        } else {
            ++it;
        }
    }
    return count;
}

std::size_t MarketMakingLoop::reconcile_fills(TimePoint now) {
    std::atomic<std::size_t> total{0};
    for_each_slot([this, now, &total](MarketSlot& slot) { total += reconcile_slot(slot, now); });
    return total.load();
}

void MarketMakingLoop::register_quote_failure(MarketSlot& slot,
                                              const std::optional<QuoteFailure>& failure,
                                              TimePoint now) {
    ++slot.error_count;
    if (slot.error_count >= config_.mm_circuit_breaker_threshold) {
        slot.circuit_until = now + std::chrono::seconds(config_.mm_circuit_breaker_cooldown);
        std::cerr << "[Loop] Circuit breaker: " << slot.info.market_id << " paused for "
                  << config_.mm_circuit_breaker_cooldown << "s after " << slot.error_count << " errors" << std::endl;
    }

    if (!is_cross_reject(failure)) {
        slot.cross_streak = 0;
        return;
    }
    ++slot.cross_streak;
    const int threshold = std::max(1, config_.mm_cross_reject_threshold);
    const int cooldown = cooldown_seconds_for_streak(slot.cross_streak, threshold, config_.mm_cross_cooldown_seconds,
                                                     config_.mm_cross_cooldown_max_seconds);
    if (cooldown <= 0) {
        return;
    }
    const auto until = now + std::chrono::seconds(cooldown);
    if (!slot.cooldown_until || *slot.cooldown_until < until) {
        slot.cooldown_until = until;
    }
    if (slot.cross_streak % threshold == 0) {
        std::cerr << "[Loop] Cooldown on " << slot.info.market_id << ": " << slot.cross_streak
                  << " cross rejects, cooldown=" << cooldown << "s" << std::endl;
    }
}

void MarketMakingLoop::register_quote_success(MarketSlot& slot) {
    slot.cross_streak = 0;
    slot.error_count = 0;
    slot.cooldown_until.reset();
}

void MarketMakingLoop::quote_market(MarketSlot& slot, const MarketInfo& info, CycleContext& ctx) {
    const auto now = ctx.now;
    const auto& market_id = info.market_id;

    if (slot.cooldown_until) {
        if (now < *slot.cooldown_until) {
            if (cycle_ % kSummaryEveryCycles == 0) {
                std::cout << "[Loop] Cooldown active for " << market_id << ": "
                          << static_cast<int>(seconds_between(now, *slot.cooldown_until)) << "s remaining"
                          << std::endl;
            }
            return;
        }
        slot.cooldown_until.reset();
        slot.cross_streak = 0;
    }
    if (slot.circuit_until) {
        if (now < *slot.circuit_until) {
            return;
        }
        slot.circuit_until.reset();
        slot.error_count = 0;
    }

    const auto book = throttled_.get_book_summary(info.token_id);
    if (!book || !book->mid) {
        if (ctx.diag) {
            std::cerr << "[Loop] Skip " << market_id << ": no book" << std::endl;
        }
        return;
    }
    const double mid = compute_weighted_mid(*book).value_or(*book->mid);
    slot.last_mid = mid;
    if (mid < kMinMid || mid > kMaxMid) {
        if (ctx.diag) {
            std::cout << "[Loop] Skip " << market_id << ": extreme mid " << clob::format_decimal(mid, 4) << std::endl;
        }
        return;
    }

    slot.stale.update_if_changed(mid, now);
    const double tracked_vol = slot.vol.update(mid);
    const double staleness = slot.stale.staleness(now);
    const double spread_pts = book->spread * 100.0;

    double size_multiplier = 1.0;
    if (const auto score = ctx.scores.find(market_id); score != ctx.scores.end()) {
        size_multiplier = score->second.size_multiplier;
    }
    const double max_per_market = ctx.max_per_market;
    const auto position = inventory_.get(market_id);

    double bid = 0.0;
    double ask = 0.0;
    double reservation = mid;
    if (config_.use_as_engine()) {
        ASParams params = as_params_;
        params.T = estimate_time_remaining(info.days_to_resolution);
        params.kappa = slot.kappa.kappa(now);
        const double vol_pts = tracked_vol > 0.0 ? tracked_vol : std::max(spread_pts * 0.5, 1.0);
        const auto quote = compute_as_quotes(mid, position.yes_position, max_per_market / mid, vol_pts, params.T,
                                             params, position.yes_avg_entry);
        bid = quote.bid;
        ask = quote.ask;
        reservation = quote.reservation_price;
    } else {
        const double delta = compute_dynamic_delta(std::max(spread_pts * 0.5, 1.0), book->imbalance, staleness,
                                                   config_.mm_delta_min, config_.mm_delta_max, {}, tracked_vol);
        const double skew_factor =
            config_.mm_inventory_skew_factor + inventory_.unwind_urgency(market_id, now) * kUrgencySkew;
        const double skew = compute_skew(inventory_.skew_direction(market_id, max_per_market) * max_per_market,
                                         max_per_market, skew_factor);
        const auto quote = compute_bid_ask(mid, delta, skew);
        bid = quote.bid;
        ask = quote.ask;
    }

    const auto check = risk_.validate_mm_quote(bid, ask, mid, config_.mm_delta_max);
    if (!check.ok) {
        if (ctx.diag) {
            std::cerr << "[Loop] Skip " << market_id << ": risk rejected (" << check.reason << ")" << std::endl;
        }
        return;
    }

    const double min_shares = std::max(kMinOrderShares, book->min_order_size);
    double yes_position = position.yes_position;
    bool place_bid = !inventory_.is_at_capacity(market_id, max_per_market, mid);
    bool place_ask = yes_position >= min_shares;

    if (config_.mm_two_sided && config_.mm_use_split_merge && !place_ask && !info.condition_id.empty()
        && !info.no_token_id.empty() && !slot.split_failed && ctx.reserve(config_.mm_split_size_usd)) {
        const double amount = config_.mm_split_size_usd;
        std::cout << "[Loop] Splitting $" << money(amount) << " on " << market_id << std::endl;
        if (throttled_.split_position(info.condition_id, amount)) {
            inventory_.process_split(market_id, amount, info.token_id, info.no_token_id, now);
            persist_legs(market_id);
            yes_position = inventory_.get(market_id).yes_position;
            place_ask = yes_position >= min_shares;
        } else {
            slot.split_failed = true;
            std::cerr << "[Loop] Split failed for " << market_id << ", not retrying until restart" << std::endl;
        }
    }

    double bid_shares = 0.0;
    if (place_bid) {
        const double size_usd = compute_quote_size(ctx.remaining(), max_per_market, std::fabs(yes_position) * mid,
                                                   max_per_market, ctx.quote_size_usd * size_multiplier);
        bid_shares = size_usd > 0.0 ? round_shares(size_usd / mid) : 0.0;
        if (bid_shares < min_shares) {
            bid_shares = 0.0;
        }
    }
    double ask_shares = 0.0;
    if (place_ask) {
        ask_shares = round_shares(std::min(yes_position, max_per_market / mid));
        if (ask_shares < min_shares) {
            ask_shares = 0.0;
        }
    }
    if (bid_shares <= 0.0 && ask_shares <= 0.0) {
        if (ctx.diag) {
            std::cerr << "[Loop] Skip " << market_id << ": nothing to quote (yes=" << clob::format_decimal(yes_position, 1)
                      << ", min_shares=" << min_shares << ")" << std::endl;
        }
        return;
    }

    ProposalPipeline pipeline;
    if (config_.mm_multi_level_count > 1) {
        pipeline.add("multi_level", [this](QuoteProposal& p) {
            apply_multi_level(p, config_.mm_multi_level_count, config_.mm_level_spread_mult,
                              config_.mm_level_size_mult);
        });
    }
    pipeline.add("volatility", [this, tracked_vol](QuoteProposal& p) {
        apply_vol_adjustment(p, tracked_vol, config_.mm_vol_widen_threshold);
    });
    const auto verdict = ctx.guard.find(market_id);
    if (verdict != ctx.guard.end() && verdict->second.warning) {
        pipeline.add("event_risk", [this](QuoteProposal& p) {
            apply_event_risk(p, true, config_.mm_event_risk_widen_pct);
        });
    }
    pipeline.add("inventory", [yes_position, min_shares](QuoteProposal& p) {
        double available = yes_position;
        std::vector<OrderProposal> kept;
        for (auto ask_order : p.asks) {
            ask_order.size = std::min(ask_order.size, std::floor(available * 10.0) / 10.0);
            if (ask_order.size < min_shares) {
                break;
            }
            available -= ask_order.size;
            kept.push_back(ask_order);
        }
        p.asks = std::move(kept);
    });
    pipeline.add("budget", [&ctx, min_shares](QuoteProposal& p) { ctx.constrain(p, min_shares); });
    if (config_.mm_post_only) {
        pipeline.post_only(book->best_bid, book->best_ask);
    }

    const auto proposal =
        pipeline.run(create_base_proposal(market_id, info.token_id, bid, ask, bid_shares, ask_shares, mid, reservation));
    if (proposal.empty()) {
        if (ctx.diag) {
            std::cerr << "[Loop] Skip " << market_id << ": proposal empty after sizing" << std::endl;
        }
        return;
    }
    place_levels(slot, proposal, mid, ctx);
}

void MarketMakingLoop::place_levels(MarketSlot& slot, const QuoteProposal& proposal, double mid, CycleContext& ctx) {
    const auto now = ctx.now;
    std::map<int, std::pair<const OrderProposal*, const OrderProposal*>> wanted;
    for (const auto& bid : proposal.bids) {
        wanted[bid.level].first = &bid;
    }
    for (const auto& ask : proposal.asks) {
        wanted[ask.level].second = &ask;
    }
    std::set<int> levels;
    for (const auto& kv : wanted) {
        levels.insert(kv.first);
    }
    for (const auto& kv : slot.quotes) {
        levels.insert(kv.first);
    }

    const auto adopt = [&](QuotePair pair, int level) {
        pair.quoted_mid = mid;
        pair.no_token_id = slot.info.no_token_id;
        pair.condition_id = slot.info.condition_id;
        pair.level = level;
        persist_quote(pair);
        slot.quotes[level] = std::move(pair);
        register_quote_success(slot);
        ++ctx.quotes_placed;
        ++quotes_today_;
    };

    bool any_active = false;
    for (const int level : levels) {
        const auto target = wanted.find(level);
        const OrderProposal* bid = target == wanted.end() ? nullptr : target->second.first;
        const OrderProposal* ask = target == wanted.end() ? nullptr : target->second.second;

        auto existing = slot.quotes.find(level);
        if (existing != slot.quotes.end() && !existing->second.is_active()) {
            // Stuck in Unknown, or finished: clear it before quoting this level again.
            if (!existing->second.is_terminal()) {
                slot.quoter.cancel_quote_pair(existing->second);
            }
            persist_quote(existing->second);
            retire_pair(slot, std::move(existing->second));
            slot.quotes.erase(existing);
            existing = slot.quotes.end();
        }

        if (!bid && !ask) {
            if (existing != slot.quotes.end() && slot.quoter.cancel_quote_pair(existing->second)) {
                persist_quote(existing->second);
                retire_pair(slot, std::move(existing->second));
                slot.quotes.erase(existing);
            }
            continue;
        }

        QuoteRequest request;
        request.bid_price = bid ? bid->price : proposal.mid;
        request.ask_price = ask ? ask->price : proposal.mid;
        request.bid_size = bid ? bid->size : 0.0;
        request.ask_size = ask ? ask->size : 0.0;
        request.place_bid = bid != nullptr;
        request.place_ask = ask != nullptr;

        if (existing != slot.quotes.end()) {
            QuotePair& current = existing->second;
            const bool has_bid = side_working(current.bid_order_id, current.bid_state);
            const bool has_ask = side_working(current.ask_order_id, current.ask_state);
            const bool refresh_sides = request.place_bid != has_bid || request.place_ask != has_ask;
            const bool old_enough = current.age_seconds(now) >= config_.mm_min_quote_lifetime_seconds;
            if (!refresh_sides && !(old_enough && should_requote(&current, mid, config_.mm_requote_threshold))) {
                any_active = true;
                continue;
            }

            auto next = config_.mm_hanging_orders ? slot.quoter.requote_preserving_hanging(current, request)
                                                  : slot.quoter.requote(current, request);
            QuotePair previous = std::move(current);
            slot.quotes.erase(existing);
            persist_quote(previous);
            retire_pair(slot, std::move(previous));
            if (!next) {
                register_quote_failure(slot, slot.quoter.last_quote_failure(), now);
                continue;
            }
            adopt(std::move(*next), level);
            any_active = true;
            continue;
        }

        if (ctx.diag) {
            std::cout << "[Loop] Placing " << slot.info.market_id << " L" << level << ": bid="
                      << money(request.bid_price) << "x" << clob::format_decimal(request.bid_size, 1)
                      << " ask=" << money(request.ask_price) << "x" << clob::format_decimal(request.ask_size, 1)
                      << std::endl;
        }
        auto placed = slot.quoter.place_quote_pair(slot.info.token_id, slot.info.market_id, request.bid_price,
                                                   request.ask_price, request.bid_size, request.ask_size,
                                                   request.place_bid, request.place_ask);
        if (!placed) {
            register_quote_failure(slot, slot.quoter.last_quote_failure(), now);
            continue;
        }
        adopt(std::move(*placed), level);
        any_active = true;
    }

    if (any_active) {
        ++ctx.markets_quoted;
    }
}

void MarketMakingLoop::quote_markets(CycleReport& report, CycleContext& ctx) {
    if (report.paused) {
        report.skipped = "paused";
        if (ctx.diag) {
            std::cout << "[Loop] Trading paused by risk manager" << std::endl;
        }
        return;
    }
    if (!report.balance) {
        report.skipped = "balance unavailable";
        return;
    }

    const double balance = *report.balance;
    const auto working = active_quotes();
    const double locked = compute_locked_capital(working);
    const double free_capital = std::max(0.0, balance - locked);
    report.free_capital = free_capital;

    const auto exposure = risk_.check_global_exposure(balance, inventory_.total_exposure());
    if (!exposure.within_limit) {
        report.skipped = "exposure limit";
        if (ctx.diag) {
            std::cerr << "[Loop] Global exposure " << exposure.exposure_pct << "% exceeds limit" << std::endl;
        }
        return;
    }
    if (free_capital < ctx.quote_size_usd) {
        report.skipped = "free capital";
        if (ctx.diag) {
            std::cerr << "[Loop] Free capital $" << money(free_capital) << " too low (balance=$" << money(balance)
                      << ", locked=$" << money(locked) << ")" << std::endl;
        }
        return;
    }

    std::set<std::string> quoted_markets;
    for (const auto& pair : working) {
        quoted_markets.insert(pair.market_id);
    }
    const int remaining_slots = std::max(1, ctx.max_markets - static_cast<int>(quoted_markets.size()));
    ctx.max_per_market = free_capital / remaining_slots;
    ctx.free_capital = free_capital;

    for_each_slot([this, &ctx](MarketSlot& slot) {
        if (slot.selected) {
            quote_market(slot, slot.info, ctx);
        }
    });
    report.markets_quoted = ctx.markets_quoted.load();
    report.quotes_placed = ctx.quotes_placed.load();
}

void MarketMakingLoop::run_merges() {
    std::vector<MarketInfo> markets;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto& kv : slots_) {
            markets.push_back(kv.second->info);
        }
    }
    for (const auto& info : markets) {
        if (info.condition_id.empty()) {
            continue;
        }
        const double amount = std::floor(inventory_.merge_amount(info.market_id) * 10.0) / 10.0;
        if (amount < config_.mm_merge_threshold) {
            continue;
        }
        std::cout << "[Loop] Merging " << clob::format_decimal(amount, 1) << " pairs on " << info.market_id
                  << std::endl;
        if (!throttled_.merge_positions(info.condition_id, amount)) {
            std::cerr << "[Loop] Merge failed on " << info.market_id << std::endl;
            continue;
        }
        if (inventory_.process_merge(info.market_id, amount, clock_())) {
            persist_legs(info.market_id);
        }
    }
}

void MarketMakingLoop::run_arbitrage(const std::vector<MarketInfo>& markets) {
    const auto arb_config = config_.arbitrage();
    for (const auto& info : markets) {
        if (info.no_token_id.empty() || info.condition_id.empty()) {
            continue;
        }
        const auto yes_book = throttled_.get_book_summary(info.token_id);
        const auto no_book = throttled_.get_book_summary(info.no_token_id);
        if (!yes_book || !no_book) {
            continue;
        }
        const auto opp = scan_for_arbitrage(*yes_book, *no_book, info, arb_config);
        if (!opp) {
            continue;
        }
        const auto result = arbitrage_.execute(*opp);
        persist_legs(info.market_id);
        if (result.success) {
            std::cout << "[Loop] Arbitrage " << to_string(result.type) << " on " << info.market_id << " profit $"
                      << clob::format_decimal(result.profit_usd, 4) << std::endl;
        } else {
            std::cerr << "[Loop] Arbitrage " << to_string(result.type) << " on " << info.market_id
                      << " abandoned: " << result.error << std::endl;
        }
    }
}

void MarketMakingLoop::measure_adverse_selection(TimePoint now) {
    std::lock_guard<std::mutex> lock(markout_mutex_);
    for (auto it = pending_markouts_.begin(); it != pending_markouts_.end();) {
        if (now < it->due) {
            ++it;
            continue;
        }
        const auto* slot = find_slot(it->market_id);
        if (slot && slot->last_mid) {
            markouts_bps_.push_back(adverse_selection_bps(it->mid_at_fill, *slot->last_mid, it->side));
            if (markouts_bps_.size() > kMarkoutWindow) {
                markouts_bps_.pop_front();
            }
        }
        it = pending_markouts_.erase(it);
    }
}

double MarketMakingLoop::rolling_adverse_selection_bps() const {
    std::lock_guard<std::mutex> lock(markout_mutex_);
    if (markouts_bps_.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (double bps : markouts_bps_) {
        total += bps;
    }
    return total / static_cast<double>(markouts_bps_.size());
}

void MarketMakingLoop::apply_as_feedback() {
    if (!config_.mm_as_feedback_enabled || !config_.use_as_engine()) {
        return;
    }
    const double rolling = rolling_adverse_selection_bps();
    if (rolling > config_.mm_as_feedback_threshold_bps) {
        const double multiplier = 1.0 + (rolling - config_.mm_as_feedback_threshold_bps) / kFeedbackScaleBps;
        as_params_.gamma_base = config_.mm_as_gamma_base * multiplier;
        std::cout << "[Loop] AS feedback: rolling adverse selection " << clob::format_decimal(rolling, 1)
                  << "bps, gamma " << clob::format_decimal(as_params_.gamma_base, 3) << std::endl;
    } else {
        as_params_.gamma_base = config_.mm_as_gamma_base;
    }
}

void MarketMakingLoop::reconcile_with_store() {
    const auto divergences = inventory_.reconcile_with_clob(store_.inventory());
    if (!divergences.empty()) {
        std::cerr << "[Loop] Reconciliation corrected " << divergences.size() << " legs" << std::endl;
    }

    std::set<std::string> live_ids;
    for (const auto& order : throttled_.get_open_orders()) {
        live_ids.insert(order.id);
    }
    for (const auto& pair : active_quotes()) {
        if (pair.bid_order_id && pair.bid_state == OrderState::Live && live_ids.count(*pair.bid_order_id) == 0) {
            std::cerr << "[Loop] Phantom bid on " << pair.market_id << ": " << *pair.bid_order_id << std::endl;
        }
        if (pair.ask_order_id && pair.ask_state == OrderState::Live && live_ids.count(*pair.ask_order_id) == 0) {
            std::cerr << "[Loop] Phantom ask on " << pair.market_id << ": " << *pair.ask_order_id << std::endl;
        }
    }
}

void MarketMakingLoop::write_status(const CycleReport& report, TimePoint now) {
    nlohmann::json status{
        {"mm_cycle", report.cycle},
        {"mm_risk_mode", to_string(report.risk_mode)},
        {"mm_paused", report.paused},
        {"mm_active_markets", report.markets_quoted},
        {"mm_total_exposure", inventory_.total_exposure()},
        {"mm_realized_pnl", inventory_.total_realized_pnl()},
        {"mm_free_capital", report.free_capital},
        {"mm_adverse_selection_bps", rolling_adverse_selection_bps()},
        {"mm_high_water_mark", risk_.high_water_mark()},
        {"mm_inventory", inventory_.snapshots()},
        {"mm_last_cycle", utc_timestamp(now)},
    };
    if (report.balance) {
        status["mm_balance"] = *report.balance;
        status["mm_portfolio_value"] = report.portfolio_value;
    }
    store_.write_status(status);
}

CycleReport MarketMakingLoop::run_cycle() {
    ++cycle_;
    CycleReport report;
    report.cycle = cycle_;

    CycleContext ctx;
    ctx.now = clock_();
    ctx.diag = cycle_ <= 3 || cycle_ % 100 == 1;

    gate_risk(report, ctx.now);
    const auto selected = select_markets(report, ctx);

    std::atomic<std::size_t> cancelled{0};
    for_each_slot([this, &cancelled](MarketSlot& slot) {
        if (slot.selected || slot.quotes.empty()) {
            return;
        }
        cancel_slot(slot, "removed from market list");
        slot.vol.reset();
        slot.stale.reset();
        slot.cross_streak = 0;
        slot.cooldown_until.reset();
        ++cancelled;
    });
    report.cancelled_markets = cancelled.load();

    report.fills = reconcile_fills(ctx.now);
    measure_adverse_selection(ctx.now);

    quote_markets(report, ctx);

    if (config_.mm_use_split_merge && cycle_ % kMergeEveryCycles == 0) {
        run_merges();
    }
    if (config_.mm_arb_enabled && config_.mm_use_split_merge && !report.paused && cycle_ % kArbEveryCycles == 0) {
        run_arbitrage(selected);
    }
    if (cycle_ % kFeedbackEveryCycles == 0) {
        apply_as_feedback();
    }
    if (cycle_ % kStoreReconcileEveryCycles == 0) {
        reconcile_with_store();
    }
    if (report.balance && cycle_ % kMetricsEveryCycles == 0) {
        record_daily_metrics(report.portfolio_value);
    }
    write_status(report, ctx.now);

    if (cycle_ % kSummaryEveryCycles == 0) {
        std::cout << "[Loop] Cycle " << cycle_ << ": " << report.markets_quoted << "/" << selected.size()
                  << " markets quoted, exposure $" << money(inventory_.total_exposure()) << ", free $"
                  << money(report.free_capital) << ", PnL $" << clob::format_decimal(inventory_.total_realized_pnl(), 4)
                  << ", mode " << to_string(report.risk_mode) << std::endl;
    }
    return report;
}

void MarketMakingLoop::run() {
    if (stop_requested_) {
        std::cout << "[Loop] Stop requested before start, not running" << std::endl;
        return;
    }
    running_ = true;
    const auto period = std::chrono::seconds(config_.mm_cycle_seconds);
    std::cout << "[Loop] Market making started (cycle=" << config_.mm_cycle_seconds << "s, engine="
              << config_.mm_pricing_engine << ")" << std::endl;

    while (running_ && !stop_requested_) {
        const auto cycle_start = std::chrono::steady_clock::now();
        try {
            run_cycle();
        } catch (const clob::HttpError& ex) {
            std::cerr << "[Loop] HTTP error in cycle " << cycle_ << ": " << ex.what() << " (status "
                      << ex.status_code() << ")" << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "[Loop] Cycle " << cycle_ << " failed: " << ex.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_until(lock, cycle_start + period, [this]() { return stop_requested_.load(); });
    }
    std::cout << "[Loop] Market making stopped after " << cycle_ << " cycles" << std::endl;
}

void MarketMakingLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
        running_ = false;
    }
    wake_.notify_all();
}

std::vector<QuotePair> MarketMakingLoop::active_quotes() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::vector<QuotePair> out;
    for (const auto& kv : slots_) {
        for (const auto& level : kv.second->quotes) {
            if (level.second.is_active()) {
                out.push_back(level.second);
            }
        }
    }
    return out;
}

std::optional<QuotePair> MarketMakingLoop::active_quote(const std::string& market_id, int level) const {
    const auto* slot = find_slot(market_id);
    if (!slot) {
        return std::nullopt;
    }
    const auto it = slot->quotes.find(level);
    if (it == slot->quotes.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MarketMakingLoop::in_cooldown(const std::string& market_id) const {
    const auto* slot = find_slot(market_id);
    return slot && slot->cooldown_until && clock_() < *slot->cooldown_until;
}

bool MarketMakingLoop::circuit_open(const std::string& market_id) const {
    const auto* slot = find_slot(market_id);
    return slot && slot->circuit_until && clock_() < *slot->circuit_until;
}

int MarketMakingLoop::cross_reject_streak(const std::string& market_id) const {
    const auto* slot = find_slot(market_id);
    return slot ? slot->cross_streak : 0;
}

} // namespace mm
