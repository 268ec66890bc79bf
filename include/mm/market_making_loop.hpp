#pragma once

#include "clob/venue.hpp"
#include "mm/advisory.hpp"
#include "mm/arbitrage.hpp"
#include "mm/as_engine.hpp"
#include "mm/clock.hpp"
#include "mm/config.hpp"
#include "mm/inventory.hpp"
#include "mm/pricing_engine.hpp"
#include "mm/proposal.hpp"
#include "mm/quoter.hpp"
#include "mm/risk_manager.hpp"
#include "mm/store.hpp"
#include "mm/throttled_venue.hpp"
#include "mm/worker_pool.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mm {

// Cooldown after `streak` consecutive post-only cross rejections: none below
// the threshold, then base seconds per completed threshold multiple, capped.
int cooldown_seconds_for_streak(int streak, int threshold, int base_seconds, int max_seconds);

// Collateral held by resting bids. Asks sell tokens already held.
double compute_locked_capital(const std::vector<QuotePair>& pairs);

struct CycleReport {
    int cycle = 0;
    RiskMode risk_mode = RiskMode::Ok;
    bool paused = false;
    std::optional<double> balance;
    double portfolio_value = 0.0;
    double free_capital = 0.0;
    std::size_t markets_considered = 0;
    std::size_t markets_quoted = 0;
    std::size_t quotes_placed = 0;
    std::size_t fills = 0;
    std::size_t cancelled_markets = 0;
    std::string skipped;   // why placement was skipped, empty when it ran
};

// Drives one market-making cycle after another: risk gate, market list,
// fill reconciliation, then per-market pricing and quoting on a worker pool.
class MarketMakingLoop {
public:
    MarketMakingLoop(MarketMakingConfig config,
                     clob::VenueApi& venue,
                     Store& store,
                     RiskManager& risk,
                     MarketSource& markets,
                     EventRiskGuard& guard,
                     MarketScorer& scorer,
                     ClockFn clock = system_now);
    ~MarketMakingLoop();

    MarketMakingLoop(const MarketMakingLoop&) = delete;
    MarketMakingLoop& operator=(const MarketMakingLoop&) = delete;

    // Matches venue open orders against persisted quotes after a restart and
    // cancels the ones nobody owns. Returns the number of recovered pairs.
    std::size_t recover_open_orders();

    CycleReport run_cycle();

    // Blocks until stop() is called. Returns at once if stop() already ran.
    void run();
    void stop();

    [[nodiscard]] int cycle() const { return cycle_; }
    [[nodiscard]] InventoryLedger& inventory() { return inventory_; }
    [[nodiscard]] const InventoryLedger& inventory() const { return inventory_; }
    // Snapshots of slot state; consistent between cycles.
    [[nodiscard]] std::vector<QuotePair> active_quotes() const;
    [[nodiscard]] std::optional<QuotePair> active_quote(const std::string& market_id, int level = 0) const;
    [[nodiscard]] bool in_cooldown(const std::string& market_id) const;
    [[nodiscard]] bool circuit_open(const std::string& market_id) const;
    [[nodiscard]] int cross_reject_streak(const std::string& market_id) const;
    [[nodiscard]] double rolling_adverse_selection_bps() const;
    [[nodiscard]] const ASParams& as_params() const { return as_params_; }

private:
    struct MarketSlot;
    struct CycleContext;

    struct PendingMarkout {
        std::string market_id;
        clob::Side side = clob::Side::Buy;
        double mid_at_fill = 0.0;
        TimePoint due{};
    };

    MarketSlot& slot_for(const MarketInfo& info);
    MarketSlot* find_slot(const std::string& market_id) const;

    void refresh_daily_state(double portfolio_value, TimePoint now);
    void record_daily_metrics(double end_value);
    double portfolio_value(double balance) const;
    void gate_risk(CycleReport& report, TimePoint now);
    std::vector<MarketInfo> select_markets(CycleReport& report, CycleContext& ctx);

    std::size_t reconcile_fills(TimePoint now);
    std::size_t reconcile_slot(MarketSlot& slot, TimePoint now);
    void apply_fill(MarketSlot& slot, const FillEvent& fill, double mid_at_fill, TimePoint now);
    void persist_legs(const std::string& market_id);
    void persist_quote(QuotePair& pair);

    void retire_pair(MarketSlot& slot, QuotePair pair);
    bool cancel_slot(MarketSlot& slot, const std::string& reason);
    void cancel_all_quotes(const std::string& reason);

    void quote_markets(CycleReport& report, CycleContext& ctx);
    void quote_market(MarketSlot& slot, const MarketInfo& info, CycleContext& ctx);
    void place_levels(MarketSlot& slot, const QuoteProposal& proposal, double mid, CycleContext& ctx);
    void register_quote_failure(MarketSlot& slot, const std::optional<QuoteFailure>& failure, TimePoint now);
    void register_quote_success(MarketSlot& slot);

    void run_merges();
    void run_arbitrage(const std::vector<MarketInfo>& markets);
    void measure_adverse_selection(TimePoint now);
    void apply_as_feedback();
    void reconcile_with_store();
    void write_status(const CycleReport& report, TimePoint now);

    void for_each_slot(const std::function<void(MarketSlot&)>& work);

    MarketMakingConfig config_;
    clob::VenueApi& venue_;
    Store& store_;
    RiskManager& risk_;
    MarketSource& markets_;
    EventRiskGuard& guard_;
    MarketScorer& scorer_;
    ClockFn clock_;

    ConcurrencyLimiter limiter_;
    ThrottledVenue throttled_;
    WorkerPool pool_;
    InventoryLedger inventory_;
    ArbitrageExecutor arbitrage_;
    ASParams as_params_;

    mutable std::mutex slots_mutex_;
    std::map<std::string, std::unique_ptr<MarketSlot>> slots_;

    mutable std::mutex markout_mutex_;
    std::vector<PendingMarkout> pending_markouts_;
    std::deque<double> markouts_bps_;

    std::atomic<int> cycle_{0};
    std::string day_;
    TimePoint day_started_at_{};
    double day_start_value_ = 0.0;
    std::atomic<int> fills_today_{0};
    std::atomic<int> quotes_today_{0};

    std::atomic<bool> running_{false};
    // Set once by stop(); never cleared, so a stop that lands before run() still holds.
    std::atomic<bool> stop_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

} // namespace mm
