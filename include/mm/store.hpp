#pragma once

#include "clob/venue.hpp"
#include "mm/clock.hpp"
#include "mm/inventory.hpp"
#include "mm/order_state.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mm {

struct FillRecord {
    std::string order_id;
    std::string market_id;
    std::string token_id;
    clob::Side side = clob::Side::Buy;
    double price = 0.0;
    double size = 0.0;
    double fees = 0.0;
    double cumulative_matched = 0.0;
    double mid_at_fill = 0.0;
    TimePoint timestamp{};
};

struct DailyMetrics {
    std::string date;
    double start_value = 0.0;
    double end_value = 0.0;
    double realized_pnl = 0.0;
    double daily_return_pct = 0.0;
    int fills = 0;
    int quotes_placed = 0;
    double fill_quality_bps = 0.0;
    double adverse_selection_bps = 0.0;
    double pnl_gross = 0.0;
    double pnl_net = 0.0;
    double profit_factor = 0.0;
    double max_inventory = 0.0;
    double inventory_turns = 0.0;
    double sharpe_7d = 0.0;
};

// Cross-restart source of truth. Every write is an idempotent keyed upsert;
// implementations throw std::runtime_error when they cannot persist.
class Store {
public:
    virtual ~Store() = default;

    // Inserts when the pair has no record id yet and returns the id in use.
    virtual long long upsert_quote(const QuotePair& pair) = 0;
    // False when this (order, cumulative quantity) was already recorded.
    virtual bool record_fill(const FillRecord& fill) = 0;
    virtual void upsert_inventory(const PositionRecord& record) = 0;
    virtual void upsert_daily_metrics(const DailyMetrics& metrics) = 0;
    virtual void set_high_water_mark(double value) = 0;
    virtual void write_status(const nlohmann::json& status) = 0;

    [[nodiscard]] virtual std::optional<double> high_water_mark() const = 0;
    [[nodiscard]] virtual std::vector<QuotePair> active_quotes(const std::string& market_id = {}) const = 0;
    [[nodiscard]] virtual std::vector<PositionRecord> inventory(const std::string& market_id = {}) const = 0;
    [[nodiscard]] virtual std::vector<FillRecord> fills_since(TimePoint since) const = 0;
    [[nodiscard]] virtual std::optional<DailyMetrics> daily_metrics(const std::string& date) const = 0;
    [[nodiscard]] virtual std::vector<DailyMetrics> metrics_history() const = 0;
};

struct JsonlStoreConfig {
    std::filesystem::path data_dir = "data";
    std::string journal_name = "mm_journal.jsonl";
    std::string status_name = "mm_status.json";
    // Journal appends between rewrites; 0 compacts only on load.
    std::size_t compact_every = 1000;
    // Fills older than this, counted back from the newest fill, are dropped at compaction.
    int fill_retention_days = 30;
};

// Append-only JSON-lines journal replayed into keyed maps on load. The last
// line for a key wins. Terminal quotes are not kept in memory, and the journal
// is rewritten to one line per live key on load and every compact_every appends.
class JsonlStore : public Store {
public:
    explicit JsonlStore(JsonlStoreConfig config);

    // Replays the journal, then compacts it. Returns the number of lines applied.
    std::size_t load();

    // Rewrites the journal from the in-memory state. Returns the lines written.
    std::size_t compact();

    long long upsert_quote(const QuotePair& pair) override;
    bool record_fill(const FillRecord& fill) override;
    void upsert_inventory(const PositionRecord& record) override;
    void upsert_daily_metrics(const DailyMetrics& metrics) override;
    void set_high_water_mark(double value) override;
    void write_status(const nlohmann::json& status) override;

    std::optional<double> high_water_mark() const override;
    std::vector<QuotePair> active_quotes(const std::string& market_id = {}) const override;
    std::vector<PositionRecord> inventory(const std::string& market_id = {}) const override;
    std::vector<FillRecord> fills_since(TimePoint since) const override;
    std::optional<DailyMetrics> daily_metrics(const std::string& date) const override;
    std::vector<DailyMetrics> metrics_history() const override;

    [[nodiscard]] std::filesystem::path journal_path() const { return config_.data_dir / config_.journal_name; }
    [[nodiscard]] std::filesystem::path status_path() const { return config_.data_dir / config_.status_name; }

private:
    void ensure_directory() const;
    void append(const nlohmann::json& line);
    void apply(const nlohmann::json& line);
    // Appends, applies, and compacts once enough appends have piled up.
    void commit(const nlohmann::json& line);
    std::size_t compact_locked();
    void prune_fills();

    JsonlStoreConfig config_;
    mutable std::mutex mutex_;
    long long next_quote_id_ = 1;
    std::size_t appends_since_compact_ = 0;
    std::map<long long, QuotePair> quotes_;
    std::map<std::string, FillRecord> fills_;
    std::map<std::string, PositionRecord> inventory_;
    std::map<std::string, DailyMetrics> metrics_;
    std::optional<double> high_water_mark_;
};

std::string fill_key(const std::string& order_id, double cumulative_matched);

} // namespace mm
