#pragma once

#include "clob/venue.hpp"
#include "mm/clock.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mm {

enum class Leg { Yes, No };

const char* to_string(Leg leg);

// "NO" (any case) is the NO leg; everything else is YES.
Leg parse_leg(const std::string& value);

struct MarketInventory {
    std::string market_id;
    std::string yes_token_id;
    double yes_position = 0.0;
    double yes_avg_entry = 0.0;
    double yes_realized_pnl = 0.0;
    std::string no_token_id;
    double no_position = 0.0;
    double no_avg_entry = 0.0;
    double no_realized_pnl = 0.0;
    std::optional<TimePoint> opened_at;
    TimePoint updated_at{};

    [[nodiscard]] double mergeable_pairs() const;
    [[nodiscard]] double total_realized_pnl() const { return yes_realized_pnl + no_realized_pnl; }
    [[nodiscard]] double position_age_hours(TimePoint now) const;
    [[nodiscard]] bool is_flat() const;
};

// Read-only view handed to dashboards and the status record.
struct InventorySnapshot {
    std::string market_id;
    double yes_position = 0.0;
    double no_position = 0.0;
    double yes_avg_entry = 0.0;
    double no_avg_entry = 0.0;
    double realized_pnl = 0.0;
    double mergeable_pairs = 0.0;
};

void to_json(nlohmann::json& j, const InventorySnapshot& snapshot);

// One token leg as confirmed by the persisted ledger.
struct PositionRecord {
    std::string market_id;
    std::string token_id;
    double position = 0.0;
    double avg_entry_price = 0.0;
    double realized_pnl = 0.0;
    Leg leg = Leg::Yes;
};

struct InventoryDivergence {
    std::string market_id;
    std::string token_id;
    Leg leg = Leg::Yes;
    double memory_position = 0.0;
    double store_position = 0.0;
};

struct InventoryConfig {
    double reconcile_tolerance = 0.1;
};

// Per-market YES/NO positions with weighted-average cost. Every call locks;
// readers receive copies.
class InventoryLedger {
public:
    explicit InventoryLedger(InventoryConfig config = {});

    void process_fill(const std::string& market_id,
                      const std::string& token_id,
                      clob::Side side,
                      double price,
                      double size,
                      Leg leg = Leg::Yes,
                      TimePoint now = system_now());

    // Burns `amount` YES+NO pairs. False (and no change) when either leg is short of it.
    bool process_merge(const std::string& market_id, double amount, TimePoint now = system_now());

    void process_split(const std::string& market_id,
                       double amount,
                       const std::string& yes_token_id,
                       const std::string& no_token_id,
                       TimePoint now = system_now());

    // Persisted records win. Each record lands on the leg it was stored with;
    // legs off by more than the tolerance are overwritten and reported.
    std::vector<InventoryDivergence> reconcile_with_clob(const std::vector<PositionRecord>& records);

    void load(const std::vector<PositionRecord>& records);

    [[nodiscard]] MarketInventory get(const std::string& market_id) const;
    [[nodiscard]] InventorySnapshot snapshot(const std::string& market_id) const;
    [[nodiscard]] std::vector<InventorySnapshot> snapshots() const;
    [[nodiscard]] std::vector<PositionRecord> leg_records(const std::string& market_id) const;
    [[nodiscard]] std::vector<std::string> market_ids() const;

    [[nodiscard]] double total_exposure() const;
    [[nodiscard]] double total_realized_pnl() const;
    [[nodiscard]] double unwind_urgency(const std::string& market_id, TimePoint now = system_now(),
                                        double max_hours = 24.0) const;
    [[nodiscard]] bool is_at_capacity(const std::string& market_id, double max_per_market, double mid = 0.0) const;
    [[nodiscard]] double skew_direction(const std::string& market_id, double max_per_market) const;
    [[nodiscard]] double merge_amount(const std::string& market_id) const;

private:
    MarketInventory& entry(const std::string& market_id);
    const MarketInventory* find(const std::string& market_id) const;

    InventoryConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, MarketInventory> inventory_;
};

} // namespace mm
