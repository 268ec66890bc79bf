#include "mm/inventory.hpp"

#include "clob/util.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace mm {
namespace {

constexpr double kFlatEpsilon = 1e-9;
constexpr double kReportEpsilon = 0.001;

double snap(double position) {
    return std::fabs(position) < kFlatEpsilon ? 0.0 : position;
}

struct LegRef {
    std::string& token_id;
    double& position;
    double& avg_entry;
    double& realized_pnl;
};

LegRef leg_of(MarketInventory& inv, Leg leg) {
    if (leg == Leg::No) {
        return {inv.no_token_id, inv.no_position, inv.no_avg_entry, inv.no_realized_pnl};
    }
    return {inv.yes_token_id, inv.yes_position, inv.yes_avg_entry, inv.yes_realized_pnl};
}

// Weighted-average-cost update of one leg. Returns the realized P&L.
double apply_fill(LegRef leg, clob::Side side, double price, double size) {
    const double old_pos = leg.position;
    const double delta = side == clob::Side::Buy ? size : -size;
    const double new_pos = snap(old_pos + delta);
    double realized = 0.0;

    const bool same_direction = old_pos == 0.0 || (old_pos > 0.0) == (delta > 0.0);
    if (same_direction) {
        const double total_cost = leg.avg_entry * std::fabs(old_pos) + price * std::fabs(delta);
        leg.avg_entry = new_pos != 0.0 ? total_cost / std::fabs(new_pos) : 0.0;
    } else {
        const double closed = std::min(std::fabs(old_pos), std::fabs(delta));
        realized = old_pos > 0.0 ? closed * (price - leg.avg_entry) : closed * (leg.avg_entry - price);
        if (new_pos == 0.0) {
            leg.avg_entry = 0.0;
        } else if ((new_pos > 0.0) != (old_pos > 0.0)) {
            leg.avg_entry = price;
        }
    }

    leg.position = new_pos;
    leg.realized_pnl += realized;
    return realized;
}

std::string short_id(const std::string& id) {
    return id.size() > 16 ? id.substr(0, 16) : id;
}

} // namespace

const char* to_string(Leg leg) {
    return leg == Leg::No ? "NO" : "YES";
}

Leg parse_leg(const std::string& value) {
    return clob::to_upper_copy(value) == "NO" ? Leg::No : Leg::Yes;
}

double MarketInventory::mergeable_pairs() const {
    if (yes_position > 0.0 && no_position > 0.0) {
        return std::min(yes_position, no_position);
    }
    return 0.0;
}

double MarketInventory::position_age_hours(TimePoint now) const {
    if (!opened_at || is_flat()) {
        return 0.0;
    }
    return std::max(0.0, seconds_between(*opened_at, now)) / 3600.0;
}

bool MarketInventory::is_flat() const {
    return yes_position == 0.0 && no_position == 0.0;
}

void to_json(nlohmann::json& j, const InventorySnapshot& snapshot) {
    j = nlohmann::json{
        {"market_id", snapshot.market_id},
        {"yes_position", snapshot.yes_position},
        {"no_position", snapshot.no_position},
        {"yes_avg_entry", snapshot.yes_avg_entry},
        {"no_avg_entry", snapshot.no_avg_entry},
        {"realized_pnl", snapshot.realized_pnl},
        {"mergeable_pairs", snapshot.mergeable_pairs},
    };
}

InventoryLedger::InventoryLedger(InventoryConfig config)
    : config_(config) {}

MarketInventory& InventoryLedger::entry(const std::string& market_id) {
    auto it = inventory_.find(market_id);
    if (it == inventory_.end()) {
        MarketInventory inv;
        inv.market_id = market_id;
        it = inventory_.emplace(market_id, std::move(inv)).first;
    }
    return it->second;
}

const MarketInventory* InventoryLedger::find(const std::string& market_id) const {
    const auto it = inventory_.find(market_id);
    return it == inventory_.end() ? nullptr : &it->second;
}

void InventoryLedger::process_fill(const std::string& market_id,
                                   const std::string& token_id,
                                   clob::Side side,
                                   double price,
                                   double size,
                                   Leg leg,
                                   TimePoint now) {
    if (size <= 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& inv = entry(market_id);
    auto ref = leg_of(inv, leg);
    if (!token_id.empty()) {
        ref.token_id = token_id;
    }

    const double realized = apply_fill(ref, side, price, size);
    inv.updated_at = now;
    if (inv.is_flat()) {
        inv.opened_at.reset();
    } else if (!inv.opened_at) {
        inv.opened_at = now;
    }

    std::cout << "[Inventory] " << short_id(market_id) << " " << to_string(leg) << " "
              << clob::to_string(side) << " " << size << " @ " << price
              << " -> pos=" << ref.position << " avg=" << ref.avg_entry;
    if (realized != 0.0) {
        std::cout << " realized=" << realized;
    }
    std::cout << std::endl;
}

bool InventoryLedger::process_merge(const std::string& market_id, double amount, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& inv = entry(market_id);
    if (amount <= 0.0 || inv.yes_position < amount || inv.no_position < amount) {
        std::cerr << "[Inventory] Merge failed " << short_id(market_id) << ": requested " << amount
                  << " but YES=" << inv.yes_position << " NO=" << inv.no_position << std::endl;
        return false;
    }

    inv.yes_position = snap(inv.yes_position - amount);
    inv.no_position = snap(inv.no_position - amount);
    if (inv.yes_position == 0.0) {
        inv.yes_avg_entry = 0.0;
    }
    if (inv.no_position == 0.0) {
        inv.no_avg_entry = 0.0;
    }
    if (inv.is_flat()) {
        inv.opened_at.reset();
    }
    inv.updated_at = now;

    std::cout << "[Inventory] Merge " << short_id(market_id) << ": " << amount
              << " pairs, YES=" << inv.yes_position << " NO=" << inv.no_position << std::endl;
    return true;
}

void InventoryLedger::process_split(const std::string& market_id,
                                    double amount,
                                    const std::string& yes_token_id,
                                    const std::string& no_token_id,
                                    TimePoint now) {
    if (amount <= 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& inv = entry(market_id);
    if (!yes_token_id.empty()) {
        inv.yes_token_id = yes_token_id;
    }
    if (!no_token_id.empty()) {
        inv.no_token_id = no_token_id;
    }
    inv.yes_position += amount;
    inv.no_position += amount;
    if (inv.yes_avg_entry == 0.0) {
        inv.yes_avg_entry = 0.5;
    }
    if (inv.no_avg_entry == 0.0) {
        inv.no_avg_entry = 0.5;
    }
    inv.updated_at = now;

    std::cout << "[Inventory] Split " << short_id(market_id) << ": " << amount
              << " -> YES=" << inv.yes_position << " NO=" << inv.no_position << std::endl;
}

std::vector<InventoryDivergence> InventoryLedger::reconcile_with_clob(const std::vector<PositionRecord>& records) {
    std::vector<InventoryDivergence> divergences;
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& record : records) {
        auto& inv = entry(record.market_id);
        const Leg leg = record.leg;
        auto ref = leg_of(inv, leg);
        if (ref.token_id.empty()) {
            ref.token_id = record.token_id;
        }
        if (std::fabs(ref.position - record.position) <= config_.reconcile_tolerance) {
            continue;
        }

        divergences.push_back({record.market_id, record.token_id, leg, ref.position, record.position});
        std::cerr << "[Inventory] Divergence " << short_id(record.market_id) << " " << to_string(leg)
                  << ": memory=" << ref.position << " store=" << record.position << std::endl;

        ref.position = snap(record.position);
        ref.avg_entry = ref.position != 0.0 ? record.avg_entry_price : 0.0;
        ref.realized_pnl = record.realized_pnl;
        if (inv.is_flat()) {
            inv.opened_at.reset();
        }
    }
    return divergences;
}

void InventoryLedger::load(const std::vector<PositionRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    inventory_.clear();
    for (const auto& record : records) {
        auto& inv = entry(record.market_id);
        auto ref = leg_of(inv, record.leg);
        ref.token_id = record.token_id;
        ref.position = snap(record.position);
        ref.avg_entry = record.avg_entry_price;
        ref.realized_pnl = record.realized_pnl;
    }
    std::cout << "[Inventory] Loaded " << inventory_.size() << " markets (" << records.size()
              << " records)" << std::endl;
}

MarketInventory InventoryLedger::get(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* inv = find(market_id)) {
        return *inv;
    }
    MarketInventory empty;
    empty.market_id = market_id;
    return empty;
}

InventorySnapshot InventoryLedger::snapshot(const std::string& market_id) const {
    const auto inv = get(market_id);
    InventorySnapshot snap_out;
    snap_out.market_id = inv.market_id;
    snap_out.yes_position = inv.yes_position;
    snap_out.no_position = inv.no_position;
    snap_out.yes_avg_entry = inv.yes_avg_entry;
    snap_out.no_avg_entry = inv.no_avg_entry;
    snap_out.realized_pnl = inv.total_realized_pnl();
    snap_out.mergeable_pairs = inv.mergeable_pairs();
    return snap_out;
}

std::vector<InventorySnapshot> InventoryLedger::snapshots() const {
    std::vector<InventorySnapshot> out;
    for (const auto& market_id : market_ids()) {
        auto s = snapshot(market_id);
        if (std::fabs(s.yes_position) > kReportEpsilon || std::fabs(s.no_position) > kReportEpsilon) {
            out.push_back(std::move(s));
        }
    }
    return out;
}

std::vector<PositionRecord> InventoryLedger::leg_records(const std::string& market_id) const {
    const auto inv = get(market_id);
    std::vector<PositionRecord> out;
    if (!inv.yes_token_id.empty()) {
        out.push_back({market_id, inv.yes_token_id, inv.yes_position, inv.yes_avg_entry, inv.yes_realized_pnl,
                       Leg::Yes});
    }
    if (!inv.no_token_id.empty()) {
        out.push_back({market_id, inv.no_token_id, inv.no_position, inv.no_avg_entry, inv.no_realized_pnl,
                       Leg::No});
    }
    return out;
}

std::vector<std::string> InventoryLedger::market_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(inventory_.size());
    for (const auto& kv : inventory_) {
        ids.push_back(kv.first);
    }
    return ids;
}

double InventoryLedger::total_exposure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& kv : inventory_) {
        const auto& inv = kv.second;
        if (inv.yes_avg_entry > 0.0) {
            total += std::fabs(inv.yes_position) * inv.yes_avg_entry;
        }
        if (inv.no_avg_entry > 0.0) {
            total += std::fabs(inv.no_position) * inv.no_avg_entry;
        }
    }
    return total;
}

double InventoryLedger::total_realized_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& kv : inventory_) {
        total += kv.second.total_realized_pnl();
    }
    return total;
}

double InventoryLedger::unwind_urgency(const std::string& market_id, TimePoint now, double max_hours) const {
    if (max_hours <= 0.0) {
        return 0.0;
    }
    const auto inv = get(market_id);
    return std::min(inv.position_age_hours(now) / max_hours, 1.0);
}

bool InventoryLedger::is_at_capacity(const std::string& market_id, double max_per_market, double mid) const {
    const auto inv = get(market_id);
    const double yes_price = inv.yes_avg_entry > 0.0 ? inv.yes_avg_entry : mid;
    const double no_price = inv.no_avg_entry > 0.0 ? inv.no_avg_entry : (mid > 0.0 ? 1.0 - mid : 0.0);
    const double total_usdc = std::fabs(inv.yes_position) * yes_price + std::fabs(inv.no_position) * no_price;
    return total_usdc >= max_per_market;
}

double InventoryLedger::skew_direction(const std::string& market_id, double max_per_market) const {
    if (max_per_market <= 0.0) {
        return 0.0;
    }
    const auto inv = get(market_id);
    const double yes_value = inv.yes_position * (inv.yes_avg_entry > 0.0 ? inv.yes_avg_entry : 0.5);
    const double no_value = inv.no_position * (inv.no_avg_entry > 0.0 ? inv.no_avg_entry : 0.5);
    return (yes_value - no_value) / max_per_market;
}

double InventoryLedger::merge_amount(const std::string& market_id) const {
    return get(market_id).mergeable_pairs();
}

} // namespace mm
