#include "mm/store.hpp"

#include "clob/util.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace mm {

namespace {

template <typename T>
T json_value_or(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

OrderState state_from_string(const std::string& value) {
    if (value == "NEW") {
        return OrderState::New;
    }
    if (value == "PARTIAL") {
        return OrderState::Partial;
    }
    return parse_clob_status(value);
}

std::string inventory_key(const std::string& market_id, const std::string& token_id) {
    return market_id + "|" + token_id;
}

nlohmann::json optional_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json quote_to_json(const QuotePair& pair, long long id) {
    return nlohmann::json{
        {"kind", "quote"},
        {"id", id},
        {"market_id", pair.market_id},
        {"token_id", pair.token_id},
        {"no_token_id", pair.no_token_id},
        {"condition_id", pair.condition_id},
        {"bid_price", pair.bid_price},
        {"ask_price", pair.ask_price},
        {"bid_size", pair.bid_size},
        {"ask_size", pair.ask_size},
        {"bid_order_id", optional_json(pair.bid_order_id)},
        {"ask_order_id", optional_json(pair.ask_order_id)},
        {"bid_state", to_string(pair.bid_state)},
        {"ask_state", to_string(pair.ask_state)},
        {"bid_reported", pair.bid_reported},
        {"ask_reported", pair.ask_reported},
        {"quoted_mid", pair.quoted_mid},
        {"level", pair.level},
        {"created_at", to_epoch_ms(pair.created_at)},
        {"updated_at", to_epoch_ms(pair.updated_at)},
    };
}

QuotePair quote_from_json(const nlohmann::json& j) {
    QuotePair pair;
    pair.record_id = json_value_or<long long>(j, "id", 0);
    pair.market_id = json_value_or<std::string>(j, "market_id", "");
    pair.token_id = json_value_or<std::string>(j, "token_id", "");
    pair.no_token_id = json_value_or<std::string>(j, "no_token_id", "");
    pair.condition_id = json_value_or<std::string>(j, "condition_id", "");
    pair.bid_price = json_value_or<double>(j, "bid_price", 0.0);
    pair.ask_price = json_value_or<double>(j, "ask_price", 0.0);
    pair.bid_size = json_value_or<double>(j, "bid_size", 0.0);
    pair.ask_size = json_value_or<double>(j, "ask_size", 0.0);
    pair.bid_order_id = optional_string(j, "bid_order_id");
    pair.ask_order_id = optional_string(j, "ask_order_id");
    pair.bid_state = state_from_string(json_value_or<std::string>(j, "bid_state", "UNKNOWN"));
    pair.ask_state = state_from_string(json_value_or<std::string>(j, "ask_state", "UNKNOWN"));
    pair.bid_reported = json_value_or<double>(j, "bid_reported", 0.0);
    pair.ask_reported = json_value_or<double>(j, "ask_reported", 0.0);
    pair.quoted_mid = json_value_or<double>(j, "quoted_mid", 0.0);
    pair.level = json_value_or<int>(j, "level", 0);
    pair.created_at = from_epoch_ms(json_value_or<long long>(j, "created_at", 0));
    pair.updated_at = from_epoch_ms(json_value_or<long long>(j, "updated_at", 0));
    return pair;
}

nlohmann::json fill_to_json(const FillRecord& fill) {
    return nlohmann::json{
        {"kind", "fill"},
        {"order_id", fill.order_id},
        {"market_id", fill.market_id},
        {"token_id", fill.token_id},
        {"side", clob::to_string(fill.side)},
        {"price", fill.price},
        {"size", fill.size},
        {"fees", fill.fees},
        {"cumulative_matched", fill.cumulative_matched},
        {"mid_at_fill", fill.mid_at_fill},
        {"time", to_epoch_ms(fill.timestamp)},
    };
}

FillRecord fill_from_json(const nlohmann::json& j) {
    FillRecord fill;
    fill.order_id = json_value_or<std::string>(j, "order_id", "");
    fill.market_id = json_value_or<std::string>(j, "market_id", "");
    fill.token_id = json_value_or<std::string>(j, "token_id", "");
    fill.side = json_value_or<std::string>(j, "side", "BUY") == "SELL" ? clob::Side::Sell : clob::Side::Buy;
    fill.price = json_value_or<double>(j, "price", 0.0);
    fill.size = json_value_or<double>(j, "size", 0.0);
    fill.fees = json_value_or<double>(j, "fees", 0.0);
    fill.cumulative_matched = json_value_or<double>(j, "cumulative_matched", 0.0);
    fill.mid_at_fill = json_value_or<double>(j, "mid_at_fill", 0.0);
    fill.timestamp = from_epoch_ms(json_value_or<long long>(j, "time", 0));
    return fill;
}

nlohmann::json inventory_to_json(const PositionRecord& record) {
    return nlohmann::json{
        {"kind", "inventory"},
        {"market_id", record.market_id},
        {"token_id", record.token_id},
        {"leg", to_string(record.leg)},
        {"net_position", record.position},
        {"avg_entry_price", record.avg_entry_price},
        {"realized_pnl", record.realized_pnl},
    };
}

nlohmann::json metrics_to_json(const DailyMetrics& metrics) {
    return nlohmann::json{
        {"kind", "metrics"},
        {"date", metrics.date},
        {"start_value", metrics.start_value},
        {"end_value", metrics.end_value},
        {"realized_pnl", metrics.realized_pnl},
        {"daily_return_pct", metrics.daily_return_pct},
        {"fills", metrics.fills},
        {"quotes_placed", metrics.quotes_placed},
        {"fill_quality_bps", metrics.fill_quality_bps},
        {"adverse_selection_bps", metrics.adverse_selection_bps},
        {"pnl_gross", metrics.pnl_gross},
        {"pnl_net", metrics.pnl_net},
        {"profit_factor", metrics.profit_factor},
        {"max_inventory", metrics.max_inventory},
        {"inventory_turns", metrics.inventory_turns},
        {"sharpe_7d", metrics.sharpe_7d},
    };
}

DailyMetrics metrics_from_json(const nlohmann::json& j) {
    DailyMetrics metrics;
    metrics.date = json_value_or<std::string>(j, "date", "");
    metrics.start_value = json_value_or<double>(j, "start_value", 0.0);
    metrics.end_value = json_value_or<double>(j, "end_value", 0.0);
    metrics.realized_pnl = json_value_or<double>(j, "realized_pnl", 0.0);
    metrics.daily_return_pct = json_value_or<double>(j, "daily_return_pct", 0.0);
    metrics.fills = json_value_or<int>(j, "fills", 0);
    metrics.quotes_placed = json_value_or<int>(j, "quotes_placed", 0);
    metrics.fill_quality_bps = json_value_or<double>(j, "fill_quality_bps", 0.0);
    metrics.adverse_selection_bps = json_value_or<double>(j, "adverse_selection_bps", 0.0);
    metrics.pnl_gross = json_value_or<double>(j, "pnl_gross", 0.0);
    metrics.pnl_net = json_value_or<double>(j, "pnl_net", 0.0);
    metrics.profit_factor = json_value_or<double>(j, "profit_factor", 0.0);
    metrics.max_inventory = json_value_or<double>(j, "max_inventory", 0.0);
    metrics.inventory_turns = json_value_or<double>(j, "inventory_turns", 0.0);
    metrics.sharpe_7d = json_value_or<double>(j, "sharpe_7d", 0.0);
    return metrics;
}

} // namespace

std::string fill_key(const std::string& order_id, double cumulative_matched) {
    return order_id + "@" + clob::format_decimal(cumulative_matched, 6);
}

JsonlStore::JsonlStore(JsonlStoreConfig config)
    : config_(std::move(config)) {
    if (config_.journal_name.empty()) {
        throw std::invalid_argument("JsonlStore journal name not set");
    }
}

std::size_t JsonlStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    quotes_.clear();
    fills_.clear();
    inventory_.clear();
    metrics_.clear();
    high_water_mark_.reset();
    next_quote_id_ = 1;
    appends_since_compact_ = 0;

    ensure_directory();
    std::size_t applied = 0;
    std::size_t skipped = 0;
    {
        std::ifstream input(journal_path());
        if (!input.good()) {
            return 0;
        }
        std::string line;
        while (std::getline(input, line)) {
            if (line.empty()) {
                continue;
            }
            try {
                apply(nlohmann::json::parse(line));
                ++applied;
            } catch (const nlohmann::json::exception& ex) {
                ++skipped;
                std::cerr << "[Store] Skipping malformed journal line: " << ex.what() << std::endl;
            }
        }
    }

    std::cout << "[Store] Replayed " << applied << " records from " << journal_path().string();
    if (skipped > 0) {
        std::cout << " (" << skipped << " skipped)";
    }
    std::cout << std::endl;

    const auto written = compact_locked();
    if (written < applied + skipped) {
        std::cout << "[Store] Compacted journal to " << written << " lines" << std::endl;
    }
    return applied;
}

std::size_t JsonlStore::compact() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_directory();
    return compact_locked();
}

void JsonlStore::prune_fills() {
    if (fills_.empty() || config_.fill_retention_days <= 0) {
        return;
    }
    TimePoint newest{};
    for (const auto& kv : fills_) {
        newest = std::max(newest, kv.second.timestamp);
    }
    const auto cutoff = newest - std::chrono::hours(24 * config_.fill_retention_days);
    for (auto it = fills_.begin(); it != fills_.end();) {
        if (it->second.timestamp < cutoff) {
            it = fills_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t JsonlStore::compact_locked() {
    prune_fills();

    std::vector<nlohmann::json> lines;
    lines.push_back(nlohmann::json{{"kind", "meta"}, {"next_quote_id", next_quote_id_}});
    for (const auto& kv : quotes_) {
        lines.push_back(quote_to_json(kv.second, kv.first));
    }
    for (const auto& kv : fills_) {
        lines.push_back(fill_to_json(kv.second));
    }
    for (const auto& kv : inventory_) {
        lines.push_back(inventory_to_json(kv.second));
    }
    for (const auto& kv : metrics_) {
        lines.push_back(metrics_to_json(kv.second));
    }
    if (high_water_mark_) {
        lines.push_back(nlohmann::json{{"kind", "hwm"}, {"peak_value", *high_water_mark_}});
    }

    const auto target = journal_path();
    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.good()) {
            throw std::runtime_error("Failed to write compacted journal at " + temp.string());
        }
        for (const auto& line : lines) {
            output << line.dump() << '\n';
        }
        output.flush();
        if (!output.good()) {
            throw std::runtime_error("Failed to write compacted journal at " + temp.string());
        }
    }
    std::filesystem::rename(temp, target);
    appends_since_compact_ = 0;
    return lines.size();
}

void JsonlStore::apply(const nlohmann::json& line) {
    const auto kind = json_value_or<std::string>(line, "kind", "");
    if (kind == "quote") {
        auto pair = quote_from_json(line);
        const long long id = pair.record_id.value_or(0);
        if (id <= 0) {
            return;
        }
        next_quote_id_ = std::max(next_quote_id_, id + 1);
        if (pair.is_active()) {
            quotes_[id] = std::move(pair);
        } else {
            quotes_.erase(id);
        }
    } else if (kind == "fill") {
        auto fill = fill_from_json(line);
        fills_[fill_key(fill.order_id, fill.cumulative_matched)] = std::move(fill);
    } else if (kind == "inventory") {
        PositionRecord record;
        record.market_id = json_value_or<std::string>(line, "market_id", "");
        record.token_id = json_value_or<std::string>(line, "token_id", "");
        record.leg = parse_leg(json_value_or<std::string>(line, "leg", "YES"));
        record.position = json_value_or<double>(line, "net_position", 0.0);
        record.avg_entry_price = json_value_or<double>(line, "avg_entry_price", 0.0);
        record.realized_pnl = json_value_or<double>(line, "realized_pnl", 0.0);
        inventory_[inventory_key(record.market_id, record.token_id)] = record;
    } else if (kind == "metrics") {
        auto metrics = metrics_from_json(line);
        metrics_[metrics.date] = std::move(metrics);
    } else if (kind == "hwm") {
        high_water_mark_ = json_value_or<double>(line, "peak_value", 0.0);
    } else if (kind == "meta") {
        next_quote_id_ = std::max(next_quote_id_, json_value_or<long long>(line, "next_quote_id", 1));
    }
}

void JsonlStore::ensure_directory() const {
    if (config_.data_dir.empty()) {
        throw std::runtime_error("JsonlStore data directory not set");
    }
    if (!std::filesystem::exists(config_.data_dir)) {
        std::filesystem::create_directories(config_.data_dir);
    }
}

void JsonlStore::append(const nlohmann::json& line) {
    ensure_directory();
    std::ofstream output(journal_path(), std::ios::app);
    if (!output.good()) {
        throw std::runtime_error("Failed to append to journal at " + journal_path().string());
    }
    output << line.dump() << '\n';
}

void JsonlStore::commit(const nlohmann::json& line) {
    append(line);
    apply(line);
    if (config_.compact_every > 0 && ++appends_since_compact_ >= config_.compact_every) {
        compact_locked();
    }
}

long long JsonlStore::upsert_quote(const QuotePair& pair) {
    std::lock_guard<std::mutex> lock(mutex_);
    const long long id = pair.record_id.value_or(next_quote_id_);
    const auto line = quote_to_json(pair, id);
    commit(line);
    return id;
}

bool JsonlStore::record_fill(const FillRecord& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fills_.count(fill_key(fill.order_id, fill.cumulative_matched)) > 0) {
        return false;
    }
    const auto line = fill_to_json(fill);
    commit(line);
    return true;
}

void JsonlStore::upsert_inventory(const PositionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto line = inventory_to_json(record);
    commit(line);
}

void JsonlStore::upsert_daily_metrics(const DailyMetrics& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto line = metrics_to_json(metrics);
    commit(line);
}

void JsonlStore::set_high_water_mark(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (high_water_mark_ && *high_water_mark_ == value) {
        return;
    }
    const nlohmann::json line{{"kind", "hwm"}, {"peak_value", value}, {"time", to_epoch_ms(system_now())}};
    commit(line);
}

void JsonlStore::write_status(const nlohmann::json& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_directory();
    const auto target = status_path();
    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.good()) {
            throw std::runtime_error("Failed to write status at " + temp.string());
        }
        output << status.dump(2) << '\n';
    }
    std::filesystem::rename(temp, target);
}

std::optional<double> JsonlStore::high_water_mark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_mark_;
}

std::vector<QuotePair> JsonlStore::active_quotes(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QuotePair> out;
    for (const auto& kv : quotes_) {
        if (!kv.second.is_active()) {
            continue;
        }
        if (!market_id.empty() && kv.second.market_id != market_id) {
            continue;
        }
        out.push_back(kv.second);
    }
    return out;
}

std::vector<PositionRecord> JsonlStore::inventory(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PositionRecord> out;
    for (const auto& kv : inventory_) {
        if (market_id.empty() || kv.second.market_id == market_id) {
            out.push_back(kv.second);
        }
    }
    return out;
}

std::vector<FillRecord> JsonlStore::fills_since(TimePoint since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FillRecord> out;
    for (const auto& kv : fills_) {
        if (kv.second.timestamp >= since) {
            out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const FillRecord& a, const FillRecord& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

std::optional<DailyMetrics> JsonlStore::daily_metrics(const std::string& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = metrics_.find(date);
    if (it == metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DailyMetrics> JsonlStore::metrics_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyMetrics> out;
    out.reserve(metrics_.size());
    for (const auto& kv : metrics_) {
        out.push_back(kv.second);
    }
    return out;
}

} // namespace mm
