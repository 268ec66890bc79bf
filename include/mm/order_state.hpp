#pragma once

#include "mm/clock.hpp"

#include <optional>
#include <string>

namespace mm {

enum class OrderState { New, Live, Partial, Filled, Cancelled, Unknown };

enum class TransitionResult { Changed, Unchanged, Rejected };

const char* to_string(OrderState state);
const char* to_string(TransitionResult result);

// Filled is terminal. Cancelled may still become Filled when a fill races the cancel.
bool can_transition(OrderState from, OrderState to);

// Venue status string -> state. Unrecognised strings map to Unknown.
OrderState parse_clob_status(const std::string& status);

// New, Live or Partial: the order may still trade.
bool is_working(OrderState state);

struct QuotePair {
    std::string market_id;
    std::string token_id;
    std::string no_token_id;
    std::string condition_id;
    double bid_price = 0.0;
    double ask_price = 0.0;
    double bid_size = 0.0;
    double ask_size = 0.0;
    std::optional<std::string> bid_order_id;
    std::optional<std::string> ask_order_id;
    OrderState bid_state = OrderState::New;
    OrderState ask_state = OrderState::New;
    // Matched quantity already turned into fill events.
    double bid_reported = 0.0;
    double ask_reported = 0.0;
    std::optional<long long> record_id;
    double quoted_mid = 0.0;
    int level = 0;
    TimePoint created_at{};
    TimePoint updated_at{};

    [[nodiscard]] double spread() const { return ask_price - bid_price; }
    [[nodiscard]] double mid() const { return (bid_price + ask_price) / 2.0; }
    [[nodiscard]] bool is_active() const { return is_working(bid_state) || is_working(ask_state); }
    [[nodiscard]] bool is_fully_filled() const {
        return bid_state == OrderState::Filled && ask_state == OrderState::Filled;
    }
    [[nodiscard]] bool is_terminal() const;
    [[nodiscard]] double age_seconds(TimePoint now) const { return seconds_between(created_at, now); }

    TransitionResult update_bid_state(OrderState next, TimePoint now = system_now());
    TransitionResult update_ask_state(OrderState next, TimePoint now = system_now());
};

} // namespace mm
