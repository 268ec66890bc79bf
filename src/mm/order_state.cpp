#include "mm/order_state.hpp"

#include "clob/util.hpp"

#include <array>
#include <iostream>

namespace mm {
namespace {

constexpr std::size_t kStateCount = 6;

// kTransitions[from][to]
constexpr std::array<std::array<bool, kStateCount>, kStateCount> kTransitions = {{
    //  New    Live   Partial Filled Cancel Unknown
    {{false, true,  false,  true,  true,  true }},   // New
    {{false, false, true,   true,  true,  true }},   // Live
    {{false, false, false,  true,  true,  true }},   // Partial
    {{false, false, false,  false, false, false}},   // Filled
    {{false, false, false,  true,  false, false}},   // Cancelled
    {{false, true,  true,   true,  true,  false}},   // Unknown
}};

std::size_t index_of(OrderState state) {
    return static_cast<std::size_t>(state);
}

TransitionResult apply_transition(OrderState& current, OrderState next, const char* side,
                                  const std::string& market_id, TimePoint now, TimePoint& updated_at) {
    if (current == next) {
        return TransitionResult::Unchanged;
    }
    if (!can_transition(current, next)) {
        std::cerr << "[Quoter] Invalid " << side << " transition " << to_string(current)
                  << " -> " << to_string(next) << " for " << market_id.substr(0, 16) << std::endl;
        return TransitionResult::Rejected;
    }
    current = next;
    updated_at = now;
    return TransitionResult::Changed;
}

} // namespace

const char* to_string(OrderState state) {
    switch (state) {
        case OrderState::New: return "NEW";
        case OrderState::Live: return "LIVE";
        case OrderState::Partial: return "PARTIAL";
        case OrderState::Filled: return "FILLED";
        case OrderState::Cancelled: return "CANCELLED";
        case OrderState::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* to_string(TransitionResult result) {
    switch (result) {
        case TransitionResult::Changed: return "changed";
        case TransitionResult::Unchanged: return "unchanged";
        case TransitionResult::Rejected: return "rejected";
    }
    return "rejected";
}

bool can_transition(OrderState from, OrderState to) {
    return kTransitions[index_of(from)][index_of(to)];
}

OrderState parse_clob_status(const std::string& status) {
    const auto normalized = clob::to_upper_copy(clob::trim_copy(status));
    if (normalized == "LIVE" || normalized == "ACTIVE" || normalized == "OPEN") {
        return OrderState::Live;
    }
    if (normalized == "MATCHED" || normalized == "FILLED") {
        return OrderState::Filled;
    }
    if (normalized == "CANCELLED" || normalized == "CANCELED" || normalized == "EXPIRED") {
        return OrderState::Cancelled;
    }
    return OrderState::Unknown;
}

bool is_working(OrderState state) {
    return state == OrderState::New || state == OrderState::Live || state == OrderState::Partial;
}

bool QuotePair::is_terminal() const {
    const auto done = [](OrderState state) {
        return state == OrderState::Filled || state == OrderState::Cancelled;
    };
    return done(bid_state) && done(ask_state);
}

TransitionResult QuotePair::update_bid_state(OrderState next, TimePoint now) {
    return apply_transition(bid_state, next, "bid", market_id, now, updated_at);
}

TransitionResult QuotePair::update_ask_state(OrderState next, TimePoint now) {
    return apply_transition(ask_state, next, "ask", market_id, now, updated_at);
}

} // namespace mm
