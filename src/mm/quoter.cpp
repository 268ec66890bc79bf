#include "mm/quoter.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace mm {
namespace {

constexpr double kFillEpsilon = 1e-9;

struct SideView {
    std::optional<std::string>& order_id;
    OrderState& state;
    double& price;
    double& size;
    double& reported;
    clob::Side side;
    const char* label;
};

SideView view(QuotePair& pair, bool bid) {
    if (bid) {
        return {pair.bid_order_id, pair.bid_state, pair.bid_price, pair.bid_size, pair.bid_reported,
                clob::Side::Buy, "bid"};
    }
    return {pair.ask_order_id, pair.ask_state, pair.ask_price, pair.ask_size, pair.ask_reported,
            clob::Side::Sell, "ask"};
}

TransitionResult transition(QuotePair& pair, bool bid, OrderState next, TimePoint now) {
    return bid ? pair.update_bid_state(next, now) : pair.update_ask_state(next, now);
}

bool is_open(OrderState state) {
    return state != OrderState::Filled && state != OrderState::Cancelled;
}

std::string describe(const std::optional<clob::OrderError>& error) {
    if (!error) {
        return "none";
    }
    return error->code + (error->details.empty() ? "" : " (" + error->details + ")");
}

const char* mode_label(bool bid, bool ask) {
    if (bid && ask) {
        return "BID+ASK";
    }
    return bid ? "BID-only" : "ASK-only";
}

} // namespace

Quoter::Quoter(clob::VenueApi& venue, QuoterConfig config, ClockFn clock)
    : venue_(venue),
      config_(std::move(config)),
      clock_(std::move(clock)) {}

Quoter::SideResult Quoter::place_side(const std::string& token_id, clob::Side side, double price, double size) {
    clob::OrderRequest request;
    request.token_id = token_id;
    request.price = price;
    request.size = size;
    request.side = side;
    request.order_type = config_.order_type;
    request.post_only = config_.post_only;

    const auto result = venue_.place_limit_order(request);
    SideResult out;
    out.price = price;
    if (result.accepted) {
        out.order_id = result.order_id;
        out.state = result.order_id ? OrderState::Live : OrderState::Unknown;
        if (result.price > 0.0) {
            out.price = result.price;
        }
        return out;
    }

    out.state = OrderState::Cancelled;
    out.error = result.error;
    if (!out.error) {
        clob::OrderError error;
        error.code = "api_error";
        error.side = side;
        error.token_id = token_id;
        error.price = price;
        error.size = size;
        out.error = error;
    }
    return out;
}

std::optional<QuotePair> Quoter::place_quote_pair(const std::string& token_id,
                                                  const std::string& market_id,
                                                  double bid_price,
                                                  double ask_price,
                                                  double bid_size,
                                                  double ask_size,
                                                  bool place_bid,
                                                  bool place_ask) {
    last_failure_.reset();
    const auto now = clock_();

    QuotePair pair;
    pair.market_id = market_id;
    pair.token_id = token_id;
    pair.bid_price = bid_price;
    pair.ask_price = ask_price;
    pair.bid_size = bid_size;
    pair.ask_size = ask_size;
    pair.bid_state = OrderState::Cancelled;
    pair.ask_state = OrderState::Cancelled;
    pair.created_at = now;
    pair.updated_at = now;

    std::optional<clob::OrderError> bid_error;
    std::optional<clob::OrderError> ask_error;

    if (place_bid && bid_size > 0.0) {
        auto result = place_side(token_id, clob::Side::Buy, bid_price, bid_size);
        pair.bid_order_id = std::move(result.order_id);
        pair.bid_state = result.state;
        pair.bid_price = result.price;
        bid_error = std::move(result.error);
    }
    if (place_ask && ask_size > 0.0) {
        auto result = place_side(token_id, clob::Side::Sell, ask_price, ask_size);
        pair.ask_order_id = std::move(result.order_id);
        pair.ask_state = result.state;
        pair.ask_price = result.price;
        ask_error = std::move(result.error);
    }

    if (!pair.bid_order_id && !pair.ask_order_id) {
        last_failure_ = QuoteFailure{market_id, token_id, bid_error, ask_error, place_bid, place_ask,
                                     bid_size, ask_size, bid_price, ask_price};
        std::cerr << "[Quoter] Quote failed for " << market_id << " (sides=" << mode_label(place_bid, place_ask)
                  << ", bid_error=" << describe(bid_error) << ", ask_error=" << describe(ask_error) << ")"
                  << std::endl;
        return std::nullopt;
    }

    std::cout << "[Quoter] Quote placed (" << mode_label(pair.bid_order_id.has_value(), pair.ask_order_id.has_value())
              << "): BID " << pair.bid_price << " x" << bid_size << " / ASK " << pair.ask_price << " x" << ask_size
              << " on " << market_id << std::endl;
    return pair;
}

bool Quoter::cancel_side(QuotePair& pair, bool bid) {
    auto side = view(pair, bid);
    if (!side.order_id || !is_open(side.state)) {
        return true;
    }
    if (!venue_.cancel_order(*side.order_id)) {
        std::cerr << "[Quoter] Cancel failed for " << side.label << " " << *side.order_id << std::endl;
        return false;
    }
    transition(pair, bid, OrderState::Cancelled, clock_());
    return true;
}

bool Quoter::cancel_quote_pair(QuotePair& pair) {
    const bool bid_ok = cancel_side(pair, true);
    const bool ask_ok = cancel_side(pair, false);
    return bid_ok && ask_ok;
}

std::optional<QuotePair> Quoter::requote(QuotePair& pair, const QuoteRequest& request) {
    return rebuild(pair, request, false);
}

void Quoter::carry_or_place(QuotePair& previous, QuotePair& next, bool bid, const QuoteRequest& request,
                            bool preserve_hanging, std::optional<clob::OrderError>& error) {
    auto old_side = view(previous, bid);
    auto new_side = view(next, bid);
    const double target_price = bid ? request.bid_price : request.ask_price;
    const double target_size = bid ? request.bid_size : request.ask_size;
    const bool wanted = (bid ? request.place_bid : request.place_ask) && target_size > 0.0;

    bool keep = false;
    if (preserve_hanging && old_side.order_id && old_side.state == OrderState::Partial) {
        keep = true;
    } else if (old_side.order_id && is_open(old_side.state)) {
        const bool moved = std::fabs(old_side.price - target_price) >= config_.reprice_threshold;
        if (preserve_hanging && wanted && !moved) {
            keep = true;
        } else if (!cancel_side(previous, bid)) {
            // Still resting on the venue, so it stays tracked.
            keep = true;
        }
    }

    if (keep) {
        new_side.order_id = std::move(old_side.order_id);
        old_side.order_id.reset();
        new_side.state = old_side.state;
        new_side.price = old_side.price;
        new_side.size = old_side.size;
        new_side.reported = old_side.reported;
        return;
    }

    if (!wanted) {
        new_side.state = OrderState::Cancelled;
        return;
    }
    auto result = place_side(next.token_id, new_side.side, target_price, target_size);
    new_side.order_id = std::move(result.order_id);
    new_side.state = result.state;
    new_side.price = result.price;
    error = std::move(result.error);
}

std::optional<QuotePair> Quoter::requote_preserving_hanging(QuotePair& pair, const QuoteRequest& request) {
    return rebuild(pair, request, true);
}

std::optional<QuotePair> Quoter::rebuild(QuotePair& pair, const QuoteRequest& request, bool preserve_hanging) {
    last_failure_.reset();
    const auto now = clock_();

    QuotePair next;
    next.market_id = pair.market_id;
    next.token_id = pair.token_id;
    next.no_token_id = pair.no_token_id;
    next.condition_id = pair.condition_id;
    next.level = pair.level;
    next.bid_price = request.bid_price;
    next.ask_price = request.ask_price;
    next.bid_size = request.bid_size;
    next.ask_size = request.ask_size;
    next.created_at = now;
    next.updated_at = now;

    std::optional<clob::OrderError> bid_error;
    std::optional<clob::OrderError> ask_error;
    carry_or_place(pair, next, true, request, preserve_hanging, bid_error);
    carry_or_place(pair, next, false, request, preserve_hanging, ask_error);

    if (!next.bid_order_id && !next.ask_order_id) {
        last_failure_ = QuoteFailure{next.market_id, next.token_id, bid_error, ask_error,
                                     request.place_bid, request.place_ask, request.bid_size, request.ask_size,
                                     request.bid_price, request.ask_price};
        std::cerr << "[Quoter] Requote left no orders for " << next.market_id
                  << " (bid_error=" << describe(bid_error) << ", ask_error=" << describe(ask_error) << ")"
                  << std::endl;
        return std::nullopt;
    }
    return next;
}

void Quoter::reconcile_side(QuotePair& pair, bool bid, bool include_cancelled, std::vector<FillEvent>& fills) {
    auto side = view(pair, bid);
    if (!side.order_id) {
        return;
    }
    const bool pollable = is_working(side.state) || side.state == OrderState::Unknown
                          || (include_cancelled && side.state == OrderState::Cancelled);
    if (!pollable) {
        return;
    }

    const auto report = venue_.is_order_filled(*side.order_id);
    const auto venue_state = parse_clob_status(report.status);
    const bool filled = report.is_filled || venue_state == OrderState::Filled;

    double matched = report.size_matched;
    if (filled && matched <= 0.0) {
        matched = side.size;
    }

    const double increment = matched - side.reported;
    if (increment > kFillEpsilon) {
        FillEvent fill;
        fill.market_id = pair.market_id;
        fill.token_id = pair.token_id;
        fill.order_id = *side.order_id;
        fill.side = side.side;
        fill.price = report.avg_fill_price && *report.avg_fill_price > 0.0 ? *report.avg_fill_price : side.price;
        fill.size = increment;
        fill.fees = matched > 0.0 ? report.fees_paid * increment / matched : 0.0;
        fill.cumulative_matched = matched;
        fill.level = pair.level;
        fills.push_back(std::move(fill));
        side.reported = matched;
    }

    const auto now = clock_();
    if (filled) {
        transition(pair, bid, OrderState::Filled, now);
    } else if (side.state == OrderState::Cancelled) {
        return;
    } else if (venue_state == OrderState::Cancelled) {
        transition(pair, bid, OrderState::Cancelled, now);
    } else if (matched > 0.0) {
        transition(pair, bid, OrderState::Partial, now);
    } else {
        transition(pair, bid, venue_state, now);
    }
}

std::vector<FillEvent> Quoter::reconcile_quote(QuotePair& pair, bool include_cancelled) {
    std::vector<FillEvent> fills;
    reconcile_side(pair, true, include_cancelled, fills);
    reconcile_side(pair, false, include_cancelled, fills);
    return fills;
}

} // namespace mm
