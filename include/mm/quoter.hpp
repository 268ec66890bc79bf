#pragma once

#include "clob/venue.hpp"
#include "mm/clock.hpp"
#include "mm/order_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mm {

struct QuoterConfig {
    bool post_only = true;
    std::string order_type = "GTC";
    // Live orders closer than this to their new price are left resting.
    double reprice_threshold = 0.005;
};

// Why neither side of a quote made it onto the book.
struct QuoteFailure {
    std::string market_id;
    std::string token_id;
    std::optional<clob::OrderError> bid_error;
    std::optional<clob::OrderError> ask_error;
    bool place_bid = false;
    bool place_ask = false;
    double bid_size = 0.0;
    double ask_size = 0.0;
    double bid_price = 0.0;
    double ask_price = 0.0;
};

// Newly matched quantity on one order since the last reconcile.
struct FillEvent {
    std::string market_id;
    std::string token_id;
    std::string order_id;
    clob::Side side = clob::Side::Buy;
    double price = 0.0;
    double size = 0.0;
    double fees = 0.0;
    double cumulative_matched = 0.0;
    int level = 0;
};

struct QuoteRequest {
    double bid_price = 0.0;
    double ask_price = 0.0;
    double bid_size = 0.0;
    double ask_size = 0.0;
    bool place_bid = true;
    bool place_ask = true;
};

// Places, cancels and polls the quote pairs of a single market. Not thread-safe:
// one owner per market.
class Quoter {
public:
    Quoter(clob::VenueApi& venue, QuoterConfig config = {}, ClockFn clock = system_now);

    std::optional<QuotePair> place_quote_pair(const std::string& token_id,
                                              const std::string& market_id,
                                              double bid_price,
                                              double ask_price,
                                              double bid_size,
                                              double ask_size,
                                              bool place_bid = true,
                                              bool place_ask = true);

    // False when any cancel the venue was asked for did not go through.
    bool cancel_quote_pair(QuotePair& pair);

    // Cancels and replaces both sides. A side whose cancel is refused stays on
    // the book and is carried into the new pair instead of being duplicated.
    std::optional<QuotePair> requote(QuotePair& pair, const QuoteRequest& request);

    // Keeps partially filled sides and Live sides that have not moved. Sides
    // handed to the new pair lose their order id in `pair`.
    std::optional<QuotePair> requote_preserving_hanging(QuotePair& pair, const QuoteRequest& request);

    // Polls working sides and returns quantity matched since the previous poll.
    // With include_cancelled, Cancelled sides are polled too to catch late fills.
    std::vector<FillEvent> reconcile_quote(QuotePair& pair, bool include_cancelled = false);

    [[nodiscard]] const std::optional<QuoteFailure>& last_quote_failure() const { return last_failure_; }

private:
    struct SideResult {
        std::optional<std::string> order_id;
        OrderState state = OrderState::Cancelled;
        double price = 0.0;
        std::optional<clob::OrderError> error;
    };

    SideResult place_side(const std::string& token_id, clob::Side side, double price, double size);
    bool cancel_side(QuotePair& pair, bool bid);
    void carry_or_place(QuotePair& previous, QuotePair& next, bool bid, const QuoteRequest& request,
                        bool preserve_hanging, std::optional<clob::OrderError>& error);
    std::optional<QuotePair> rebuild(QuotePair& pair, const QuoteRequest& request, bool preserve_hanging);
    void reconcile_side(QuotePair& pair, bool bid, bool include_cancelled, std::vector<FillEvent>& fills);

    clob::VenueApi& venue_;
    QuoterConfig config_;
    ClockFn clock_;
    std::optional<QuoteFailure> last_failure_;
};

} // namespace mm
