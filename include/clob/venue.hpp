#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clob {

enum class Side { Buy, Sell };

inline const char* to_string(Side side) {
    return side == Side::Buy ? "BUY" : "SELL";
}

struct OrderRequest {
    std::string token_id;
    double price = 0.0;
    double size = 0.0;
    Side side = Side::Buy;
    std::string order_type = "GTC";
    bool post_only = true;
};

// Structured reason for a refused order. Codes: post_only_cross,
// insufficient_balance, api_error, exception.
struct OrderError {
    std::string code;
    Side side = Side::Buy;
    std::string token_id;
    double price = 0.0;
    double size = 0.0;
    std::string details;
};

struct PlaceOrderResult {
    bool accepted = false;
    std::optional<std::string> order_id;   // accepted without an id leaves this empty
    std::optional<OrderError> error;
    // Price the order rests at; post-only repricing can move it off the request.
    double price = 0.0;
};

struct OrderStatusReport {
    bool is_filled = false;
    std::string status = "UNKNOWN";
    double size_matched = 0.0;
    double original_size = 0.0;
    std::optional<double> avg_fill_price;
    double fees_paid = 0.0;
};

// Top-of-book plus five-level depth in collateral notional.
struct BookSummary {
    double best_bid = 0.0;
    double best_ask = 0.0;
    double spread = 0.0;
    std::optional<double> mid;
    double bid_depth = 0.0;
    double ask_depth = 0.0;
    double min_order_size = 5.0;
    double imbalance = 0.0;
};

struct OpenOrder {
    std::string id;
    std::string token_id;
    Side side = Side::Buy;
    double price = 0.0;
    double size = 0.0;
    double size_matched = 0.0;
};

// Order venue as seen by the market-making core. Expected venue rejections are
// reported through return values; implementations do not throw for them.
class VenueApi {
public:
    virtual ~VenueApi() = default;

    virtual PlaceOrderResult place_limit_order(const OrderRequest& request) = 0;
    virtual bool cancel_order(const std::string& order_id) = 0;
    virtual OrderStatusReport is_order_filled(const std::string& order_id) = 0;
    virtual std::optional<BookSummary> get_book_summary(const std::string& token_id) = 0;

    // Conditional-token settlement: YES+NO pairs <-> collateral.
    virtual bool merge_positions(const std::string& condition_id, double amount) = 0;
    virtual bool split_position(const std::string& condition_id, double amount) = 0;

    virtual std::optional<double> get_collateral_balance() = 0;
    virtual std::vector<OpenOrder> get_open_orders() = 0;
};

} // namespace clob
