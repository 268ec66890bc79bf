#include "clob/clob_client.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <utility>

namespace clob {
namespace {

constexpr double kTick = 0.01;
constexpr double kMinPrice = 0.01;
constexpr double kMaxPrice = 0.99;
constexpr int kDepthLevels = 5;
constexpr double kCollateralScale = 1e6;

double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// First key present wins, matching how the venue renamed fields across versions.
double first_double(const nlohmann::json& obj, std::initializer_list<const char*> keys, double fallback) {
    for (const char* key : keys) {
        if (obj.contains(key)) {
            return get_double_optional(obj, key, fallback);
        }
    }
    return fallback;
}

std::optional<double> first_positive(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (obj.contains(key)) {
            const double value = get_double_optional(obj, key, 0.0);
            if (value > 0.0) {
                return value;
            }
        }
    }
    return std::nullopt;
}

struct Level {
    double price = 0.0;
    double size = 0.0;
};

std::vector<Level> parse_levels(const nlohmann::json& book, const char* key) {
    std::vector<Level> levels;
    if (!book.contains(key) || !book.at(key).is_array()) {
        return levels;
    }
    for (const auto& entry : book.at(key)) {
        Level level;
        if (entry.is_array() && entry.size() >= 2) {
            level.price = parse_double_optional(entry[0]);
            level.size = parse_double_optional(entry[1]);
        } else {
            level.price = get_double_optional(entry, "price");
            level.size = get_double_optional(entry, "size");
        }
        if (level.price > 0.0) {
            levels.push_back(level);
        }
    }
    return levels;
}

double depth_notional(const std::vector<Level>& levels) {
    double total = 0.0;
    const auto count = std::min<std::size_t>(levels.size(), kDepthLevels);
    for (std::size_t i = 0; i < count; ++i) {
        total += std::max(0.0, levels[i].price * levels[i].size);
    }
    return total;
}

std::string extract_order_id(const nlohmann::json& response) {
    for (const char* key : {"orderID", "orderId", "order_id", "id"}) {
        const auto value = get_string_optional(response, key);
        if (!value.empty()) {
            return value;
        }
    }
    return {};
}

} // namespace

bool is_retryable_status(long status_code) {
    return status_code == 425 || status_code == 429;
}

bool is_post_only_cross_message(const std::string& message) {
    const auto lower = lower_copy(message);
    return lower.find("post-only") != std::string::npos && lower.find("crosses book") != std::string::npos;
}

std::string classify_order_error(const std::string& message) {
    if (is_post_only_cross_message(message)) {
        return "post_only_cross";
    }
    const auto lower = lower_copy(message);
    if (lower.find("not enough balance") != std::string::npos ||
        lower.find("insufficient") != std::string::npos) {
        return "insufficient_balance";
    }
    return "api_error";
}

std::vector<double> post_only_retry_prices(double price, Side side, int max_steps) {
    std::vector<double> prices;
    const double base = round_cents(price);
    const double direction = side == Side::Buy ? -1.0 : 1.0;
    for (int step = 1; step <= max_steps; ++step) {
        const double candidate = round_cents(base + direction * kTick * step);
        if (candidate < kMinPrice - 1e-9 || candidate > kMaxPrice + 1e-9) {
            continue;
        }
        prices.push_back(candidate);
    }
    return prices;
}

BookSummary parse_book_summary(const nlohmann::json& book) {
    auto bids = parse_levels(book, "bids");
    auto asks = parse_levels(book, "asks");
    std::sort(bids.begin(), bids.end(), [](const Level& a, const Level& b) { return a.price > b.price; });
    std::sort(asks.begin(), asks.end(), [](const Level& a, const Level& b) { return a.price < b.price; });

    BookSummary summary;
    summary.best_bid = bids.empty() ? 0.0 : bids.front().price;
    summary.best_ask = asks.empty() ? 1.0 : asks.front().price;
    summary.spread = summary.best_ask - summary.best_bid;
    if (summary.best_bid > 0.0 && summary.best_ask > 0.0) {
        summary.mid = (summary.best_bid + summary.best_ask) / 2.0;
    }
    summary.bid_depth = depth_notional(bids);
    summary.ask_depth = depth_notional(asks);
    const double total_depth = summary.bid_depth + summary.ask_depth;
    summary.imbalance = total_depth > 0.0 ? (summary.bid_depth - summary.ask_depth) / total_depth : 0.0;
    summary.min_order_size = get_double_optional(book, "min_order_size", 5.0);
    if (summary.min_order_size <= 0.0) {
        summary.min_order_size = 5.0;
    }
    return summary;
}

OrderStatusReport parse_order_status(const nlohmann::json& order) {
    OrderStatusReport report;
    const auto status = get_string_optional(order, "status");
    report.status = status.empty() ? "UNKNOWN" : to_upper_copy(status);
    report.size_matched = first_double(order, {"size_matched", "matched_size", "filled_size"}, 0.0);
    report.original_size = first_double(order, {"original_size", "size"}, 0.0);
    report.avg_fill_price = first_positive(order, {"avg_fill_price", "avg_price", "average_price", "fill_price", "price"});
    report.fees_paid = first_double(order, {"fees_paid", "fees", "fee"}, 0.0);
    report.is_filled = report.status == "MATCHED" ||
                       (report.original_size > 0.0 && report.size_matched >= report.original_size);
    return report;
}

ClobClient::ClobClient(Credentials credentials, ClobClientOptions options)
    : ClientBase(std::move(credentials), options.base_url, options.http),
      options_(std::move(options)) {}

template <typename Fn>
auto ClobClient::with_backoff(const char* operation, Fn&& fn) const -> decltype(fn()) {
    auto delay = options_.initial_backoff;
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const HttpError& ex) {
            if (!is_retryable_status(ex.status_code()) || attempt >= options_.max_attempts) {
                throw;
            }
            std::cerr << "[RateLimit] " << operation << " got HTTP " << ex.status_code()
                      << ", retrying in " << delay.count() << " ms ("
                      << attempt << "/" << options_.max_attempts << ")" << std::endl;
            std::this_thread::sleep_for(delay);
            delay = std::min(delay * 2, options_.max_backoff);
        }
    }
}

std::string ClobClient::server_time() const {
    return public_request("GET", "/time").body;
}

std::string ClobClient::order_book(const std::string& token_id) const {
    return with_backoff("order_book", [&] {
        return public_request("GET", "/book", {{"token_id", token_id}}).body;
    });
}

std::string ClobClient::order(const std::string& order_id) const {
    return with_backoff("get_order", [&] {
        return signed_request("GET", "/data/order/" + order_id).body;
    });
}

std::string ClobClient::open_orders() const {
    return with_backoff("get_open_orders", [&] {
        return signed_request("GET", "/data/orders").body;
    });
}

std::string ClobClient::balance_allowance() const {
    return with_backoff("balance_allowance", [&] {
        return signed_request("GET", "/balance-allowance", {{"asset_type", "COLLATERAL"}}).body;
    });
}

std::optional<OrderError> ClobClient::last_order_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_order_error_;
}

PlaceOrderResult ClobClient::record_failure(const OrderRequest& request, double price,
                                            const std::string& code, const std::string& details) {
    OrderError error{code, request.side, request.token_id, price, request.size, details};
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_order_error_ = error;
    }
    PlaceOrderResult result;
    result.error = std::move(error);
    return result;
}

PlaceOrderResult ClobClient::submit_order(const OrderRequest& request, double price) {
    nlohmann::json payload;
    payload["tokenID"] = request.token_id;
    payload["price"] = format_decimal(price, 2);
    payload["size"] = format_decimal(request.size, 2);
    payload["side"] = to_string(request.side);
    payload["orderType"] = request.order_type;
    payload["postOnly"] = request.post_only;

    const auto body = payload.dump();
    const auto response = with_backoff("place_order", [&] {
        return signed_request_to(options_.order_gateway_url, "POST", "/order", body);
    });

    const auto json = nlohmann::json::parse(response.body);
    if (!get_bool_optional(json, "success", true)) {
        const auto message = get_string_optional(json, "errorMsg");
        // Surfaced as an exception so the cross-retry path sees it like an HTTP refusal.
        throw HttpError(message.empty() ? "order rejected" : message, response.status_code, response.body);
    }

    PlaceOrderResult result;
    result.accepted = true;
    result.price = price;
    const auto order_id = extract_order_id(json);
    if (!order_id.empty()) {
        result.order_id = order_id;
    }
    return result;
}

PlaceOrderResult ClobClient::place_limit_order(const OrderRequest& request) {
    if (options_.order_gateway_url.empty()) {
        return record_failure(request, request.price, "api_error", "order gateway not configured");
    }

    try {
        return submit_order(request, request.price);
    } catch (const HttpError& ex) {
        const std::string message = ex.body().empty() ? ex.what() : ex.body();
        if (!(request.post_only && is_post_only_cross_message(message))) {
            std::cerr << "[Clob] Order rejected: " << to_string(request.side) << " "
                      << request.size << " @ " << request.price << " -> " << message << std::endl;
            return record_failure(request, request.price, classify_order_error(message), message);
        }

        std::string last_message = message;
        double last_price = request.price;
        for (const double retry_price : post_only_retry_prices(request.price, request.side,
                                                               options_.post_only_retry_steps)) {
            last_price = retry_price;
            try {
                auto result = submit_order(request, retry_price);
                std::cout << "[Clob] Post-only retry accepted at " << retry_price
                          << " (was " << request.price << ")" << std::endl;
                return result;
            } catch (const HttpError& retry_ex) {
                last_message = retry_ex.body().empty() ? retry_ex.what() : retry_ex.body();
                if (!is_post_only_cross_message(last_message)) {
                    std::cerr << "[Clob] Post-only retry failed with non-cross error: "
                              << last_message << std::endl;
                    return record_failure(request, retry_price, classify_order_error(last_message), last_message);
                }
            }
        }
        return record_failure(request, last_price, "post_only_cross", last_message);
    } catch (const std::exception& ex) {
        std::cerr << "[Clob] Order submission error: " << ex.what() << std::endl;
        return record_failure(request, request.price, "exception", ex.what());
    }
}

bool ClobClient::cancel_order(const std::string& order_id) {
    try {
        const nlohmann::json payload = {{"orderID", order_id}};
        const auto response = with_backoff("cancel_order", [&] {
            return signed_request("DELETE", "/order", {}, payload.dump());
        });
        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_object() && json.contains("not_canceled") && json["not_canceled"].is_object() &&
            json["not_canceled"].contains(order_id)) {
            std::cerr << "[Clob] Cancel refused for " << order_id << ": "
                      << json["not_canceled"][order_id].dump() << std::endl;
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "[Clob] Failed to cancel order " << order_id << ": " << ex.what() << std::endl;
        return false;
    }
}

OrderStatusReport ClobClient::is_order_filled(const std::string& order_id) {
    try {
        const auto json = nlohmann::json::parse(order(order_id));
        if (!json.is_object() || json.empty()) {
            return OrderStatusReport{};
        }
        return parse_order_status(json);
    } catch (const std::exception& ex) {
        std::cerr << "[Clob] Failed to check order " << order_id << ": " << ex.what() << std::endl;
        OrderStatusReport report;
        report.status = "ERROR";
        return report;
    }
}

std::optional<BookSummary> ClobClient::get_book_summary(const std::string& token_id) {
    try {
        const auto json = nlohmann::json::parse(order_book(token_id));
        if (!json.is_object()) {
            return std::nullopt;
        }
        return parse_book_summary(json);
    } catch (const std::exception& ex) {
        std::cerr << "[Clob] Failed to get book summary for " << token_id << ": " << ex.what() << std::endl;
        return std::nullopt;
    }
}

bool ClobClient::settle(const char* path, const std::string& condition_id, double amount) {
    if (options_.order_gateway_url.empty()) {
        std::cerr << "[Clob] Settlement unavailable: order gateway not configured" << std::endl;
        return false;
    }
    try {
        nlohmann::json payload;
        payload["conditionId"] = condition_id;
        payload["amount"] = format_decimal(amount, 6);
        const auto response = with_backoff(path, [&] {
            return signed_request_to(options_.order_gateway_url, "POST", path, payload.dump());
        });
        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        const bool ok = get_bool_optional(json, "success", false);
        if (!ok) {
            std::cerr << "[Clob] " << path << " failed for " << condition_id << ": " << response.body << std::endl;
        }
        return ok;
    } catch (const std::exception& ex) {
        std::cerr << "[Clob] " << path << " error for " << condition_id << ": " << ex.what() << std::endl;
        return false;
    }
}

bool ClobClient::merge_positions(const std::string& condition_id, double amount) {
    return settle("/merge", condition_id, amount);
}

bool ClobClient::split_position(const std::string& condition_id, double amount) {
    return settle("/split", condition_id, amount);
}

std::optional<double> ClobClient::get_collateral_balance() {
    try {
        const auto json = nlohmann::json::parse(balance_allowance());
        if (!json.contains("balance")) {
            return std::nullopt;
        }
        return parse_double_optional(json["balance"]) / kCollateralScale;
    } catch (const std::exception& ex) {
        std::cerr << "[Clob] Failed to fetch collateral balance: " << ex.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<OpenOrder> ClobClient::get_open_orders() {
    std::vector<OpenOrder> orders;
    try {
        const auto json = nlohmann::json::parse(open_orders());
        const auto& list = json.is_object() && json.contains("data") ? json["data"] : json;
        if (!list.is_array()) {
            return orders;
        }
        for (const auto& entry : list) {
            OpenOrder order;
            order.id = get_string_optional(entry, "id");
            order.token_id = get_string_optional(entry, "asset_id");
            order.side = to_upper_copy(get_string_optional(entry, "side")) == "SELL" ? Side::Sell : Side::Buy;
            order.price = get_double_optional(entry, "price");
            order.size = first_double(entry, {"original_size", "size"}, 0.0);
            order.size_matched = get_double_optional(entry, "size_matched");
            if (!order.id.empty()) {
                orders.push_back(std::move(order));
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "[Clob] Failed to get open orders: " << ex.what() << std::endl;
    }
    return orders;
}

} // namespace clob
