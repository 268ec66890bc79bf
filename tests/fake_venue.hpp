#pragma once

#include "clob/venue.hpp"
#include "mm/clock.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mm::test {

// In-memory venue: orders rest until the test fills or cancels them.
class FakeVenue : public clob::VenueApi {
public:
    struct Order {
        std::string id;
        clob::OrderRequest request;
        std::string status = "LIVE";
        double matched = 0.0;
        double fees = 0.0;
        std::optional<double> avg_price;
    };

    clob::PlaceOrderResult place_limit_order(const clob::OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++place_calls;
        requests.push_back(request);

        auto code = request.side == clob::Side::Buy ? reject_bid_code : reject_ask_code;
        if (reject_tokens.count(request.token_id) > 0) {
            code = "api_error";
        }
        if (!code.empty()) {
            clob::PlaceOrderResult result;
            result.error = clob::OrderError{code, request.side, request.token_id, request.price, request.size,
                                            "refused by fake venue"};
            return result;
        }

        clob::PlaceOrderResult result;
        result.accepted = true;
        auto resting = request;
        if (const auto it = reprice_to.find(request.price); it != reprice_to.end()) {
            resting.price = it->second;
        }
        result.price = resting.price;
        if (accept_without_id) {
            return result;
        }
        const auto id = "ord-" + std::to_string(next_id_++);
        Order order{id, resting};
        if (const auto it = fill_on_place.find(request.token_id); it != fill_on_place.end()) {
            order.matched = std::min(it->second, request.size);
            if (order.matched >= request.size) {
                order.status = "MATCHED";
            }
        }
        orders[id] = order;
        result.order_id = id;
        return result;
    }

    bool cancel_order(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancels.push_back(order_id);
        if (refuse_cancel.count(order_id) > 0) {
            return false;
        }
        const auto it = orders.find(order_id);
        if (it != orders.end() && it->second.status == "LIVE") {
            it->second.status = "CANCELED";
        }
        return true;
    }

    clob::OrderStatusReport is_order_filled(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++status_calls;
        clob::OrderStatusReport report;
        const auto it = orders.find(order_id);
        if (it == orders.end()) {
            return report;
        }
        const auto& order = it->second;
        report.status = order.status;
        report.size_matched = order.matched;
        report.original_size = order.request.size;
        report.avg_fill_price = order.avg_price;
        report.fees_paid = order.fees;
        report.is_filled = order.status == "MATCHED";
        return report;
    }

    std::optional<clob::BookSummary> get_book_summary(const std::string& token_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = books.find(token_id);
        if (it == books.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool merge_positions(const std::string& condition_id, double amount) override {
        std::lock_guard<std::mutex> lock(mutex_);
        merges.emplace_back(condition_id, amount);
        return merge_ok;
    }

    bool split_position(const std::string& condition_id, double amount) override {
        std::lock_guard<std::mutex> lock(mutex_);
        splits.emplace_back(condition_id, amount);
        return split_ok;
    }

    std::optional<double> get_collateral_balance() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return balance;
    }

    std::vector<clob::OpenOrder> get_open_orders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<clob::OpenOrder> out;
        for (const auto& kv : orders) {
            const auto& order = kv.second;
            if (order.status != "LIVE") {
                continue;
            }
            out.push_back(clob::OpenOrder{order.id, order.request.token_id, order.request.side,
                                          order.request.price, order.request.size, order.matched});
        }
        for (const auto& extra : foreign_orders) {
            out.push_back(extra);
        }
        return out;
    }

    // Symmetric depth, so the weighted mid equals the plain mid.
    void set_book(const std::string& token_id, double best_bid, double best_ask, double min_order_size = 5.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        clob::BookSummary book;
        book.best_bid = best_bid;
        book.best_ask = best_ask;
        book.spread = best_ask - best_bid;
        book.mid = (best_bid + best_ask) / 2.0;
        book.bid_depth = 100.0;
        book.ask_depth = 100.0;
        book.min_order_size = min_order_size;
        books[token_id] = book;
    }

    // Marks `matched` shares of the order as traded; reaching its size completes it.
    void fill(const std::string& order_id, double matched, double fees = 0.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& order = orders.at(order_id);
        order.matched = matched;
        order.fees = fees;
        if (matched >= order.request.size) {
            order.status = "MATCHED";
        }
    }

    void set_status(const std::string& order_id, const std::string& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        orders.at(order_id).status = status;
    }

    std::vector<Order> resting(clob::Side side) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Order> out;
        for (const auto& kv : orders) {
            if (kv.second.status == "LIVE" && kv.second.request.side == side) {
                out.push_back(kv.second);
            }
        }
        return out;
    }

    std::map<std::string, Order> orders;
    std::map<std::string, clob::BookSummary> books;
    std::vector<clob::OrderRequest> requests;
    std::vector<std::string> cancels;
    std::vector<std::pair<std::string, double>> splits;
    std::vector<std::pair<std::string, double>> merges;
    std::vector<clob::OpenOrder> foreign_orders;
    std::set<std::string> refuse_cancel;
    // Orders on these tokens are refused outright.
    std::set<std::string> reject_tokens;
    // Token -> quantity matched the moment an order on it is placed.
    std::map<std::string, double> fill_on_place;
    // Requested price -> price the order is accepted at, as after a post-only retry.
    std::map<double, double> reprice_to;
    std::optional<double> balance = 1000.0;
    std::string reject_bid_code;
    std::string reject_ask_code;
    bool accept_without_id = false;
    bool split_ok = true;
    bool merge_ok = true;
    int place_calls = 0;
    int status_calls = 0;

private:
    mutable std::mutex mutex_;
    int next_id_ = 1;
};

// Clock the test advances by hand.
class ManualClock {
public:
    explicit ManualClock(TimePoint start = from_epoch_ms(1700000000000LL)) : now_(start) {}

    TimePoint now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(double seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(seconds));
    }

    ClockFn fn() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace mm::test
