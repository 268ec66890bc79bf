#pragma once

#include "clob/client_base.hpp"
#include "clob/venue.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clob {

struct ClobClientOptions {
    std::string base_url = "https://clob.polymarket.com";
    // Relay that signs and submits orders and settlement calls with the wallet
    // key. Trading endpoints are unavailable while this is empty.
    std::string order_gateway_url;
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{8000};
    int post_only_retry_steps = 5;
    HttpOptions http;
};

bool is_retryable_status(long status_code);

bool is_post_only_cross_message(const std::string& message);

// Error code for a refused order given the venue's message.
std::string classify_order_error(const std::string& message);

// Candidate prices stepping away from the book one tick at a time, kept in [0.01, 0.99].
std::vector<double> post_only_retry_prices(double price, Side side, int max_steps);

BookSummary parse_book_summary(const nlohmann::json& book);

OrderStatusReport parse_order_status(const nlohmann::json& order);

class ClobClient : public ClientBase, public VenueApi {
public:
    explicit ClobClient(Credentials credentials, ClobClientOptions options = {});

    std::string server_time() const;
    std::string order_book(const std::string& token_id) const;
    std::string order(const std::string& order_id) const;
    std::string open_orders() const;
    std::string balance_allowance() const;

    PlaceOrderResult place_limit_order(const OrderRequest& request) override;
    bool cancel_order(const std::string& order_id) override;
    OrderStatusReport is_order_filled(const std::string& order_id) override;
    std::optional<BookSummary> get_book_summary(const std::string& token_id) override;
    bool merge_positions(const std::string& condition_id, double amount) override;
    bool split_position(const std::string& condition_id, double amount) override;
    std::optional<double> get_collateral_balance() override;
    std::vector<OpenOrder> get_open_orders() override;

    [[nodiscard]] std::optional<OrderError> last_order_error() const;

private:
    template <typename Fn>
    auto with_backoff(const char* operation, Fn&& fn) const -> decltype(fn());

    PlaceOrderResult submit_order(const OrderRequest& request, double price);
    bool settle(const char* path, const std::string& condition_id, double amount);
    PlaceOrderResult record_failure(const OrderRequest& request, double price,
                                    const std::string& code, const std::string& details);

    ClobClientOptions options_;
    mutable std::mutex error_mutex_;
    std::optional<OrderError> last_order_error_;
};

} // namespace clob
