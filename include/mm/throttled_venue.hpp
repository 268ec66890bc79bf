#pragma once

#include "clob/venue.hpp"
#include "mm/worker_pool.hpp"

namespace mm {

// Holds a limiter permit for the duration of every call into the wrapped venue.
class ThrottledVenue : public clob::VenueApi {
public:
    ThrottledVenue(clob::VenueApi& inner, ConcurrencyLimiter& limiter);

    clob::PlaceOrderResult place_limit_order(const clob::OrderRequest& request) override;
    bool cancel_order(const std::string& order_id) override;
    clob::OrderStatusReport is_order_filled(const std::string& order_id) override;
    std::optional<clob::BookSummary> get_book_summary(const std::string& token_id) override;
    bool merge_positions(const std::string& condition_id, double amount) override;
    bool split_position(const std::string& condition_id, double amount) override;
    std::optional<double> get_collateral_balance() override;
    std::vector<clob::OpenOrder> get_open_orders() override;

private:
    clob::VenueApi& inner_;
    ConcurrencyLimiter& limiter_;
};

} // namespace mm
