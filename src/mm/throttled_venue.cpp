#include "mm/throttled_venue.hpp"

namespace mm {

ThrottledVenue::ThrottledVenue(clob::VenueApi& inner, ConcurrencyLimiter& limiter)
    : inner_(inner),
      limiter_(limiter) {}

clob::PlaceOrderResult ThrottledVenue::place_limit_order(const clob::OrderRequest& request) {
    const auto permit = limiter_.acquire_permit();
    return inner_.place_limit_order(request);
}

bool ThrottledVenue::cancel_order(const std::string& order_id) {
    const auto permit = limiter_.acquire_permit();
    return inner_.cancel_order(order_id);
}

clob::OrderStatusReport ThrottledVenue::is_order_filled(const std::string& order_id) {
    const auto permit = limiter_.acquire_permit();
    return inner_.is_order_filled(order_id);
}

std::optional<clob::BookSummary> ThrottledVenue::get_book_summary(const std::string& token_id) {
    const auto permit = limiter_.acquire_permit();
    return inner_.get_book_summary(token_id);
}

bool ThrottledVenue::merge_positions(const std::string& condition_id, double amount) {
    const auto permit = limiter_.acquire_permit();
    return inner_.merge_positions(condition_id, amount);
}

bool ThrottledVenue::split_position(const std::string& condition_id, double amount) {
    const auto permit = limiter_.acquire_permit();
    return inner_.split_position(condition_id, amount);
}

std::optional<double> ThrottledVenue::get_collateral_balance() {
    const auto permit = limiter_.acquire_permit();
    return inner_.get_collateral_balance();
}

std::vector<clob::OpenOrder> ThrottledVenue::get_open_orders() {
    const auto permit = limiter_.acquire_permit();
    return inner_.get_open_orders();
}

} // namespace mm
