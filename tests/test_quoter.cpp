#include "fake_venue.hpp"
#include "mm/quoter.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;
using mm::OrderState;

namespace {

mm::QuoteRequest request_for(double bid, double ask, double size) {
    mm::QuoteRequest request;
    request.bid_price = bid;
    request.ask_price = ask;
    request.bid_size = size;
    request.ask_size = size;
    return request;
}

} // namespace

TEST_CASE("placing a two-sided quote rests both orders post-only") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};

    const auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    CHECK(pair->bid_state == OrderState::Live);
    CHECK(pair->ask_state == OrderState::Live);
    REQUIRE(pair->bid_order_id.has_value());
    REQUIRE(pair->ask_order_id.has_value());
    CHECK_FALSE(quoter.last_quote_failure().has_value());

    REQUIRE(venue.requests.size() == 2);
    CHECK(venue.requests[0].side == clob::Side::Buy);
    CHECK(venue.requests[0].post_only);
    CHECK(venue.requests[1].side == clob::Side::Sell);
    CHECK(venue.requests[1].price == Approx(0.55));
}

TEST_CASE("a one-sided quote leaves the other side cancelled") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};

    const auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0, true, false);
    REQUIRE(pair.has_value());
    CHECK(pair->bid_state == OrderState::Live);
    CHECK(pair->ask_state == OrderState::Cancelled);
    CHECK_FALSE(pair->ask_order_id.has_value());
    CHECK(venue.place_calls == 1);
}

TEST_CASE("a fully rejected quote records why") {
    mm::test::FakeVenue venue;
    venue.reject_bid_code = "post_only_cross";
    venue.reject_ask_code = "insufficient_balance";
    mm::Quoter quoter{venue};

    const auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    CHECK_FALSE(pair.has_value());
    const auto& failure = quoter.last_quote_failure();
    REQUIRE(failure.has_value());
    REQUIRE(failure->bid_error.has_value());
    REQUIRE(failure->ask_error.has_value());
    CHECK(failure->bid_error->code == "post_only_cross");
    CHECK(failure->ask_error->code == "insufficient_balance");
    CHECK(failure->market_id == "m1");
}

TEST_CASE("orders accepted without an id do not count as a placed quote") {
    mm::test::FakeVenue venue;
    venue.accept_without_id = true;
    mm::Quoter quoter{venue};

    const auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    CHECK_FALSE(pair.has_value());
}

TEST_CASE("cancel skips terminal sides and reports venue refusals") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());

    venue.fill(*pair->bid_order_id, 10.0);
    quoter.reconcile_quote(*pair);
    REQUIRE(pair->bid_state == OrderState::Filled);

    venue.refuse_cancel.insert(*pair->ask_order_id);
    CHECK_FALSE(quoter.cancel_quote_pair(*pair));
    CHECK(pair->ask_state == OrderState::Live);

    venue.refuse_cancel.clear();
    CHECK(quoter.cancel_quote_pair(*pair));
    CHECK(pair->ask_state == OrderState::Cancelled);
    CHECK(venue.cancels.size() == 2);
}

TEST_CASE("reconcile reports only newly matched quantity") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());

    venue.fill(*pair->bid_order_id, 4.0, 0.04);
    auto fills = quoter.reconcile_quote(*pair);
    REQUIRE(fills.size() == 1);
    CHECK(fills[0].side == clob::Side::Buy);
    CHECK(fills[0].size == Approx(4.0));
    CHECK(fills[0].price == Approx(0.45));
    CHECK(fills[0].fees == Approx(0.04));
    CHECK(pair->bid_state == OrderState::Partial);

    CHECK(quoter.reconcile_quote(*pair).empty());

    venue.fill(*pair->bid_order_id, 10.0, 0.10);
    fills = quoter.reconcile_quote(*pair);
    REQUIRE(fills.size() == 1);
    CHECK(fills[0].size == Approx(6.0));
    CHECK(fills[0].fees == Approx(0.06));
    CHECK(fills[0].cumulative_matched == Approx(10.0));
    CHECK(pair->bid_state == OrderState::Filled);
    CHECK(pair->ask_state == OrderState::Live);
}

TEST_CASE("late fills on cancelled sides are only seen when asked for") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    REQUIRE(quoter.cancel_quote_pair(*pair));

    venue.fill(*pair->ask_order_id, 10.0);
    CHECK(quoter.reconcile_quote(*pair).empty());

    const auto fills = quoter.reconcile_quote(*pair, true);
    REQUIRE(fills.size() == 1);
    CHECK(fills[0].side == clob::Side::Sell);
    CHECK(fills[0].size == Approx(10.0));
    CHECK(pair->ask_state == OrderState::Filled);
}

TEST_CASE("venue-side cancellation is picked up on reconcile") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());

    venue.set_status(*pair->bid_order_id, "CANCELED");
    quoter.reconcile_quote(*pair);
    CHECK(pair->bid_state == OrderState::Cancelled);
    CHECK(pair->ask_state == OrderState::Live);
}

TEST_CASE("requote cancels the old pair and keeps market identity") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    pair->condition_id = "cond";
    pair->no_token_id = "no";
    pair->level = 1;

    const auto next = quoter.requote(*pair, request_for(0.46, 0.56, 8.0));
    REQUIRE(next.has_value());
    CHECK(pair->bid_state == OrderState::Cancelled);
    CHECK(pair->ask_state == OrderState::Cancelled);
    CHECK(next->bid_price == Approx(0.46));
    CHECK(next->condition_id == "cond");
    CHECK(next->no_token_id == "no");
    CHECK(next->level == 1);
    CHECK(venue.resting(clob::Side::Buy).size() == 1);
}

TEST_CASE("requote preserving hanging orders keeps partial and unmoved sides") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    const auto bid_id = *pair->bid_order_id;
    const auto ask_id = *pair->ask_order_id;

    venue.fill(bid_id, 3.0);
    quoter.reconcile_quote(*pair);
    REQUIRE(pair->bid_state == OrderState::Partial);

    // Bid moves a full cent but is partially filled; ask moves less than the threshold.
    const auto next = quoter.requote_preserving_hanging(*pair, request_for(0.44, 0.552, 10.0));
    REQUIRE(next.has_value());
    REQUIRE(next->bid_order_id.has_value());
    REQUIRE(next->ask_order_id.has_value());
    CHECK(*next->bid_order_id == bid_id);
    CHECK(next->bid_state == OrderState::Partial);
    CHECK(next->bid_reported == Approx(3.0));
    CHECK(next->bid_price == Approx(0.45));
    CHECK(*next->ask_order_id == ask_id);
    CHECK_FALSE(pair->bid_order_id.has_value());
    CHECK_FALSE(pair->ask_order_id.has_value());
    CHECK(venue.cancels.empty());
    CHECK(venue.place_calls == 2);
}

TEST_CASE("requote preserving hanging orders replaces moved live sides") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    const auto ask_id = *pair->ask_order_id;

    const auto next = quoter.requote_preserving_hanging(*pair, request_for(0.40, 0.60, 10.0));
    REQUIRE(next.has_value());
    CHECK(*next->ask_order_id != ask_id);
    CHECK(next->ask_price == Approx(0.60));
    CHECK(venue.cancels.size() == 2);
    CHECK(pair->ask_state == OrderState::Cancelled);
}

TEST_CASE("a side whose cancel fails is carried instead of duplicated") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    const auto bid_id = *pair->bid_order_id;
    venue.refuse_cancel.insert(bid_id);

    const auto next = quoter.requote_preserving_hanging(*pair, request_for(0.40, 0.60, 10.0));
    REQUIRE(next.has_value());
    CHECK(*next->bid_order_id == bid_id);
    CHECK(venue.resting(clob::Side::Buy).size() == 1);
}

TEST_CASE("plain requote carries a side whose cancel is refused") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    const auto bid_id = *pair->bid_order_id;
    const auto ask_id = *pair->ask_order_id;
    venue.refuse_cancel.insert(bid_id);

    const auto next = quoter.requote(*pair, request_for(0.40, 0.60, 10.0));
    REQUIRE(next.has_value());
    REQUIRE(next->bid_order_id.has_value());
    CHECK(*next->bid_order_id == bid_id);
    CHECK(next->bid_state == OrderState::Live);
    CHECK(next->bid_price == Approx(0.45));
    CHECK_FALSE(pair->bid_order_id.has_value());

    REQUIRE(next->ask_order_id.has_value());
    CHECK(*next->ask_order_id != ask_id);
    CHECK(next->ask_price == Approx(0.60));
    CHECK(venue.resting(clob::Side::Buy).size() == 1);
    CHECK(venue.resting(clob::Side::Sell).size() == 1);
}

TEST_CASE("plain requote replaces unmoved and partially filled sides") {
    mm::test::FakeVenue venue;
    mm::Quoter quoter{venue};
    auto pair = quoter.place_quote_pair("yes", "m1", 0.45, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    const auto bid_id = *pair->bid_order_id;
    const auto ask_id = *pair->ask_order_id;
    venue.fill(bid_id, 3.0);
    quoter.reconcile_quote(*pair);

    const auto next = quoter.requote(*pair, request_for(0.45, 0.55, 10.0));
    REQUIRE(next.has_value());
    CHECK(*next->bid_order_id != bid_id);
    CHECK(*next->ask_order_id != ask_id);
    CHECK(pair->bid_state == OrderState::Cancelled);
    CHECK(venue.cancels.size() == 2);
    CHECK(venue.resting(clob::Side::Buy).size() == 1);
}

TEST_CASE("quotes record the price the venue accepted") {
    mm::test::FakeVenue venue;
    venue.reprice_to[0.50] = 0.49;
    mm::Quoter quoter{venue};

    auto pair = quoter.place_quote_pair("yes", "m1", 0.50, 0.55, 10.0, 10.0);
    REQUIRE(pair.has_value());
    CHECK(pair->bid_price == Approx(0.49));
    CHECK(pair->ask_price == Approx(0.55));

    // Requoting to the accepted level counts as unmoved.
    const auto placed = venue.place_calls;
    const auto next = quoter.requote_preserving_hanging(*pair, request_for(0.49, 0.55, 10.0));
    REQUIRE(next.has_value());
    CHECK(venue.place_calls == placed);
    CHECK(next->bid_price == Approx(0.49));

    venue.reprice_to[0.40] = 0.39;
    auto moved = *next;
    const auto replaced = quoter.requote(moved, request_for(0.40, 0.55, 10.0));
    REQUIRE(replaced.has_value());
    CHECK(replaced->bid_price == Approx(0.39));
}
