#include "mm/arbitrage.hpp"

#include "clob/util.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <utility>

namespace mm {

namespace {

constexpr double kSplitSellFillRatio = 0.9;

double round_tenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

std::string cents(double value) {
    return clob::format_decimal(value, 2);
}

} // namespace

const char* to_string(ArbType type) {
    return type == ArbType::BuyMerge ? "buy_merge" : "split_sell";
}

double ask_depth_shares(const clob::BookSummary& book) {
    if (book.best_ask > 0.0 && book.ask_depth > 0.0) {
        return book.ask_depth / book.best_ask;
    }
    return 0.0;
}

double bid_depth_shares(const clob::BookSummary& book) {
    if (book.best_bid > 0.0 && book.bid_depth > 0.0) {
        return book.bid_depth / book.best_bid;
    }
    return 0.0;
}

std::optional<ArbOpportunity> scan_for_arbitrage(const clob::BookSummary& yes_book,
                                                 const clob::BookSummary& no_book,
                                                 const MarketInfo& market,
                                                 const ArbitrageConfig& config) {
    if (yes_book.best_ask <= 0.0 || no_book.best_ask <= 0.0 || yes_book.best_bid <= 0.0
        || no_book.best_bid <= 0.0) {
        return std::nullopt;
    }

    ArbOpportunity opp;
    opp.market_id = market.market_id;
    opp.condition_id = market.condition_id;
    opp.yes_token_id = market.token_id;
    opp.no_token_id = market.no_token_id;

    const double buy_cost = yes_book.best_ask + no_book.best_ask;
    if (buy_cost < 1.0) {
        const double gross = 1.0 - buy_cost;
        const double max_size = std::min(ask_depth_shares(yes_book), ask_depth_shares(no_book));
        if (max_size < config.min_size) {
            return std::nullopt;
        }
        const double net = gross * max_size - config.gas_cost_usd;
        const double net_pct = net / (buy_cost * max_size) * 100.0;
        if (net_pct >= config.min_profit_pct) {
            opp.type = ArbType::BuyMerge;
            opp.yes_price = yes_book.best_ask;
            opp.no_price = no_book.best_ask;
            opp.gross_profit_pct = gross / buy_cost * 100.0;
            opp.net_profit_pct = net_pct;
            opp.max_size = max_size;
            return opp;
        }
    }

    const double sell_revenue = yes_book.best_bid + no_book.best_bid;
    if (sell_revenue > 1.0) {
        const double gross = sell_revenue - 1.0;
        const double max_size = std::min(bid_depth_shares(yes_book), bid_depth_shares(no_book));
        if (max_size < config.min_size) {
            return std::nullopt;
        }
        // One pair costs one unit of collateral to split.
        const double net_pct = (gross * max_size - config.gas_cost_usd) / max_size * 100.0;
        if (net_pct >= config.min_profit_pct) {
            opp.type = ArbType::SplitSell;
            opp.yes_price = yes_book.best_bid;
            opp.no_price = no_book.best_bid;
            opp.gross_profit_pct = gross * 100.0;
            opp.net_profit_pct = net_pct;
            opp.max_size = max_size;
            return opp;
        }
    }
    return std::nullopt;
}

ArbitrageExecutor::ArbitrageExecutor(clob::VenueApi& venue, InventoryLedger& inventory, ArbitrageConfig config,
                                     ClockFn clock)
    : venue_(venue),
      inventory_(inventory),
      config_(config),
      clock_(std::move(clock)) {}

ArbResult ArbitrageExecutor::execute(const ArbOpportunity& opp) {
    const double size = round_tenth(std::min(opp.max_size, config_.max_size_usd));
    ArbResult result = opp.type == ArbType::BuyMerge ? buy_merge(opp, size) : split_sell(opp, size);
    result.type = opp.type;
    result.size = size;
    return result;
}

std::optional<std::string> ArbitrageExecutor::take(const std::string& token_id, clob::Side side, double price,
                                                   double size) {
    clob::OrderRequest request;
    request.token_id = token_id;
    request.price = price;
    request.size = size;
    request.side = side;
    request.post_only = false;
    const auto placed = venue_.place_limit_order(request);
    if (!placed.accepted) {
        if (placed.error) {
            std::cerr << "[Arb] " << clob::to_string(side) << " " << token_id << " refused: " << placed.error->code
                      << std::endl;
        }
        return std::nullopt;
    }
    if (!placed.order_id) {
        std::cerr << "[Arb] " << clob::to_string(side) << " " << token_id << " accepted without an order id"
                  << std::endl;
    }
    return placed.order_id ? placed.order_id : std::optional<std::string>(std::string());
}

double ArbitrageExecutor::matched(const std::optional<std::string>& order_id, bool& filled) {
    filled = false;
    if (!order_id || order_id->empty()) {
        return 0.0;
    }
    const auto report = venue_.is_order_filled(*order_id);
    filled = report.is_filled;
    return report.size_matched;
}

void ArbitrageExecutor::cancel(const std::string& order_id) {
    if (!venue_.cancel_order(order_id)) {
        std::cerr << "[Arb] Cancel refused for " << order_id << std::endl;
    }
}

void ArbitrageExecutor::settle() const {
    if (config_.settle_wait.count() > 0) {
        std::this_thread::sleep_for(config_.settle_wait);
    }
}

ArbResult ArbitrageExecutor::buy_merge(const ArbOpportunity& opp, double shares) {
    ArbResult result;
    std::cout << "[Arb] buy-merge " << opp.market_id << ": YES@" << cents(opp.yes_price) << " + NO@"
              << cents(opp.no_price) << " x " << clob::format_decimal(shares, 1) << " (net "
              << clob::format_decimal(opp.net_profit_pct, 2) << "%)" << std::endl;

    const auto yes_order = take(opp.yes_token_id, clob::Side::Buy, opp.yes_price, shares);
    if (!yes_order) {
        result.error = "yes_buy_failed";
        return result;
    }

    bool yes_done = false;
    bool no_done = false;
    const auto no_order = take(opp.no_token_id, clob::Side::Buy, opp.no_price, shares);
    if (!no_order) {
        if (!yes_order->empty()) {
            cancel(*yes_order);
        }
        // The YES leg may have traded before the cancel landed.
        result.yes_filled = matched(yes_order, yes_done);
        if (result.yes_filled > 0.0) {
            inventory_.process_fill(opp.market_id, opp.yes_token_id, clob::Side::Buy, opp.yes_price,
                                    result.yes_filled, Leg::Yes, clock_());
        }
        std::cerr << "[Arb] NO buy failed on " << opp.market_id << ", cancelled YES order" << std::endl;
        result.error = "no_buy_failed";
        return result;
    }

    settle();
    result.yes_filled = matched(yes_order, yes_done);
    result.no_filled = matched(no_order, no_done);
    if (!yes_done && !yes_order->empty()) {
        cancel(*yes_order);
    }
    if (!no_done && !no_order->empty()) {
        cancel(*no_order);
    }

    const auto now = clock_();
    if (result.yes_filled > 0.0) {
        inventory_.process_fill(opp.market_id, opp.yes_token_id, clob::Side::Buy, opp.yes_price, result.yes_filled,
                                Leg::Yes, now);
    }
    if (result.no_filled > 0.0) {
        inventory_.process_fill(opp.market_id, opp.no_token_id, clob::Side::Buy, opp.no_price, result.no_filled,
                                Leg::No, now);
    }

    const double pairs = std::min(result.yes_filled, result.no_filled);
    if (pairs < config_.min_size) {
        std::cerr << "[Arb] Insufficient fills for merge on " << opp.market_id << " (YES="
                  << clob::format_decimal(result.yes_filled, 1) << ", NO=" << clob::format_decimal(result.no_filled, 1)
                  << ")" << std::endl;
        result.error = "insufficient_fills";
        return result;
    }

    if (!venue_.merge_positions(opp.condition_id, pairs)) {
        std::cerr << "[Arb] Merge failed on " << opp.market_id << ", holding " << clob::format_decimal(pairs, 1)
                  << " pairs" << std::endl;
        result.error = "merge_failed";
        return result;
    }
    if (!inventory_.process_merge(opp.market_id, pairs, now)) {
        std::cerr << "[Arb] Ledger could not merge " << clob::format_decimal(pairs, 1) << " pairs on "
                  << opp.market_id << std::endl;
    }

    result.success = true;
    result.merged = pairs;
    result.profit_usd = (1.0 - opp.yes_price - opp.no_price) * pairs;
    std::cout << "[Arb] buy-merge done: merged " << clob::format_decimal(pairs, 1) << " pairs, profit $"
              << clob::format_decimal(result.profit_usd, 4) << std::endl;
    return result;
}

ArbResult ArbitrageExecutor::split_sell(const ArbOpportunity& opp, double amount) {
    ArbResult result;
    std::cout << "[Arb] split-sell " << opp.market_id << ": $" << clob::format_decimal(amount, 2) << " then YES@"
              << cents(opp.yes_price) << " + NO@" << cents(opp.no_price) << " (net "
              << clob::format_decimal(opp.net_profit_pct, 2) << "%)" << std::endl;

    if (!venue_.split_position(opp.condition_id, amount)) {
        std::cerr << "[Arb] Split failed on " << opp.market_id << std::endl;
        result.error = "split_failed";
        return result;
    }
    inventory_.process_split(opp.market_id, amount, opp.yes_token_id, opp.no_token_id, clock_());

    const auto yes_order = take(opp.yes_token_id, clob::Side::Sell, opp.yes_price, amount);
    const auto no_order = take(opp.no_token_id, clob::Side::Sell, opp.no_price, amount);

    settle();
    bool yes_done = false;
    bool no_done = false;
    result.yes_filled = matched(yes_order, yes_done);
    result.no_filled = matched(no_order, no_done);
    if (yes_order && !yes_done && !yes_order->empty()) {
        cancel(*yes_order);
    }
    if (no_order && !no_done && !no_order->empty()) {
        cancel(*no_order);
    }

    const auto now = clock_();
    if (result.yes_filled > 0.0) {
        inventory_.process_fill(opp.market_id, opp.yes_token_id, clob::Side::Sell, opp.yes_price, result.yes_filled,
                                Leg::Yes, now);
    }
    if (result.no_filled > 0.0) {
        inventory_.process_fill(opp.market_id, opp.no_token_id, clob::Side::Sell, opp.no_price, result.no_filled,
                                Leg::No, now);
    }

    result.profit_usd = result.yes_filled * opp.yes_price + result.no_filled * opp.no_price - amount;
    const double fill_floor = amount * kSplitSellFillRatio;
    if (result.yes_filled >= fill_floor && result.no_filled >= fill_floor) {
        result.success = true;
        std::cout << "[Arb] split-sell done: sold " << clob::format_decimal(result.yes_filled, 1) << " YES + "
                  << clob::format_decimal(result.no_filled, 1) << " NO, profit $"
                  << clob::format_decimal(result.profit_usd, 4) << std::endl;
    } else {
        std::cerr << "[Arb] split-sell partial on " << opp.market_id << ": YES "
                  << clob::format_decimal(result.yes_filled, 1) << "/" << clob::format_decimal(amount, 1) << ", NO "
                  << clob::format_decimal(result.no_filled, 1) << "/" << clob::format_decimal(amount, 1) << std::endl;
        result.error = "partial_fills";
    }
    return result;
}

} // namespace mm
