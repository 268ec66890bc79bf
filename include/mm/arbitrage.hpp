#pragma once

#include "clob/venue.hpp"
#include "mm/advisory.hpp"
#include "mm/clock.hpp"
#include "mm/inventory.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mm {

// Buy-merge: YES ask + NO ask < 1, buy both legs and merge the pairs for
// collateral. Split-sell: YES bid + NO bid > 1, split collateral and sell
// both legs.
enum class ArbType { BuyMerge, SplitSell };

const char* to_string(ArbType type);

struct ArbOpportunity {
    std::string market_id;
    std::string condition_id;
    std::string yes_token_id;
    std::string no_token_id;
    ArbType type = ArbType::BuyMerge;
    double yes_price = 0.0;   // ask for buy-merge, bid for split-sell
    double no_price = 0.0;
    double gross_profit_pct = 0.0;
    double net_profit_pct = 0.0;
    double max_size = 0.0;    // shares both books can absorb
};

struct ArbitrageConfig {
    double min_profit_pct = 0.5;
    double gas_cost_usd = 0.005;
    double max_size_usd = 50.0;
    double min_size = 5.0;
    // Pause between placing the taking orders and polling them.
    std::chrono::milliseconds settle_wait{2000};
};

struct ArbResult {
    ArbType type = ArbType::BuyMerge;
    bool success = false;
    std::string error;        // empty on success
    double size = 0.0;
    double yes_filled = 0.0;
    double no_filled = 0.0;
    double merged = 0.0;
    double profit_usd = 0.0;
};

// Depth over the five best levels is in collateral; dividing by the touch
// price approximates shares.
double ask_depth_shares(const clob::BookSummary& book);
double bid_depth_shares(const clob::BookSummary& book);

// Buy-merge is checked first. Gas is charged once against the whole depth-limited size.
std::optional<ArbOpportunity> scan_for_arbitrage(const clob::BookSummary& yes_book,
                                                 const clob::BookSummary& no_book,
                                                 const MarketInfo& market,
                                                 const ArbitrageConfig& config);

// Executes an opportunity against the venue. Whatever fills is booked into the
// ledger before a failed attempt is abandoned.
class ArbitrageExecutor {
public:
    ArbitrageExecutor(clob::VenueApi& venue, InventoryLedger& inventory, ArbitrageConfig config = {},
                      ClockFn clock = system_now);

    ArbResult execute(const ArbOpportunity& opp);

private:
    ArbResult buy_merge(const ArbOpportunity& opp, double shares);
    ArbResult split_sell(const ArbOpportunity& opp, double amount);
    std::optional<std::string> take(const std::string& token_id, clob::Side side, double price, double size);
    double matched(const std::optional<std::string>& order_id, bool& filled);
    void cancel(const std::string& order_id);
    void settle() const;

    clob::VenueApi& venue_;
    InventoryLedger& inventory_;
    ArbitrageConfig config_;
    ClockFn clock_;
};

} // namespace mm
