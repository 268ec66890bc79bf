#pragma once

#include "clob/venue.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace mm {

struct OrderProposal {
    clob::Side side = clob::Side::Buy;
    double price = 0.0;
    double size = 0.0;
    int level = 0;
    bool is_hanging = false;
};

struct QuoteProposal {
    std::string market_id;
    std::string token_id;
    std::vector<OrderProposal> bids;
    std::vector<OrderProposal> asks;
    double mid = 0.0;
    double reservation_price = 0.0;

    [[nodiscard]] bool empty() const { return bids.empty() && asks.empty(); }
};

// How resting asks consume the budget. Collateral-funded asks lock (1 - price)
// per share; inventory-funded asks sell tokens already held.
enum class AskFunding { Collateral, Inventory };

// Level-0 bid and ask. A side with a non-positive size or price is omitted.
QuoteProposal create_base_proposal(const std::string& market_id,
                                   const std::string& token_id,
                                   double bid_price,
                                   double ask_price,
                                   double bid_size,
                                   double ask_size,
                                   double mid,
                                   double reservation_price = 0.0);

// Adds levels 1..levels-1, each spread_mult^level wider and size_mult^level larger.
void apply_multi_level(QuoteProposal& proposal, int levels = 1, double spread_mult = 1.5, double size_mult = 2.0);

// Widens around the mid by 1 + (vol - threshold) / threshold, capped at 2x.
void apply_vol_adjustment(QuoteProposal& proposal, double vol_pts, double threshold = 5.0);

void apply_event_risk(QuoteProposal& proposal, bool guard_warning, double widen_pct = 50.0);

// Greedy fill of the remaining budget, bids first. The first order that does
// not fit is shrunk to a 0.1-share floor if it stays above min_viable_size,
// and everything after it on that side is dropped.
void apply_budget_constraint(QuoteProposal& proposal,
                             double available_capital,
                             double committed = 0.0,
                             double min_viable_size = 5.0,
                             AskFunding ask_funding = AskFunding::Collateral);

// Moves any bid at or through best_ask (ask at or through best_bid) one tick inside.
void apply_post_only_filter(QuoteProposal& proposal, double best_bid, double best_ask);

class ProposalPipeline {
public:
    using Stage = std::function<void(QuoteProposal&)>;

    ProposalPipeline& add(std::string name, Stage stage);

    // Registers the post-only clamp. It always runs after every other stage.
    ProposalPipeline& post_only(double best_bid, double best_ask);

    [[nodiscard]] QuoteProposal run(QuoteProposal proposal) const;
    [[nodiscard]] std::vector<std::string> stage_names() const;

private:
    std::vector<std::pair<std::string, Stage>> stages_;
    bool post_only_ = false;
    double best_bid_ = 0.0;
    double best_ask_ = 0.0;
};

} // namespace mm
