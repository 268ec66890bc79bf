#include "mm/proposal.hpp"

#include "mm/pricing_engine.hpp"

#include <algorithm>
#include <cmath>

namespace mm {
namespace {

constexpr double kSizeStep = 0.1;

double round_to(double value, double step) {
    return std::round(value / step) * step;
}

double floor_to(double value, double step) {
    // Quotients a hair below a whole step still count as that step.
    return std::floor(value / step + 1e-9) * step;
}

void widen_spreads(QuoteProposal& proposal, double multiplier) {
    const double mid = proposal.mid;
    for (auto& order : proposal.bids) {
        const double delta = mid - order.price;
        order.price = std::max(kMinPrice, round_to(mid - delta * multiplier, kTickSize));
    }
    for (auto& order : proposal.asks) {
        const double delta = order.price - mid;
        order.price = std::min(kMaxPrice, round_to(mid + delta * multiplier, kTickSize));
    }
}

// Cost per share of an order against the collateral budget.
double unit_cost(const OrderProposal& order, AskFunding ask_funding) {
    if (order.side == clob::Side::Buy) {
        return order.price;
    }
    return ask_funding == AskFunding::Collateral ? 1.0 - order.price : 0.0;
}

std::vector<OrderProposal> fit_side(const std::vector<OrderProposal>& orders,
                                    double remaining,
                                    double& used,
                                    double min_viable_size,
                                    AskFunding ask_funding) {
    std::vector<OrderProposal> kept;
    for (auto order : orders) {
        const double per_share = unit_cost(order, ask_funding);
        const double cost = order.size * per_share;
        if (used + cost > remaining) {
            const double max_size = per_share > 0.0 ? floor_to((remaining - used) / per_share, kSizeStep) : 0.0;
            if (max_size >= min_viable_size) {
                order.size = max_size;
                used += order.size * per_share;
                kept.push_back(order);
            }
            break;
        }
        used += cost;
        kept.push_back(order);
    }
    return kept;
}

} // namespace

QuoteProposal create_base_proposal(const std::string& market_id,
                                   const std::string& token_id,
                                   double bid_price,
                                   double ask_price,
                                   double bid_size,
                                   double ask_size,
                                   double mid,
                                   double reservation_price) {
    QuoteProposal proposal;
    proposal.market_id = market_id;
    proposal.token_id = token_id;
    proposal.mid = mid;
    proposal.reservation_price = reservation_price != 0.0 ? reservation_price : mid;
    if (bid_size > 0.0 && bid_price > 0.0) {
        proposal.bids.push_back({clob::Side::Buy, bid_price, bid_size, 0, false});
    }
    if (ask_size > 0.0 && ask_price > 0.0) {
        proposal.asks.push_back({clob::Side::Sell, ask_price, ask_size, 0, false});
    }
    return proposal;
}

void apply_multi_level(QuoteProposal& proposal, int levels, double spread_mult, double size_mult) {
    if (levels <= 1 || proposal.empty()) {
        return;
    }

    const double mid = proposal.mid;
    const auto base_bid = proposal.bids.empty() ? nullptr : &proposal.bids.front();
    const auto base_ask = proposal.asks.empty() ? nullptr : &proposal.asks.front();
    std::vector<OrderProposal> extra_bids;
    std::vector<OrderProposal> extra_asks;

    for (int level = 1; level < levels; ++level) {
        const double mult = std::pow(spread_mult, level);
        const double sz_mult = std::pow(size_mult, level);
        if (base_bid) {
            const double delta = mid - base_bid->price;
            extra_bids.push_back({clob::Side::Buy,
                                  std::max(kMinPrice, round_to(mid - delta * mult, kTickSize)),
                                  round_to(base_bid->size * sz_mult, kSizeStep),
                                  level,
                                  false});
        }
        if (base_ask) {
            const double delta = base_ask->price - mid;
            extra_asks.push_back({clob::Side::Sell,
                                  std::min(kMaxPrice, round_to(mid + delta * mult, kTickSize)),
                                  round_to(base_ask->size * sz_mult, kSizeStep),
                                  level,
                                  false});
        }
    }

    proposal.bids.insert(proposal.bids.end(), extra_bids.begin(), extra_bids.end());
    proposal.asks.insert(proposal.asks.end(), extra_asks.begin(), extra_asks.end());
}

void apply_vol_adjustment(QuoteProposal& proposal, double vol_pts, double threshold) {
    if (threshold <= 0.0 || vol_pts <= threshold) {
        return;
    }
    const double multiplier = std::min(2.0, 1.0 + (vol_pts - threshold) / threshold);
    widen_spreads(proposal, multiplier);
}

void apply_event_risk(QuoteProposal& proposal, bool guard_warning, double widen_pct) {
    if (!guard_warning) {
        return;
    }
    widen_spreads(proposal, 1.0 + widen_pct / 100.0);
}

void apply_budget_constraint(QuoteProposal& proposal,
                             double available_capital,
                             double committed,
                             double min_viable_size,
                             AskFunding ask_funding) {
    const double remaining = available_capital - committed;
    if (remaining <= 0.0) {
        proposal.bids.clear();
        proposal.asks.clear();
        return;
    }

    double used = 0.0;
    proposal.bids = fit_side(proposal.bids, remaining, used, min_viable_size, ask_funding);
    proposal.asks = fit_side(proposal.asks, remaining, used, min_viable_size, ask_funding);
}

void apply_post_only_filter(QuoteProposal& proposal, double best_bid, double best_ask) {
    if (best_ask > 0.0) {
        for (auto& order : proposal.bids) {
            if (order.price >= best_ask) {
                order.price = std::max(kMinPrice, round_to(best_ask - kTickSize, kTickSize));
            }
        }
    }
    if (best_bid > 0.0) {
        for (auto& order : proposal.asks) {
            if (order.price <= best_bid) {
                order.price = std::min(kMaxPrice, round_to(best_bid + kTickSize, kTickSize));
            }
        }
    }
}

ProposalPipeline& ProposalPipeline::add(std::string name, Stage stage) {
    stages_.emplace_back(std::move(name), std::move(stage));
    return *this;
}

ProposalPipeline& ProposalPipeline::post_only(double best_bid, double best_ask) {
    post_only_ = true;
    best_bid_ = best_bid;
    best_ask_ = best_ask;
    return *this;
}

QuoteProposal ProposalPipeline::run(QuoteProposal proposal) const {
    for (const auto& stage : stages_) {
        stage.second(proposal);
    }
    if (post_only_) {
        apply_post_only_filter(proposal, best_bid_, best_ask_);
    }
    return proposal;
}

std::vector<std::string> ProposalPipeline::stage_names() const {
    std::vector<std::string> names;
    names.reserve(stages_.size() + 1);
    for (const auto& stage : stages_) {
        names.push_back(stage.first);
    }
    if (post_only_) {
        names.emplace_back("post_only");
    }
    return names;
}

} // namespace mm
