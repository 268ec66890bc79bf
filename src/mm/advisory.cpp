#include "mm/advisory.hpp"

#include "clob/util.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace mm {
namespace {

constexpr double kFallbackSizeMultiplier = 0.5;

MarketInfo market_from_json(const nlohmann::json& j) {
    MarketInfo info;
    info.market_id = clob::get_string_optional(j, "market_id");
    info.token_id = clob::get_string_optional(j, "token_id");
    info.no_token_id = clob::get_string_optional(j, "no_token_id");
    info.condition_id = clob::get_string_optional(j, "condition_id");
    info.question = clob::get_string_optional(j, "question");
    info.days_to_resolution = clob::get_double_optional(j, "days_to_resolution", 30.0);
    if (info.condition_id.empty()) {
        info.condition_id = info.market_id;
    }
    return info;
}

} // namespace

JsonFileMarketSource::JsonFileMarketSource(std::filesystem::path path)
    : path_(std::move(path)) {}

std::vector<MarketInfo> JsonFileMarketSource::markets() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream input(path_);
    if (!input.good()) {
        std::cerr << "[Loop] Market file " << path_.string() << " not readable, keeping "
                  << last_good_.size() << " markets" << std::endl;
        return last_good_;
    }

    try {
        const auto json = nlohmann::json::parse(input);
        const auto& list = json.is_object() && json.contains("markets") ? json["markets"] : json;
        if (!list.is_array()) {
            throw std::runtime_error("expected an array of markets");
        }
        std::vector<MarketInfo> parsed;
        for (const auto& entry : list) {
            auto info = market_from_json(entry);
            if (info.market_id.empty() || info.token_id.empty()) {
                continue;
            }
            parsed.push_back(std::move(info));
        }
        last_good_ = std::move(parsed);
    } catch (const std::exception& ex) {
        std::cerr << "[Loop] Failed to parse market file " << path_.string() << ": " << ex.what() << std::endl;
    }
    return last_good_;
}

std::map<std::string, EventRiskAssessment> consult_guard(EventRiskGuard& guard, const std::vector<MarketInfo>& markets) {
    try {
        return guard.assess(markets);
    } catch (const std::exception& ex) {
        std::cerr << "[Loop] Event-risk guard failed, assuming elevated risk: " << ex.what() << std::endl;
    }
    std::map<std::string, EventRiskAssessment> fallback;
    for (const auto& market : markets) {
        fallback[market.market_id] = EventRiskAssessment{false, true, "guard unavailable"};
    }
    return fallback;
}

std::map<std::string, ScoreDecision> consult_scorer(MarketScorer& scorer, const std::vector<MarketInfo>& markets) {
    std::map<std::string, ScoreDecision> decisions;
    try {
        decisions = scorer.score(markets);
    } catch (const std::exception& ex) {
        std::cerr << "[Loop] Market scorer failed, approving at reduced size: " << ex.what() << std::endl;
        for (const auto& market : markets) {
            decisions[market.market_id] = ScoreDecision{true, kFallbackSizeMultiplier, 0.5, "scorer unavailable"};
        }
        return decisions;
    }
    for (const auto& market : markets) {
        decisions.emplace(market.market_id, ScoreDecision{});
    }
    return decisions;
}

} // namespace mm
