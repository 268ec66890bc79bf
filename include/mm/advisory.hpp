#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mm {

struct MarketInfo {
    std::string market_id;
    std::string token_id;
    std::string no_token_id;
    std::string condition_id;
    std::string question;
    double days_to_resolution = 30.0;
};

class MarketSource {
public:
    virtual ~MarketSource() = default;
    virtual std::vector<MarketInfo> markets() = 0;
};

// Market list kept in a JSON array on disk, re-read on every call so the
// operator can edit it while the loop runs. A bad read keeps the last good list.
class JsonFileMarketSource : public MarketSource {
public:
    explicit JsonFileMarketSource(std::filesystem::path path);

    std::vector<MarketInfo> markets() override;

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::vector<MarketInfo> last_good_;
};

struct EventRiskAssessment {
    bool kill = false;      // cancel and stop quoting this market
    bool warning = false;   // keep quoting, widened
    std::string reason;
};

// Flags markets with imminent news or resolution risk.
class EventRiskGuard {
public:
    virtual ~EventRiskGuard() = default;
    virtual std::map<std::string, EventRiskAssessment> assess(const std::vector<MarketInfo>& markets) = 0;
};

class NullEventRiskGuard : public EventRiskGuard {
public:
    std::map<std::string, EventRiskAssessment> assess(const std::vector<MarketInfo>&) override { return {}; }
};

struct ScoreDecision {
    bool approved = true;
    double size_multiplier = 1.0;
    double score = 0.5;
    std::string reason;
};

// Decides which candidate markets are worth quoting and how large.
class MarketScorer {
public:
    virtual ~MarketScorer() = default;
    virtual std::map<std::string, ScoreDecision> score(const std::vector<MarketInfo>& markets) = 0;
};

class PassThroughScorer : public MarketScorer {
public:
    std::map<std::string, ScoreDecision> score(const std::vector<MarketInfo>&) override { return {}; }
};

// Guard failure: every market is treated as carrying event risk.
std::map<std::string, EventRiskAssessment> consult_guard(EventRiskGuard& guard, const std::vector<MarketInfo>& markets);

// Scorer failure: every market is approved at half size. Markets the scorer
// leaves out are approved at full size.
std::map<std::string, ScoreDecision> consult_scorer(MarketScorer& scorer, const std::vector<MarketInfo>& markets);

} // namespace mm
