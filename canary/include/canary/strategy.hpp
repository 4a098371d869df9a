#pragma once
// Strategy Gate: what the loop does next
//
// A pure function of (CognitiveState, ledger), evaluated once per
// iteration. First matching rule wins:
//   1. confident, nothing uncertain     -> CONCLUDE (REQUEST_MORE_INFO if ungrounded)
//   2. ledger stale or weak             -> REQUEST_MORE_INFO
//   3. stalled                          -> DEGRADE (low confidence) or PIVOT
//   4. goal/requirement unclear         -> ASK_USER
//   5. data/information missing         -> DEEPEN
//   6. too many uncertainties           -> DEGRADE
//   7. otherwise                        -> CONTINUE

#include "cognitive_state.hpp"
#include "policy.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace canary {

using json = nlohmann::json;

enum class StrategyDecision : uint8_t {
    Continue = 0,         // Keep the current path
    Deepen = 1,           // Dig deeper into the current approach
    Pivot = 2,            // Switch method/skill
    AskUser = 3,          // Request clarification
    Degrade = 4,          // Answer with acknowledged uncertainty
    Conclude = 5,         // Final answer
    RequestMoreInfo = 6,  // Gather more observations first
};

inline const char* strategy_decision_name(StrategyDecision decision) {
    switch (decision) {
        case StrategyDecision::Continue: return "CONTINUE";
        case StrategyDecision::Deepen: return "DEEPEN";
        case StrategyDecision::Pivot: return "PIVOT";
        case StrategyDecision::AskUser: return "ASK_USER";
        case StrategyDecision::Degrade: return "DEGRADE";
        case StrategyDecision::Conclude: return "CONCLUDE";
        case StrategyDecision::RequestMoreInfo: return "REQUEST_MORE_INFO";
    }
    return "CONTINUE";
}

struct StrategyPath {
    StrategyDecision decision = StrategyDecision::Continue;
    std::string reason;
    std::optional<std::string> suggested_action;

    json to_json() const {
        json j = {
            {"decision", strategy_decision_name(decision)},
            {"reason", reason},
            {"suggested_action", nullptr},
        };
        if (suggested_action) j["suggested_action"] = *suggested_action;
        return j;
    }
};

class StrategyGate {
public:
    explicit StrategyGate(StrategyConfig config = {}) : config_(config) {}

    StrategyGate(float confidence_threshold, int stall_threshold,
                 size_t uncertainty_limit, size_t min_observations_for_answer = 1)
    {
        config_.confidence_threshold = confidence_threshold;
        config_.stall_threshold = stall_threshold;
        config_.uncertainty_limit = uncertainty_limit;
        config_.min_observations_for_answer = min_observations_for_answer;
    }

    const StrategyConfig& config() const { return config_; }

    StrategyPath evaluate(const CognitiveState& state,
                          const ProvenanceRegistry* registry = nullptr) const
    {
        // Rule 1: confident and nothing left open
        if (state.confidence >= config_.confidence_threshold && state.uncertainties.empty()) {
            if (registry) {
                size_t grounded = registry->get_valid_observations(config_.grounding_confidence).size();
                if (grounded < config_.min_observations_for_answer) {
                    return {StrategyDecision::RequestMoreInfo,
                            "Confidence is " + percent(state.confidence) +
                                " but no observations support it",
                            std::string("Gather observations with tools before concluding")};
                }
            }
            return {StrategyDecision::Conclude,
                    "Confidence reached " + percent(state.confidence) +
                        " with no open uncertainties",
                    std::nullopt};
        }

        // Rule 2: the ledger itself is stale or weak
        if (registry) {
            Timestamp at = registry->now();
            auto valid = registry->get_valid_observations(0.0f, at);
            auto expired = registry->invalidate_expired(at);

            if (!expired.empty() && valid.size() < config_.min_observations_for_answer) {
                return {StrategyDecision::RequestMoreInfo,
                        std::to_string(expired.size()) + " observations have expired",
                        std::string("Refresh the expired data")};
            }

            if (!valid.empty()) {
                float sum = 0.0f;
                for (const auto& obs : valid) sum += obs.confidence;
                float avg = sum / static_cast<float>(valid.size());
                if (avg < config_.weak_evidence_confidence &&
                    valid.size() < config_.cross_validation_count) {
                    return {StrategyDecision::RequestMoreInfo,
                            "Observation confidence is low (" + percent(avg) + ")",
                            std::string("Cross-validate with more sources")};
                }
            }
        }

        // Rule 3: stalled
        if (state.has_stalled(config_.stall_threshold)) {
            if (state.confidence < config_.degrade_confidence) {
                return {StrategyDecision::Degrade,
                        "Stalled for " + std::to_string(state.stall_count) +
                            " iterations with low confidence",
                        std::string("Give the current best answer and state its uncertainty")};
            }
            return {StrategyDecision::Pivot,
                    "Stalled for " + std::to_string(state.stall_count) + " iterations",
                    std::string("Consider switching skill or method")};
        }

        // Rule 4: goal unclear
        for (const auto& u : state.uncertainties) {
            if (is_goal_uncertainty(u)) {
                return {StrategyDecision::AskUser,
                        "The goal is not clearly understood",
                        "Ask the user about: " + u};
            }
        }

        // Rule 5: data missing
        for (const auto& u : state.uncertainties) {
            if (is_data_uncertainty(u)) {
                return {StrategyDecision::Deepen,
                        "More data or information is needed",
                        std::string("Keep exploring the current path")};
            }
        }

        // Rule 6: too much open
        if (state.uncertainties.size() >= config_.uncertainty_limit) {
            return {StrategyDecision::Degrade,
                    "Too many uncertainties (" + std::to_string(state.uncertainties.size()) + ")",
                    std::string("Give a partial answer and state its limits")};
        }

        return {StrategyDecision::Continue, "Continue the current strategy", std::nullopt};
    }

    static bool is_goal_uncertainty(const std::string& uncertainty) {
        return contains_any(uncertainty, {"goal", "requirement",
                                          "\xE7\x9B\xAE\xE6\xA0\x87",    // 目标
                                          "\xE9\x9C\x80\xE6\xB1\x82"});  // 需求
    }

    static bool is_data_uncertainty(const std::string& uncertainty) {
        return contains_any(uncertainty, {"data", "information",
                                          "\xE6\x95\xB0\xE6\x8D\xAE",    // 数据
                                          "\xE4\xBF\xA1\xE6\x81\xAF"});  // 信息
    }

private:
    static bool contains_any(const std::string& text, const std::vector<std::string>& markers) {
        std::string lower = ascii_lower(text);
        for (const auto& m : markers) {
            if (lower.find(m) != std::string::npos) return true;
        }
        return false;
    }

    StrategyConfig config_;
};

} // namespace canary
