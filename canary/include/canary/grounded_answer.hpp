#pragma once
// Grounded Answer: degradation-annotated output for the user
//
// The raw answer from the model is never shown as-is unless the ledger
// supports it. The degradation level decides what happens to it:
//   FULL_ANSWER               passed through
//   PARTIAL_WITH_UNCERTAINTY  disclaimer appended
//   REQUEST_MORE_INFO         wrapped as limited information
//   REFUSE                    discarded, replaced by a fixed refusal

#include "observation.hpp"
#include "policy.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace canary {

using json = nlohmann::json;

namespace answer_text {

constexpr const char* uncertainty_disclaimer =
    "\n\nNote: parts of the above are based on limited observations and may be uncertain.";
constexpr const char* limited_preamble =
    "Based on the available observations, I can only offer the following limited information:\n\n";
constexpr const char* limited_postamble =
    "\n\nMore information is needed for a complete answer.";
constexpr const char* refusal =
    "Sorry, I do not have enough observed data to answer this question.\n\n"
    "To avoid giving inaccurate information, I will not guess.";

} // namespace answer_text

struct GroundedAnswer {
    std::string content;
    DegradationLevel degradation_level = DegradationLevel::Refuse;
    std::vector<std::string> observations_used;   // Valid observation ids
    std::vector<Claim> claims;
    std::vector<std::string> high_confidence_parts;
    std::vector<std::string> medium_confidence_parts;
    std::vector<std::string> low_confidence_parts;
    std::vector<std::string> limitations;
    std::vector<std::string> suggested_actions;

    // Header, content, confidence breakdown (not for FULL_ANSWER),
    // limitations, suggestions. Empty sections are omitted.
    std::string to_formatted_output() const {
        std::ostringstream oss;

        switch (degradation_level) {
            case DegradationLevel::FullAnswer:
                oss << "[Full answer]\n";
                break;
            case DegradationLevel::PartialWithUncertainty:
                oss << "[Partial answer]\nSome information is uncertain.\n";
                break;
            case DegradationLevel::RequestMoreInfo:
                oss << "[Insufficient information]\nMore information is needed for a complete answer.\n";
                break;
            case DegradationLevel::Refuse:
                oss << "[Cannot answer]\nThere are not enough observations.\n";
                break;
        }

        oss << content;

        if (degradation_level != DegradationLevel::FullAnswer) {
            oss << "\n\n[Confidence assessment]";
            auto section = [&oss](const char* title, const std::vector<std::string>& parts) {
                if (parts.empty()) return;
                oss << "\n" << title;
                for (const auto& p : parts) oss << "\n  - " << p;
            };
            section("High confidence:", high_confidence_parts);
            section("Medium confidence:", medium_confidence_parts);
            section("Low confidence:", low_confidence_parts);
        }

        if (!limitations.empty()) {
            oss << "\n\n[Limitations]";
            for (const auto& l : limitations) oss << "\n- " << l;
        }

        if (!suggested_actions.empty()) {
            oss << "\n\n[Suggestions]";
            for (const auto& a : suggested_actions) oss << "\n- " << a;
        }

        return oss.str();
    }

    json to_json() const {
        json claims_json = json::array();
        for (const auto& c : claims) claims_json.push_back(c.to_json());
        return {
            {"content", content},
            {"degradation_level", degradation_level_name(degradation_level)},
            {"observations_used", observations_used},
            {"claims", claims_json},
            {"high_confidence_parts", high_confidence_parts},
            {"medium_confidence_parts", medium_confidence_parts},
            {"low_confidence_parts", low_confidence_parts},
            {"limitations", limitations},
            {"suggested_actions", suggested_actions},
        };
    }
};

class GroundedAnswerGenerator {
public:
    explicit GroundedAnswerGenerator(DegradationPolicy policy = {})
        : policy_(policy) {}

    GroundedAnswerGenerator(float confidence_threshold_full,
                            float confidence_threshold_partial,
                            size_t min_observations_for_answer)
    {
        policy_.full_confidence = confidence_threshold_full;
        policy_.partial_confidence = confidence_threshold_partial;
        policy_.min_observations = min_observations_for_answer;
    }

    const DegradationPolicy& policy() const { return policy_; }

    DegradationLevel determine_degradation(const ProvenanceRegistry& registry) const {
        return registry.determine_degradation_level(policy_);
    }

    GroundedAnswer generate(const std::string& raw_answer,
                            const ProvenanceRegistry& registry,
                            std::vector<Claim> claims = {}) const
    {
        Timestamp at = registry.now();

        GroundedAnswer answer;
        answer.degradation_level = registry.determine_degradation_level(policy_, at);

        auto valid = registry.get_valid_observations(0.0f, at);
        for (const auto& obs : valid) answer.observations_used.push_back(obs.id);

        for (auto& claim : claims) {
            claim.update_confidence(registry.observations(), at);
            std::string part = excerpt(claim.statement, policy_.excerpt_chars);
            if (claim.confidence >= policy_.high_claim_confidence) {
                answer.high_confidence_parts.push_back(std::move(part));
            } else if (claim.confidence >= policy_.medium_claim_confidence) {
                answer.medium_confidence_parts.push_back(std::move(part));
            } else {
                answer.low_confidence_parts.push_back(std::move(part));
            }
        }
        answer.claims = std::move(claims);

        answer.limitations = limitations(registry, valid, at);
        answer.suggested_actions = suggestions(answer.degradation_level, valid.size());
        answer.content = process_content(raw_answer, answer.degradation_level);

        if (answer.degradation_level == DegradationLevel::Refuse) {
            std::cerr << "[GroundedAnswer] Refused: no valid observations ("
                      << registry.observation_count() << " in ledger)\n";
        }
        return answer;
    }

    // Valid observations (first few) and expired count
    std::string format_provenance_summary(const ProvenanceRegistry& registry) const {
        Timestamp at = registry.now();
        auto valid = registry.get_valid_observations(0.0f, at);
        auto expired = registry.invalidate_expired(at);

        std::ostringstream oss;
        oss << "[Observation summary]";
        if (valid.empty()) {
            oss << "\nNo valid observations";
        } else {
            oss << "\nValid observations: " << valid.size();
            size_t shown = std::min(valid.size(), policy_.summary_observations);
            for (size_t i = 0; i < shown; ++i) {
                const auto& obs = valid[i];
                oss << "\n  - [" << obs.id << "] " << obs.source_id
                    << " (confidence: " << percent(obs.confidence) << ")";
            }
        }
        if (!expired.empty()) {
            oss << "\nExpired: " << expired.size();
        }
        return oss.str();
    }

private:
    std::string process_content(const std::string& raw_answer, DegradationLevel level) const {
        switch (level) {
            case DegradationLevel::FullAnswer:
                return raw_answer;
            case DegradationLevel::PartialWithUncertainty:
                return raw_answer + answer_text::uncertainty_disclaimer;
            case DegradationLevel::RequestMoreInfo:
                return std::string(answer_text::limited_preamble) + raw_answer +
                       answer_text::limited_postamble;
            case DegradationLevel::Refuse:
                break;
        }
        return answer_text::refusal;
    }

    std::vector<std::string> limitations(const ProvenanceRegistry& registry,
                                         const std::vector<Observation>& valid,
                                         Timestamp at) const
    {
        std::vector<std::string> result;

        for (const auto& obs : valid) {
            auto remaining = obs.remaining_ttl(at);
            if (remaining && *remaining < policy_.near_expiry_seconds) {
                result.push_back("Some data (from " + obs.source_id +
                                 ") is about to expire; consider fetching it again");
                break;
            }
        }

        auto expired = registry.invalidate_expired(at);
        if (!expired.empty()) {
            result.push_back(std::to_string(expired.size()) + " observations have expired");
        }

        std::unordered_set<std::string> sources;
        for (const auto& obs : valid) sources.insert(obs.source_id);
        if (sources.size() == 1) {
            result.push_back("Information comes from a single source; cross-validation is advised");
        }

        return result;
    }

    std::vector<std::string> suggestions(DegradationLevel level, size_t valid_count) const {
        std::vector<std::string> result;
        switch (level) {
            case DegradationLevel::RequestMoreInfo:
                result.push_back("Try the web_search tool to gather more relevant information");
                result.push_back("Or provide more specific background information");
                break;
            case DegradationLevel::Refuse:
                result.push_back("Please provide more specific information about the question");
                result.push_back("Try breaking the question into smaller, searchable parts");
                break;
            case DegradationLevel::PartialWithUncertainty:
                if (valid_count < policy_.cross_validation_count) {
                    result.push_back("Gathering more relevant data would make the answer more reliable");
                }
                break;
            case DegradationLevel::FullAnswer:
                break;
        }
        return result;
    }

    DegradationPolicy policy_;
};

} // namespace canary
