#pragma once
// Policy: every threshold of the degradation and strategy rules
//
// Nothing in the decision code compares against a bare literal. The
// defaults below are the shipped policy; a JSON file can override any
// subset of them (absent keys keep their defaults).

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace canary {

using json = nlohmann::json;

namespace defaults {

// Degradation ladder
constexpr float full_answer_confidence = 0.8f;
constexpr float partial_answer_confidence = 0.5f;
constexpr size_t min_observations_for_answer = 1;

// Claim confidence buckets in a grounded answer
constexpr float high_claim_confidence = 0.8f;
constexpr float medium_claim_confidence = 0.5f;

// Reasoning hop penalties
constexpr float extract_delta = 0.0f;
constexpr float inference_delta = -0.1f;
constexpr float hypothesis_delta = -0.3f;

// Strategy gate
constexpr float conclude_confidence = 0.7f;
constexpr int stall_threshold = 3;
constexpr size_t uncertainty_limit = 5;
constexpr float degrade_confidence = 0.3f;
constexpr float grounding_confidence = 0.5f;
constexpr float weak_evidence_confidence = 0.5f;
constexpr size_t cross_validation_count = 3;

// Cognitive state
constexpr float initial_confidence = 0.3f;

// Observation sources
constexpr float tool_return_confidence = 1.0f;
constexpr float user_input_confidence = 0.8f;

} // namespace defaults

struct DegradationPolicy {
    float full_confidence = defaults::full_answer_confidence;
    float partial_confidence = defaults::partial_answer_confidence;
    size_t min_observations = defaults::min_observations_for_answer;

    float high_claim_confidence = defaults::high_claim_confidence;
    float medium_claim_confidence = defaults::medium_claim_confidence;

    int64_t near_expiry_seconds = 1800;      // Warn when less TTL remains
    size_t cross_validation_count = defaults::cross_validation_count;
    size_t excerpt_chars = 100;              // Claim excerpt in confidence parts
    size_t summary_observations = 5;         // Entries in provenance summary
};

struct ExtractorPolicy {
    size_t min_unit_chars = 10;     // Shorter units are not even analysed
    size_t min_claim_chars = 15;    // Shorter sentences are not claims
    size_t max_classify_chars = 1000;   // Phrase matching window per sentence
    float extract_delta = defaults::extract_delta;
    float inference_delta = defaults::inference_delta;
    float hypothesis_delta = defaults::hypothesis_delta;
};

struct StrategyConfig {
    float confidence_threshold = defaults::conclude_confidence;
    int stall_threshold = defaults::stall_threshold;
    size_t uncertainty_limit = defaults::uncertainty_limit;
    size_t min_observations_for_answer = defaults::min_observations_for_answer;

    float degrade_confidence = defaults::degrade_confidence;      // Stalled below this -> DEGRADE
    float grounding_confidence = defaults::grounding_confidence;  // Observation counts as grounding
    float weak_evidence_confidence = defaults::weak_evidence_confidence;
    size_t cross_validation_count = defaults::cross_validation_count;
};

// Minimum cognitive confidence before a tool of each risk tier may run
struct CommitmentThresholds {
    float safe = 0.0f;
    float low = 0.3f;
    float medium = 0.5f;
    float high = 0.8f;
};

struct PolicyConfig {
    DegradationPolicy degradation;
    ExtractorPolicy extractor;
    StrategyConfig strategy;
    CommitmentThresholds commitment;

    json to_json() const {
        return {
            {"degradation", {
                {"full_confidence", degradation.full_confidence},
                {"partial_confidence", degradation.partial_confidence},
                {"min_observations", degradation.min_observations},
                {"high_claim_confidence", degradation.high_claim_confidence},
                {"medium_claim_confidence", degradation.medium_claim_confidence},
                {"near_expiry_seconds", degradation.near_expiry_seconds},
                {"cross_validation_count", degradation.cross_validation_count},
                {"excerpt_chars", degradation.excerpt_chars},
                {"summary_observations", degradation.summary_observations},
            }},
            {"extractor", {
                {"min_unit_chars", extractor.min_unit_chars},
                {"min_claim_chars", extractor.min_claim_chars},
                {"max_classify_chars", extractor.max_classify_chars},
                {"extract_delta", extractor.extract_delta},
                {"inference_delta", extractor.inference_delta},
                {"hypothesis_delta", extractor.hypothesis_delta},
            }},
            {"strategy", {
                {"confidence_threshold", strategy.confidence_threshold},
                {"stall_threshold", strategy.stall_threshold},
                {"uncertainty_limit", strategy.uncertainty_limit},
                {"min_observations_for_answer", strategy.min_observations_for_answer},
                {"degrade_confidence", strategy.degrade_confidence},
                {"grounding_confidence", strategy.grounding_confidence},
                {"weak_evidence_confidence", strategy.weak_evidence_confidence},
                {"cross_validation_count", strategy.cross_validation_count},
            }},
            {"commitment", {
                {"safe", commitment.safe},
                {"low", commitment.low},
                {"medium", commitment.medium},
                {"high", commitment.high},
            }},
        };
    }

    // Overlay keys present in j onto the defaults
    static std::optional<PolicyConfig> from_json(const json& j) {
        if (!j.is_object()) return std::nullopt;
        PolicyConfig p;
        try {
            if (auto it = j.find("degradation"); it != j.end()) {
                const json& d = *it;
                auto& o = p.degradation;
                o.full_confidence = d.value("full_confidence", o.full_confidence);
                o.partial_confidence = d.value("partial_confidence", o.partial_confidence);
                o.min_observations = d.value("min_observations", o.min_observations);
                o.high_claim_confidence = d.value("high_claim_confidence", o.high_claim_confidence);
                o.medium_claim_confidence = d.value("medium_claim_confidence", o.medium_claim_confidence);
                o.near_expiry_seconds = d.value("near_expiry_seconds", o.near_expiry_seconds);
                o.cross_validation_count = d.value("cross_validation_count", o.cross_validation_count);
                o.excerpt_chars = d.value("excerpt_chars", o.excerpt_chars);
                o.summary_observations = d.value("summary_observations", o.summary_observations);
            }
            if (auto it = j.find("extractor"); it != j.end()) {
                const json& e = *it;
                auto& o = p.extractor;
                o.min_unit_chars = e.value("min_unit_chars", o.min_unit_chars);
                o.min_claim_chars = e.value("min_claim_chars", o.min_claim_chars);
                o.max_classify_chars = e.value("max_classify_chars", o.max_classify_chars);
                o.extract_delta = e.value("extract_delta", o.extract_delta);
                o.inference_delta = e.value("inference_delta", o.inference_delta);
                o.hypothesis_delta = e.value("hypothesis_delta", o.hypothesis_delta);
            }
            if (auto it = j.find("strategy"); it != j.end()) {
                const json& s = *it;
                auto& o = p.strategy;
                o.confidence_threshold = s.value("confidence_threshold", o.confidence_threshold);
                o.stall_threshold = s.value("stall_threshold", o.stall_threshold);
                o.uncertainty_limit = s.value("uncertainty_limit", o.uncertainty_limit);
                o.min_observations_for_answer = s.value("min_observations_for_answer", o.min_observations_for_answer);
                o.degrade_confidence = s.value("degrade_confidence", o.degrade_confidence);
                o.grounding_confidence = s.value("grounding_confidence", o.grounding_confidence);
                o.weak_evidence_confidence = s.value("weak_evidence_confidence", o.weak_evidence_confidence);
                o.cross_validation_count = s.value("cross_validation_count", o.cross_validation_count);
            }
            if (auto it = j.find("commitment"); it != j.end()) {
                const json& c = *it;
                auto& o = p.commitment;
                o.safe = c.value("safe", o.safe);
                o.low = c.value("low", o.low);
                o.medium = c.value("medium", o.medium);
                o.high = c.value("high", o.high);
            }
        } catch (const json::exception& e) {
            std::cerr << "[Policy] Invalid policy value: " << e.what() << "\n";
            return std::nullopt;
        }
        return p;
    }
};

// Load a policy file. nullopt if unreadable or malformed.
inline std::optional<PolicyConfig> load_policy(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[Policy] Cannot open " << path << "\n";
        return std::nullopt;
    }
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[Policy] Parse error in " << path << "\n";
        return std::nullopt;
    }
    return PolicyConfig::from_json(j);
}

} // namespace canary
