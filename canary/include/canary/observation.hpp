#pragma once
// Evidence model: observations, reasoning hops and claims
//
// An Observation is the only way world state enters a session: a tool
// return, a user statement, or a system rule. A Claim is a statement
// derived from observations through a recorded chain of TransformSteps.
// Claim confidence is never stored authoritatively; it is recomputed
// against the observations that are still valid at the moment of asking.

#include "policy.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace canary {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Observation
// ═══════════════════════════════════════════════════════════════════════════

// Authoritative sources of world state
enum class ObservationType : uint8_t {
    ToolReturn = 0,    // Tool/API return
    UserInput = 1,     // Direct user statement
    DefinedRule = 2,   // System rule, formally verifiable
};

inline const char* observation_type_name(ObservationType type) {
    switch (type) {
        case ObservationType::ToolReturn: return "TOOL_RETURN";
        case ObservationType::UserInput: return "USER_INPUT";
        case ObservationType::DefinedRule: return "DEFINED_RULE";
    }
    return "TOOL_RETURN";
}

inline std::optional<ObservationType> parse_observation_type(const std::string& name) {
    if (name == "TOOL_RETURN") return ObservationType::ToolReturn;
    if (name == "USER_INPUT") return ObservationType::UserInput;
    if (name == "DEFINED_RULE") return ObservationType::DefinedRule;
    return std::nullopt;
}

inline const char* observation_source_label(ObservationType type) {
    switch (type) {
        case ObservationType::ToolReturn: return "tool return";
        case ObservationType::UserInput: return "user input";
        case ObservationType::DefinedRule: return "system rule";
    }
    return "unknown";
}

// Confidence an observation gets when its creator does not state one
inline float default_confidence(ObservationType type) {
    return type == ObservationType::UserInput ? defaults::user_input_confidence
                                              : defaults::tool_return_confidence;
}

struct Observation {
    std::string id = generate_id();
    std::string content;
    ObservationType source_type = ObservationType::ToolReturn;
    std::string source_id;                 // Tool name / user id / rule id
    Timestamp timestamp = now();
    float confidence = defaults::tool_return_confidence;  // [0, 1]
    std::string scope;
    std::optional<int64_t> ttl_seconds;    // nullopt = never expires
    json metadata = json::object();

    Observation() = default;

    // Unset or non-finite confidence takes the source-type default
    // (USER_INPUT -> 0.8). A stated confidence is clamped to [0, 1].
    Observation(ObservationType type, std::string source, std::string text,
                std::optional<float> conf = std::nullopt,
                Timestamp at = now())
        : content(std::move(text)),
          source_type(type),
          source_id(std::move(source)),
          timestamp(at),
          confidence((conf && std::isfinite(*conf)) ? std::clamp(*conf, 0.0f, 1.0f)
                                                    : default_confidence(type)) {}

    // Strictly older than its TTL. Monotonic in `at`.
    // Compared in seconds so ttl * 1000 is never formed.
    bool is_expired(Timestamp at) const {
        if (!ttl_seconds) return false;
        int64_t age = at - timestamp;
        int64_t age_seconds = age / 1000;
        return age_seconds > *ttl_seconds ||
               (age_seconds == *ttl_seconds && age % 1000 > 0);
    }

    // Whole seconds left, floored at 0; nullopt if never expires
    std::optional<int64_t> remaining_ttl(Timestamp at) const {
        if (!ttl_seconds) return std::nullopt;
        int64_t age_seconds = (at - timestamp) / 1000;
        if (age_seconds <= 0) return std::max<int64_t>(0, *ttl_seconds);
        return std::max<int64_t>(0, *ttl_seconds - age_seconds);
    }

    // Prompt-facing rendering of one observation
    std::string to_context(Timestamp at) const {
        std::ostringstream oss;
        oss << "[" << id << "] source: " << observation_source_label(source_type)
            << " (" << source_id << ")\n";
        oss << "    content: " << excerpt(content, 200);
        if (utf8_length(content) > 200) oss << "...";
        oss << "\n    confidence: " << percent(confidence);
        if (auto remaining = remaining_ttl(at)) {
            oss << "\n    expires in: " << *remaining << "s";
        }
        return oss.str();
    }

    json to_json() const {
        json j = {
            {"id", id},
            {"content", content},
            {"source_type", observation_type_name(source_type)},
            {"source_id", source_id},
            {"timestamp", format_timestamp(timestamp)},
            {"confidence", confidence},
            {"scope", scope},
            {"ttl_seconds", nullptr},
            {"metadata", metadata},
        };
        if (ttl_seconds) j["ttl_seconds"] = *ttl_seconds;
        return j;
    }

    static std::optional<Observation> from_json(const json& j) {
        if (!j.is_object()) return std::nullopt;
        try {
            auto type = parse_observation_type(j.value("source_type", std::string("TOOL_RETURN")));
            if (!type) return std::nullopt;

            std::optional<float> conf;
            if (auto it = j.find("confidence"); it != j.end() && !it->is_null()) {
                conf = it->get<float>();
            }

            Timestamp at = now();
            if (auto it = j.find("timestamp"); it != j.end() && it->is_string()) {
                at = parse_timestamp(it->get<std::string>()).value_or(at);
            }

            Observation o(*type, j.value("source_id", std::string()),
                          j.value("content", std::string()), conf, at);
            if (auto it = j.find("id"); it != j.end() && it->is_string()) {
                o.id = it->get<std::string>();
            }
            o.scope = j.value("scope", std::string());
            if (auto it = j.find("ttl_seconds"); it != j.end() && !it->is_null()) {
                o.ttl_seconds = it->get<int64_t>();
            }
            if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
                o.metadata = *it;
            }
            return o;
        } catch (const json::exception& e) {
            std::cerr << "[Observation] Malformed entry: " << e.what() << "\n";
            return std::nullopt;
        }
    }
};

using ObservationMap = std::unordered_map<std::string, Observation>;

// ═══════════════════════════════════════════════════════════════════════════
// TransformStep
// ═══════════════════════════════════════════════════════════════════════════

enum class TransformOp : uint8_t {
    Extract = 0,
    Aggregate = 1,
    Infer = 2,
    Combine = 3,
};

inline const char* transform_op_name(TransformOp op) {
    switch (op) {
        case TransformOp::Extract: return "extract";
        case TransformOp::Aggregate: return "aggregate";
        case TransformOp::Infer: return "infer";
        case TransformOp::Combine: return "combine";
    }
    return "extract";
}

inline std::optional<TransformOp> parse_transform_op(const std::string& name) {
    if (name == "extract") return TransformOp::Extract;
    if (name == "aggregate") return TransformOp::Aggregate;
    if (name == "infer") return TransformOp::Infer;
    if (name == "combine") return TransformOp::Combine;
    return std::nullopt;
}

// One recorded reasoning hop
struct TransformStep {
    TransformOp operation = TransformOp::Extract;
    std::string description;
    std::vector<std::string> input_ids;   // Observation or claim ids
    float confidence_delta = 0.0f;        // [-1, 1]

    TransformStep() = default;
    TransformStep(TransformOp op, std::string desc,
                  std::vector<std::string> inputs = {}, float delta = 0.0f)
        : operation(op),
          description(std::move(desc)),
          input_ids(std::move(inputs)),
          confidence_delta(std::isfinite(delta) ? std::clamp(delta, -1.0f, 1.0f) : 0.0f) {}

    json to_json() const {
        return {
            {"operation", transform_op_name(operation)},
            {"description", description},
            {"input_ids", input_ids},
            {"confidence_delta", confidence_delta},
        };
    }

    static std::optional<TransformStep> from_json(const json& j) {
        if (!j.is_object()) return std::nullopt;
        try {
            auto op = parse_transform_op(j.at("operation").get<std::string>());
            if (!op) return std::nullopt;
            return TransformStep(*op,
                                 j.at("description").get<std::string>(),
                                 j.value("input_ids", std::vector<std::string>{}),
                                 j.value("confidence_delta", 0.0f));
        } catch (const json::exception& e) {
            std::cerr << "[TransformStep] Malformed entry: " << e.what() << "\n";
            return std::nullopt;
        }
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Claim
// ═══════════════════════════════════════════════════════════════════════════

// Evidence strength of a claim, most trusted first
enum class ClaimType : uint8_t {
    Fact = 0,          // Directly supported by observation
    Inference = 1,     // Derived through reasoning
    Hypothesis = 2,    // Speculative, low evidence
};

inline const char* claim_type_name(ClaimType type) {
    switch (type) {
        case ClaimType::Fact: return "fact";
        case ClaimType::Inference: return "inference";
        case ClaimType::Hypothesis: return "hypothesis";
    }
    return "hypothesis";
}

inline std::optional<ClaimType> parse_claim_type(const std::string& name) {
    if (name == "fact") return ClaimType::Fact;
    if (name == "inference") return ClaimType::Inference;
    if (name == "hypothesis") return ClaimType::Hypothesis;
    return std::nullopt;
}

struct Claim {
    std::string id = generate_id();
    std::string statement;
    ClaimType claim_type = ClaimType::Fact;
    std::vector<std::string> source_observations;
    std::vector<TransformStep> transform_chain;
    float confidence = 1.0f;              // Cached; refresh before trusting
    std::string scope;
    Timestamp created_at = now();

    // Weakest link: the minimum confidence of the source observations still
    // valid at `at`, plus every transform delta, clamped to [0, 1].
    // Missing or expired sources contribute nothing; none left -> 0.
    float compute_confidence(const ObservationMap& observations, Timestamp at) const {
        bool any = false;
        float base = 1.0f;
        for (const auto& obs_id : source_observations) {
            auto it = observations.find(obs_id);
            if (it == observations.end() || it->second.is_expired(at)) continue;
            base = any ? std::min(base, it->second.confidence) : it->second.confidence;
            any = true;
        }
        if (!any) return 0.0f;

        for (const auto& step : transform_chain) {
            base += step.confidence_delta;
        }
        return std::clamp(base, 0.0f, 1.0f);
    }

    void update_confidence(const ObservationMap& observations, Timestamp at) {
        confidence = compute_confidence(observations, at);
    }

    // Human-readable reasoning chain
    std::string audit_trail() const {
        std::ostringstream oss;
        oss << "Claim: " << statement << "\n";
        oss << "Type: " << claim_type_name(claim_type) << "\n";
        oss << "Confidence: " << percent(confidence) << "\n";
        oss << "Source observations:";
        for (const auto& obs_id : source_observations) {
            oss << "\n  - " << obs_id;
        }
        if (!transform_chain.empty()) {
            oss << "\nReasoning chain:";
            int n = 1;
            for (const auto& step : transform_chain) {
                oss << "\n  " << n++ << ". [" << transform_op_name(step.operation) << "] "
                    << step.description;
                if (!step.input_ids.empty()) {
                    oss << "\n     inputs: ";
                    for (size_t i = 0; i < step.input_ids.size(); ++i) {
                        if (i) oss << ", ";
                        oss << step.input_ids[i];
                    }
                }
                char delta[16];
                snprintf(delta, sizeof(delta), "%+.2f", step.confidence_delta);
                oss << "\n     confidence delta: " << delta;
            }
        }
        return oss.str();
    }

    json to_json() const {
        json chain = json::array();
        for (const auto& step : transform_chain) chain.push_back(step.to_json());
        return {
            {"id", id},
            {"statement", statement},
            {"claim_type", claim_type_name(claim_type)},
            {"source_observations", source_observations},
            {"transform_chain", chain},
            {"confidence", confidence},
            {"scope", scope},
            {"created_at", format_timestamp(created_at)},
        };
    }

    static std::optional<Claim> from_json(const json& j) {
        if (!j.is_object()) return std::nullopt;
        try {
            Claim c;
            auto type = parse_claim_type(j.value("claim_type", std::string("fact")));
            if (!type) return std::nullopt;
            c.claim_type = *type;

            if (auto it = j.find("id"); it != j.end() && it->is_string()) {
                c.id = it->get<std::string>();
            }
            c.statement = j.value("statement", std::string());
            c.source_observations = j.value("source_observations", std::vector<std::string>{});
            if (auto it = j.find("transform_chain"); it != j.end() && it->is_array()) {
                for (const auto& step_json : *it) {
                    auto step = TransformStep::from_json(step_json);
                    if (!step) return std::nullopt;
                    c.transform_chain.push_back(std::move(*step));
                }
            }
            c.confidence = j.value("confidence", 1.0f);
            c.scope = j.value("scope", std::string());
            if (auto it = j.find("created_at"); it != j.end() && it->is_string()) {
                c.created_at = parse_timestamp(it->get<std::string>()).value_or(c.created_at);
            }
            return c;
        } catch (const json::exception& e) {
            std::cerr << "[Claim] Malformed entry: " << e.what() << "\n";
            return std::nullopt;
        }
    }
};

} // namespace canary
