#pragma once
// Tools boundary: how tool executions become observations
//
// The tools themselves live outside this library. What crosses the
// boundary is an ExecutionOutcome: either plain text or a ToolResult that
// already carries its Observation. record_outcome() resolves the variant
// exactly once and appends one observation to the ledger per execution.

#include "commitment.hpp"
#include "observation.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace canary {

using json = nlohmann::json;

// Stored observation content is capped; the full text stays in the result
constexpr size_t MAX_OBSERVATION_CONTENT = 500;

// ═══════════════════════════════════════════════════════════════════════════
// Tool catalog
// ═══════════════════════════════════════════════════════════════════════════

// Static description of a tool and its provenance policy
struct ToolSpec {
    std::string name;
    std::string category;
    std::string description;
    ToolRisk risk = ToolRisk::Safe;
    ObservationType source_type = ObservationType::ToolReturn;
    float success_confidence = 1.0f;
    std::optional<int64_t> ttl_seconds;    // nullopt = results never expire
};

class ToolCatalog {
public:
    // Re-registering a name replaces the spec, keeping its position
    void add(ToolSpec spec) {
        auto it = index_.find(spec.name);
        if (it != index_.end()) {
            specs_[it->second] = std::move(spec);
            return;
        }
        index_[spec.name] = specs_.size();
        specs_.push_back(std::move(spec));
    }

    const ToolSpec* get(const std::string& name) const {
        auto it = index_.find(name);
        return (it != index_.end()) ? &specs_[it->second] : nullptr;
    }

    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    const std::vector<ToolSpec>& all() const { return specs_; }

    std::vector<ToolSpec> by_category(const std::string& category) const {
        std::vector<ToolSpec> result;
        for (const auto& spec : specs_) {
            if (spec.category == category) result.push_back(spec);
        }
        return result;
    }

    std::vector<std::string> categories() const {
        std::vector<std::string> result;
        for (const auto& spec : specs_) {
            if (std::find(result.begin(), result.end(), spec.category) == result.end()) {
                result.push_back(spec.category);
            }
        }
        return result;
    }

    // Input for MinimalCommitmentPolicy::rank_tools
    std::vector<std::pair<std::string, ToolRisk>> risk_pairs() const {
        std::vector<std::pair<std::string, ToolRisk>> pairs;
        pairs.reserve(specs_.size());
        for (const auto& spec : specs_) pairs.emplace_back(spec.name, spec.risk);
        return pairs;
    }

    size_t size() const { return specs_.size(); }

private:
    std::vector<ToolSpec> specs_;
    std::unordered_map<std::string, size_t> index_;
};

// A fresh catalog of the standard assistant tools
inline ToolCatalog default_tool_catalog() {
    ToolCatalog catalog;
    catalog.add({"web_search", "web", "Search the web", ToolRisk::Safe,
                 ObservationType::ToolReturn, 1.0f, 3600});
    catalog.add({"read_url", "web", "Fetch and extract a web page", ToolRisk::Safe,
                 ObservationType::ToolReturn, 1.0f, 7200});
    catalog.add({"python_exec", "compute", "Run a Python snippet", ToolRisk::Safe,
                 ObservationType::ToolReturn, 1.0f, std::nullopt});
    catalog.add({"Bash", "compute", "Run a shell command", ToolRisk::Medium,
                 ObservationType::ToolReturn, 0.9f, std::nullopt});
    catalog.add({"Read", "filesystem", "Read a local file", ToolRisk::Safe,
                 ObservationType::ToolReturn, 1.0f, std::nullopt});
    catalog.add({"Glob", "filesystem", "List files matching a pattern", ToolRisk::Safe,
                 ObservationType::ToolReturn, 1.0f, std::nullopt});
    catalog.add({"ask_user", "interaction", "Ask the user a question", ToolRisk::Safe,
                 ObservationType::UserInput, 0.8f, std::nullopt});
    return catalog;
}

// ═══════════════════════════════════════════════════════════════════════════
// Execution results
// ═══════════════════════════════════════════════════════════════════════════

struct ToolResult {
    std::string content;            // Full raw result
    Observation observation;        // Provenance record
    bool success = true;
    std::optional<std::string> error_message;

    static ToolResult from_success(const std::string& content,
                                   const std::string& tool_name,
                                   float confidence = 1.0f,
                                   std::optional<int64_t> ttl_seconds = std::nullopt,
                                   const std::string& scope = "",
                                   const json& metadata = json::object(),
                                   ObservationType source_type = ObservationType::ToolReturn)
    {
        ToolResult r;
        r.content = content;
        r.observation = Observation(source_type, tool_name,
                                    excerpt(content, MAX_OBSERVATION_CONTENT), confidence);
        r.observation.ttl_seconds = ttl_seconds;
        r.observation.scope = scope;
        if (metadata.is_object()) r.observation.metadata = metadata;
        return r;
    }

    // Provenance policy taken from the catalog entry
    static ToolResult from_success(const std::string& content, const ToolSpec& spec,
                                   const std::string& scope = "",
                                   const json& metadata = json::object())
    {
        return from_success(content, spec.name, spec.success_confidence, spec.ttl_seconds,
                            scope, metadata, spec.source_type);
    }

    // A failure is still an observation, one nobody should trust
    static ToolResult from_error(const std::string& message, const std::string& tool_name) {
        ToolResult r;
        r.content = message;
        r.observation = Observation(ObservationType::ToolReturn, tool_name,
                                    "tool execution failed: " + message, 0.0f);
        r.observation.scope = "error";
        r.observation.metadata = {{"error", message}};
        r.success = false;
        r.error_message = message;
        return r;
    }
};

// Plain(text) | WithProvenance(ToolResult)
using ExecutionOutcome = std::variant<std::string, ToolResult>;

inline bool outcome_failed(const ExecutionOutcome& outcome) {
    const auto* result = std::get_if<ToolResult>(&outcome);
    return result && !result->success;
}

// Text the model should see for this outcome
inline const std::string& outcome_text(const ExecutionOutcome& outcome) {
    if (const auto* result = std::get_if<ToolResult>(&outcome)) return result->content;
    return std::get<std::string>(outcome);
}

// Append the outcome's observation to the ledger; returns its id.
// Plain text is wrapped using the catalog's policy for the tool when known.
inline std::string record_outcome(ProvenanceRegistry& registry,
                                  const std::string& tool_name,
                                  const ExecutionOutcome& outcome,
                                  const ToolCatalog* catalog = nullptr)
{
    if (const auto* result = std::get_if<ToolResult>(&outcome)) {
        return registry.add_observation(result->observation);
    }

    const std::string& text = std::get<std::string>(outcome);
    const ToolSpec* spec = catalog ? catalog->get(tool_name) : nullptr;
    ToolResult wrapped = spec ? ToolResult::from_success(text, *spec)
                              : ToolResult::from_success(text, tool_name);
    return registry.add_observation(std::move(wrapped.observation));
}

// ═══════════════════════════════════════════════════════════════════════════
// Retry policy (consulted by the orchestration loop, not by this library)
// ═══════════════════════════════════════════════════════════════════════════

struct RetryPolicy {
    int max_attempts = 3;           // Including the first
    int64_t base_delay_ms = 500;
    float multiplier = 2.0f;
    int64_t max_delay_ms = 8000;

    // attempt is 1-based: the attempt that just finished
    bool should_retry(int attempt, const ExecutionOutcome& outcome) const {
        return outcome_failed(outcome) && attempt < max_attempts;
    }

    // Delay before attempt+1
    int64_t delay_for(int attempt) const {
        double delay = static_cast<double>(base_delay_ms);
        for (int i = 1; i < attempt; ++i) {
            delay *= multiplier;
            if (delay >= static_cast<double>(max_delay_ms)) return max_delay_ms;
        }
        return std::min<int64_t>(static_cast<int64_t>(delay), max_delay_ms);
    }
};

} // namespace canary
