#pragma once
// Minimal Commitment: risk-gated tool admission
//
// Reversible actions are always preferred; a tool may run only once the
// session's confidence reaches the threshold of its risk tier.

#include "policy.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace canary {

enum class ToolRisk : uint8_t {
    Safe = 0,      // Read-only, no side effects
    Low = 1,       // Reversible side effects
    Medium = 2,    // Recoverable side effects
    High = 3,      // Irreversible side effects
};

inline const char* tool_risk_name(ToolRisk risk) {
    switch (risk) {
        case ToolRisk::Safe: return "SAFE";
        case ToolRisk::Low: return "LOW";
        case ToolRisk::Medium: return "MEDIUM";
        case ToolRisk::High: return "HIGH";
    }
    return "HIGH";
}

inline std::optional<ToolRisk> parse_tool_risk(const std::string& name) {
    if (name == "SAFE") return ToolRisk::Safe;
    if (name == "LOW") return ToolRisk::Low;
    if (name == "MEDIUM") return ToolRisk::Medium;
    if (name == "HIGH") return ToolRisk::High;
    return std::nullopt;
}

class MinimalCommitmentPolicy {
public:
    explicit MinimalCommitmentPolicy(CommitmentThresholds thresholds = {})
        : thresholds_(thresholds) {}

    float threshold(ToolRisk risk) const {
        switch (risk) {
            case ToolRisk::Safe: return thresholds_.safe;
            case ToolRisk::Low: return thresholds_.low;
            case ToolRisk::Medium: return thresholds_.medium;
            case ToolRisk::High: return thresholds_.high;
        }
        return 1.0f;
    }

    bool should_proceed(ToolRisk risk, float confidence) const {
        return confidence >= threshold(risk);
    }

    // Admissible tools, safest tier first, input order kept within a tier
    std::vector<std::string> rank_tools(
        const std::vector<std::pair<std::string, ToolRisk>>& tools,
        float confidence) const
    {
        std::vector<std::pair<std::string, ToolRisk>> allowed;
        for (const auto& tool : tools) {
            if (should_proceed(tool.second, confidence)) allowed.push_back(tool);
        }

        std::stable_sort(allowed.begin(), allowed.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });

        std::vector<std::string> names;
        names.reserve(allowed.size());
        for (const auto& [name, _] : allowed) names.push_back(name);
        return names;
    }

private:
    CommitmentThresholds thresholds_;
};

} // namespace canary
