#pragma once
// Cognitive State: running counters of one problem-solving session
//
// Minimal by intent: only what the strategy gate branches on. The agent
// loop owns the instance and mutates it once per iteration.

#include "policy.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace canary {

using json = nlohmann::json;

struct CognitiveState {
    float confidence = defaults::initial_confidence;   // [0, 1]
    std::vector<std::string> uncertainties;            // Insertion-ordered, unique

    int iteration_count = 0;
    int stall_count = 0;             // Consecutive iterations without progress

    std::string last_action_type;
    std::string last_tool_used;

    std::string goal_statement;
    std::string current_hypothesis;

    int observation_count = 0;
    float observation_confidence_sum = 0.0f;
    bool has_tool_observations = false;

    CognitiveState() = default;
    explicit CognitiveState(std::string goal) : goal_statement(std::move(goal)) {}

    // Non-finite values count as no confidence
    void update_confidence(float value) {
        confidence = std::isfinite(value) ? std::clamp(value, 0.0f, 1.0f) : 0.0f;
    }

    void add_uncertainty(const std::string& uncertainty) {
        if (std::find(uncertainties.begin(), uncertainties.end(), uncertainty) == uncertainties.end()) {
            uncertainties.push_back(uncertainty);
        }
    }

    void remove_uncertainty(const std::string& uncertainty) {
        uncertainties.erase(
            std::remove(uncertainties.begin(), uncertainties.end(), uncertainty),
            uncertainties.end());
    }

    void increment_iteration() { iteration_count++; }

    void mark_progress() { stall_count = 0; }

    void mark_stall() { stall_count++; }

    bool has_stalled(int threshold = defaults::stall_threshold) const {
        return stall_count >= threshold;
    }

    void record_observation(float obs_confidence) {
        observation_count++;
        observation_confidence_sum += obs_confidence;
        has_tool_observations = true;
    }

    float average_observation_confidence() const {
        if (observation_count == 0) return 0.0f;
        return observation_confidence_sum / static_cast<float>(observation_count);
    }

    // Short digest for prompt injection; empty when nothing is noteworthy
    std::string to_context() const {
        std::vector<std::string> lines;

        if (confidence < 0.5f) {
            lines.push_back("Current confidence is low (" + percent(confidence) + ")");
        }

        if (!uncertainties.empty()) {
            std::string shown = uncertainties[0];
            if (uncertainties.size() > 1) shown += ", " + uncertainties[1];
            lines.push_back("Uncertain areas: " + shown);
        }

        if (stall_count >= 2) {
            lines.push_back("Progress is slow; consider switching strategy");
        }

        if (observation_count == 0 && iteration_count > 0) {
            lines.push_back("Note: no observations have been gathered yet");
        } else if (observation_count > 0) {
            float avg = average_observation_confidence();
            if (avg < 0.6f) {
                lines.push_back("Observation confidence is low (" + percent(avg) + ")");
            }
        }

        std::ostringstream oss;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i) oss << "\n";
            oss << lines[i];
        }
        return oss.str();
    }

    json to_json() const {
        return {
            {"confidence", confidence},
            {"uncertainties", uncertainties},
            {"iteration_count", iteration_count},
            {"stall_count", stall_count},
            {"goal_statement", goal_statement},
            {"observation_count", observation_count},
            {"average_observation_confidence", average_observation_confidence()},
        };
    }
};

} // namespace canary
