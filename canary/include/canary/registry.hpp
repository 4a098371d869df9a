#pragma once
// Provenance Registry: the session ledger of observations and claims
//
// Owns every Observation and Claim of one problem-solving session.
// Nothing is ever deleted during the session: expired observations stay
// in the ledger for audit and are only excluded by the validity filters.
//
// The degradation decision lives here because it is a pure function of
// what the ledger currently holds:
//   no valid observations                         -> REFUSE
//   mean >= full threshold, enough observations   -> FULL_ANSWER
//   mean >= partial threshold                     -> PARTIAL_WITH_UNCERTAINTY
//   otherwise                                     -> REQUEST_MORE_INFO

#include "observation.hpp"
#include "policy.hpp"
#include "types.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace canary {

using json = nlohmann::json;

// Ordered by severity
enum class DegradationLevel : uint8_t {
    FullAnswer = 0,              // High confidence, complete answer
    PartialWithUncertainty = 1,  // Medium confidence, with uncertainty note
    RequestMoreInfo = 2,         // Low confidence, ask for more observations
    Refuse = 3,                  // Nothing to stand on
};

inline const char* degradation_level_name(DegradationLevel level) {
    switch (level) {
        case DegradationLevel::FullAnswer: return "FULL_ANSWER";
        case DegradationLevel::PartialWithUncertainty: return "PARTIAL_WITH_UNCERTAINTY";
        case DegradationLevel::RequestMoreInfo: return "REQUEST_MORE_INFO";
        case DegradationLevel::Refuse: return "REFUSE";
    }
    return "REFUSE";
}

inline std::optional<DegradationLevel> parse_degradation_level(const std::string& name) {
    if (name == "FULL_ANSWER") return DegradationLevel::FullAnswer;
    if (name == "PARTIAL_WITH_UNCERTAINTY") return DegradationLevel::PartialWithUncertainty;
    if (name == "REQUEST_MORE_INFO") return DegradationLevel::RequestMoreInfo;
    if (name == "REFUSE") return DegradationLevel::Refuse;
    return std::nullopt;
}

class ProvenanceRegistry {
public:
    explicit ProvenanceRegistry(Clock clock = system_clock())
        : clock_(std::move(clock)) {}

    Timestamp now() const { return clock_(); }

    // ═══════════════════════════════════════════════════════════════════
    // Mutation
    // ═══════════════════════════════════════════════════════════════════

    // Stored unconditionally. Re-adding an id replaces the entry in place.
    std::string add_observation(Observation obs) {
        std::string id = obs.id;
        if (observations_.find(id) == observations_.end()) {
            observation_order_.push_back(id);
        }
        observations_[id] = std::move(obs);
        return id;
    }

    // Confidence is recomputed against the current ledger before storing
    std::string add_claim(Claim claim) {
        claim.update_confidence(observations_, clock_());
        std::string id = claim.id;
        if (claims_.find(id) == claims_.end()) {
            claim_order_.push_back(id);
        }
        claims_[id] = std::move(claim);
        return id;
    }

    // End of session
    void clear() {
        observations_.clear();
        observation_order_.clear();
        claims_.clear();
        claim_order_.clear();
    }

    // ═══════════════════════════════════════════════════════════════════
    // Lookup
    // ═══════════════════════════════════════════════════════════════════

    const Observation* get_observation(const std::string& id) const {
        auto it = observations_.find(id);
        return (it != observations_.end()) ? &it->second : nullptr;
    }

    const Claim* get_claim(const std::string& id) const {
        auto it = claims_.find(id);
        return (it != claims_.end()) ? &it->second : nullptr;
    }

    const ObservationMap& observations() const { return observations_; }

    size_t observation_count() const { return observations_.size(); }
    size_t claim_count() const { return claims_.size(); }

    // Every observation in insertion order, expired ones included
    std::vector<Observation> all_observations() const {
        std::vector<Observation> result;
        result.reserve(observation_order_.size());
        for (const auto& id : observation_order_) {
            result.push_back(observations_.at(id));
        }
        return result;
    }

    std::vector<Observation> observations_by_source(const std::string& source_id) const {
        std::vector<Observation> result;
        for (const auto& id : observation_order_) {
            const auto& obs = observations_.at(id);
            if (obs.source_id == source_id) result.push_back(obs);
        }
        return result;
    }

    std::vector<Observation> observations_by_type(ObservationType type) const {
        std::vector<Observation> result;
        for (const auto& id : observation_order_) {
            const auto& obs = observations_.at(id);
            if (obs.source_type == type) result.push_back(obs);
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Validity
    // ═══════════════════════════════════════════════════════════════════

    std::vector<Observation> get_valid_observations(float min_confidence = 0.0f) const {
        return get_valid_observations(min_confidence, clock_());
    }

    // Unexpired at `at` and at least min_confidence
    std::vector<Observation> get_valid_observations(float min_confidence, Timestamp at) const {
        std::vector<Observation> result;
        for (const auto& id : observation_order_) {
            const auto& obs = observations_.at(id);
            if (!obs.is_expired(at) && obs.confidence >= min_confidence) {
                result.push_back(obs);
            }
        }
        return result;
    }

    size_t valid_observation_count(float min_confidence = 0.0f) const {
        return get_valid_observations(min_confidence).size();
    }

    // Ids of observations expired right now. A query: nothing is removed.
    std::vector<std::string> invalidate_expired() const {
        return invalidate_expired(clock_());
    }

    std::vector<std::string> invalidate_expired(Timestamp at) const {
        std::vector<std::string> expired;
        for (const auto& id : observation_order_) {
            if (observations_.at(id).is_expired(at)) expired.push_back(id);
        }
        return expired;
    }

    // Claims at or above min_confidence, refreshed first; optionally one type
    std::vector<Claim> get_valid_claims(float min_confidence = 0.0f,
                                        std::optional<ClaimType> type = std::nullopt) {
        Timestamp at = clock_();
        std::vector<Claim> result;
        for (const auto& id : claim_order_) {
            auto& claim = claims_.at(id);
            claim.update_confidence(observations_, at);
            if (claim.confidence < min_confidence) continue;
            if (type && claim.claim_type != *type) continue;
            result.push_back(claim);
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Degradation
    // ═══════════════════════════════════════════════════════════════════

    DegradationLevel determine_degradation_level(
        size_t required_observations = defaults::min_observations_for_answer,
        float min_confidence = defaults::partial_answer_confidence) const
    {
        DegradationPolicy policy;
        policy.min_observations = required_observations;
        policy.partial_confidence = min_confidence;
        return determine_degradation_level(policy, clock_());
    }

    DegradationLevel determine_degradation_level(const DegradationPolicy& policy) const {
        return determine_degradation_level(policy, clock_());
    }

    DegradationLevel determine_degradation_level(const DegradationPolicy& policy,
                                                 Timestamp at) const {
        auto valid = get_valid_observations(0.0f, at);
        if (valid.empty()) return DegradationLevel::Refuse;

        float sum = 0.0f;
        for (const auto& obs : valid) sum += obs.confidence;
        float avg = sum / static_cast<float>(valid.size());

        if (avg >= policy.full_confidence && valid.size() >= policy.min_observations) {
            return DegradationLevel::FullAnswer;
        }
        if (avg >= policy.partial_confidence) {
            return DegradationLevel::PartialWithUncertainty;
        }
        return DegradationLevel::RequestMoreInfo;
    }

    // Digest of the freshest valid observations for prompt building
    std::string to_context(size_t max_observations = 5) const {
        Timestamp at = clock_();
        auto valid = get_valid_observations(0.0f, at);
        if (valid.empty()) return "[no valid observations]";

        std::stable_sort(valid.begin(), valid.end(),
            [](const Observation& a, const Observation& b) {
                return a.timestamp > b.timestamp;
            });
        if (valid.size() > max_observations) valid.resize(max_observations);

        std::ostringstream oss;
        oss << "[current observations]";
        for (const auto& obs : valid) {
            oss << "\n" << obs.to_context(at);
        }

        size_t expired = invalidate_expired(at).size();
        if (expired > 0) {
            oss << "\n\n(expired observations: " << expired << ")";
        }
        return oss.str();
    }

    // ═══════════════════════════════════════════════════════════════════
    // Export (audit only; the ledger itself is session-scoped)
    // ═══════════════════════════════════════════════════════════════════

    json to_json() const {
        json obs = json::object();
        for (const auto& id : observation_order_) {
            obs[id] = observations_.at(id).to_json();
        }
        json cls = json::object();
        for (const auto& id : claim_order_) {
            cls[id] = claims_.at(id).to_json();
        }
        return {
            {"format", {{"major", CANARY_LEDGER_FORMAT_MAJOR}, {"minor", CANARY_LEDGER_FORMAT_MINOR}}},
            {"observations", obs},
            {"claims", cls},
        };
    }

    // Malformed entries are skipped and logged. Claims keep their stored
    // confidence until the next refresh.
    static std::optional<ProvenanceRegistry> from_json(const json& j,
                                                       Clock clock = system_clock()) {
        if (!j.is_object()) return std::nullopt;

        if (auto it = j.find("format"); it != j.end()) {
            int major = -1, minor = -1;
            if (it->is_object()) {
                auto ma = it->find("major");
                auto mi = it->find("minor");
                if (ma != it->end() && ma->is_number_integer()) major = ma->get<int>();
                if (mi != it->end() && mi->is_number_integer()) minor = mi->get<int>();
            }
            if (!version::ledger_compatible(major, minor)) {
                std::cerr << "[ProvenanceRegistry] Unsupported ledger format "
                          << major << "." << minor << "\n";
                return std::nullopt;
            }
        }

        ProvenanceRegistry registry(std::move(clock));
        size_t skipped = 0;

        // JSON objects are keyed by id; restore chronological order
        std::vector<Observation> loaded_obs;
        if (auto it = j.find("observations"); it != j.end() && it->is_object()) {
            for (const auto& item : it->items()) {
                auto obs = Observation::from_json(item.value());
                if (!obs) {
                    ++skipped;
                    continue;
                }
                loaded_obs.push_back(std::move(*obs));
            }
        }
        std::stable_sort(loaded_obs.begin(), loaded_obs.end(),
            [](const Observation& a, const Observation& b) {
                return a.timestamp < b.timestamp;
            });
        for (auto& obs : loaded_obs) {
            registry.add_observation(std::move(obs));
        }

        std::vector<Claim> loaded_claims;
        if (auto it = j.find("claims"); it != j.end() && it->is_object()) {
            for (const auto& item : it->items()) {
                auto claim = Claim::from_json(item.value());
                if (!claim) {
                    ++skipped;
                    continue;
                }
                loaded_claims.push_back(std::move(*claim));
            }
        }
        std::stable_sort(loaded_claims.begin(), loaded_claims.end(),
            [](const Claim& a, const Claim& b) {
                return a.created_at < b.created_at;
            });
        for (auto& claim : loaded_claims) {
            std::string id = claim.id;
            if (registry.claims_.find(id) == registry.claims_.end()) {
                registry.claim_order_.push_back(id);
            }
            registry.claims_[id] = std::move(claim);
        }

        if (skipped > 0) {
            std::cerr << "[ProvenanceRegistry] Skipped " << skipped << " malformed entries\n";
        }
        return registry;
    }

private:
    Clock clock_;
    ObservationMap observations_;
    std::vector<std::string> observation_order_;
    std::unordered_map<std::string, Claim> claims_;
    std::vector<std::string> claim_order_;
};

} // namespace canary
