#pragma once
// Claim Extractor: free text -> auditable claims
//
// Splits generated text into sentence-like units and classifies each by
// the evidence it cites:
//   cites [obs-id] and uses fact language       -> FACT
//   reasoning language ("therefore", "I infer") -> INFERENCE
//   speculative language ("perhaps", "if..then")-> HYPOTHESIS
//   cites [obs-id] without other markers        -> FACT
//   anything else                               -> HYPOTHESIS
//
// The last rule is the safety net: an unsupported, unmarked assertion is
// never promoted to FACT.
//
// libstdc++ regex matching recurses per character, so the phrase patterns
// only see the first max_classify_chars of a sentence. References are
// collected from the whole sentence.

#include "observation.hpp"
#include "policy.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <regex>
#include <string>
#include <vector>

namespace canary {

struct ExtractedClaim {
    std::string statement;
    ClaimType claim_type = ClaimType::Hypothesis;
    std::vector<std::string> observation_refs;   // Cited observation ids
    std::string confidence_hint;                 // "high" | "medium" | "low"
};

class ClaimExtractor {
public:
    explicit ClaimExtractor(ExtractorPolicy policy = {})
        : policy_(policy),
          fact_re_(join(fact_patterns()), std::regex::ECMAScript | std::regex::icase),
          inference_re_(join(inference_patterns()), std::regex::ECMAScript | std::regex::icase),
          hypothesis_re_(join(hypothesis_patterns()), std::regex::ECMAScript | std::regex::icase),
          ref_re_(R"(\[(\w{8})\])") {}

    const ExtractorPolicy& policy() const { return policy_; }

    std::vector<ExtractedClaim> extract_claims(const std::string& text) const {
        std::vector<ExtractedClaim> claims;
        for (const auto& unit : split_sentences(text)) {
            if (utf8_length(unit) < policy_.min_unit_chars) continue;
            if (!is_meaningful_claim(unit)) continue;
            claims.push_back(analyze(unit));
        }
        return claims;
    }

    // Classify one sentence; no filtering
    ExtractedClaim analyze(const std::string& sentence) const {
        ExtractedClaim claim;
        claim.statement = sentence;
        claim.observation_refs = find_refs(sentence);
        claim.claim_type = classify(excerpt(sentence, policy_.max_classify_chars),
                                    claim.observation_refs);
        claim.confidence_hint = confidence_hint(claim.claim_type, claim.observation_refs);
        return claim;
    }

    // Extract step always recorded; inference and hypothesis add a
    // penalised infer step. Confidence computed against the ledger.
    Claim build_claim(const ExtractedClaim& extracted,
                      const ObservationMap& observations,
                      Timestamp at) const {
        Claim claim;
        claim.statement = extracted.statement;
        claim.claim_type = extracted.claim_type;
        claim.source_observations = extracted.observation_refs;

        claim.transform_chain.emplace_back(
            TransformOp::Extract, "extract information from observations",
            extracted.observation_refs, policy_.extract_delta);

        if (extracted.claim_type == ClaimType::Inference) {
            claim.transform_chain.emplace_back(
                TransformOp::Infer, "logical inference from observations",
                extracted.observation_refs, policy_.inference_delta);
        } else if (extracted.claim_type == ClaimType::Hypothesis) {
            claim.transform_chain.emplace_back(
                TransformOp::Infer, "speculative hypothesis",
                extracted.observation_refs, policy_.hypothesis_delta);
        }

        claim.update_confidence(observations, at);
        return claim;
    }

    Claim build_claim(const ExtractedClaim& extracted,
                      const ProvenanceRegistry& registry) const {
        return build_claim(extracted, registry.observations(), registry.now());
    }

    std::vector<Claim> extract_and_build(const std::string& text,
                                         const ProvenanceRegistry& registry) const {
        Timestamp at = registry.now();
        std::vector<Claim> claims;
        for (const auto& extracted : extract_claims(text)) {
            claims.push_back(build_claim(extracted, registry.observations(), at));
        }
        return claims;
    }

    // Sentence-terminal punctuation and newlines end a unit. Full-width
    // terminators are consumed; ASCII ones stay attached when followed by
    // whitespace.
    static std::vector<std::string> split_sentences(const std::string& text) {
        static const char* wide_terminators[] = {"\xE3\x80\x82",   // 。
                                                 "\xEF\xBC\x81",   // ！
                                                 "\xEF\xBC\x9F"};  // ？
        std::vector<std::string> units;
        std::string current;

        auto flush = [&]() {
            std::string t = trim(current);
            if (!t.empty()) units.push_back(t);
            current.clear();
        };

        size_t i = 0;
        while (i < text.size()) {
            char c = text[i];
            if (c == '\n') {
                flush();
                ++i;
                continue;
            }

            bool wide = false;
            for (const char* term : wide_terminators) {
                if (text.compare(i, 3, term) == 0) {
                    wide = true;
                    break;
                }
            }
            if (wide) {
                flush();
                i += 3;
                continue;
            }

            current += c;
            ++i;

            if ((c == '.' || c == '!' || c == '?') && i < text.size() &&
                (text[i] == ' ' || text[i] == '\t' || text[i] == '\r' || text[i] == '\n')) {
                flush();
                while (i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '\r')) ++i;
            }
        }
        flush();
        return units;
    }

private:
    // Labelled citations ("[obs ...]", "[观测...]") count as fact language;
    // bare [id] tokens are references, handled separately.
    static std::vector<std::string> fact_patterns() {
        return {
            R"(\baccording to\b)",
            R"(\b(search )?results (show|indicate)\b)",
            R"(\bdata (indicates|shows|suggests)\b)",
            R"(\bobserved (that|in)\b)",
            R"(\[obs\W?\w+\])",
            "\xE6\xA0\xB9\xE6\x8D\xAE.*?(,|\xEF\xBC\x8C)",          // 根据...，
            "\xE6\x90\x9C\xE7\xB4\xA2\xE7\xBB\x93\xE6\x9E\x9C\xE6\x98\xBE\xE7\xA4\xBA",  // 搜索结果显示
            "\\[\xE8\xA7\x82\xE6\xB5\x8B[^\\]]+\\]",                 // [观测...]
            "\xE6\x95\xB0\xE6\x8D\xAE\xE8\xA1\xA8\xE6\x98\x8E",     // 数据表明
            "\xE7\xBB\x93\xE6\x9E\x9C\xE6\x98\xBE\xE7\xA4\xBA",     // 结果显示
        };
    }

    static std::vector<std::string> inference_patterns() {
        return {
            R"(\bI infer\b)",
            R"(\btherefore\b)",
            R"(\bit follows that\b)",
            R"(\bwe can conclude\b)",
            R"(\bthis (shows|implies) that\b)",
            R"(\bbased on .*?\b(I|we) (conclude|deduce)\b)",
            "\xE6\x88\x91\xE6\x8E\xA8\xE6\x96\xAD",                 // 我推断
            "\xE7\x94\xB1\xE6\xAD\xA4\xE5\x8F\xAF\xE8\xA7\x81",     // 由此可见
            "\xE5\x9F\xBA\xE4\xBA\x8E.*?\xE6\x8E\xA8\xE6\xB5\x8B",  // 基于...推测
            "\xE5\x9B\xA0\xE6\xAD\xA4",                             // 因此
            "\xE5\x8F\xAF\xE4\xBB\xA5\xE5\xBE\x97\xE5\x87\xBA",     // 可以得出
        };
    }

    static std::vector<std::string> hypothesis_patterns() {
        return {
            R"(\bif\b.*?\bthen\b)",
            R"(\bassuming\b)",
            R"(\bpossibly\b)",
            R"(\bperhaps\b)",
            R"(\bmaybe\b)",
            R"(\bmight\b)",
            "\xE5\xA6\x82\xE6\x9E\x9C.*?\xE9\x82\xA3\xE4\xB9\x88",  // 如果...那么
            "\xE5\x81\x87\xE8\xAE\xBE",                             // 假设
            "\xE5\x8F\xAF\xE8\x83\xBD",                             // 可能
            "\xE6\x88\x96\xE8\xAE\xB8",                             // 或许
            "\xE6\x8E\xA8\xE6\xB5\x8B",                             // 推测
        };
    }

    static std::string join(const std::vector<std::string>& patterns) {
        std::string out;
        for (size_t i = 0; i < patterns.size(); ++i) {
            if (i) out += "|";
            out += "(?:" + patterns[i] + ")";
        }
        return out;
    }

    std::vector<std::string> find_refs(const std::string& sentence) const {
        std::vector<std::string> refs;
        for (auto it = std::sregex_iterator(sentence.begin(), sentence.end(), ref_re_);
             it != std::sregex_iterator(); ++it) {
            refs.push_back((*it)[1].str());
        }
        return refs;
    }

    ClaimType classify(const std::string& sentence,
                       const std::vector<std::string>& refs) const {
        if (!refs.empty() && std::regex_search(sentence, fact_re_)) return ClaimType::Fact;
        if (std::regex_search(sentence, inference_re_)) return ClaimType::Inference;
        if (std::regex_search(sentence, hypothesis_re_)) return ClaimType::Hypothesis;
        if (!refs.empty()) return ClaimType::Fact;
        return ClaimType::Hypothesis;
    }

    static std::string confidence_hint(ClaimType type, const std::vector<std::string>& refs) {
        if (type == ClaimType::Fact && !refs.empty()) return "high";
        if (type == ClaimType::Inference && !refs.empty()) return "medium";
        return "low";
    }

    // Questions, short fragments and formatting are not claims
    bool is_meaningful_claim(const std::string& sentence) const {
        if (ends_with(sentence, "?") || ends_with(sentence, "\xEF\xBC\x9F")) return false;
        if (utf8_length(sentence) < policy_.min_claim_chars) return false;
        if (sentence[0] == '#') return false;

        static const char* markers[] = {
            "\xE3\x80\x90", "\xE3\x80\x91",   // 【 】
            "---", "===",
            "\xE8\xBE\x93\xE5\x87\xBA\xE6\xA0\xBC\xE5\xBC\x8F",  // 输出格式
        };
        for (const char* m : markers) {
            if (sentence.find(m) != std::string::npos) return false;
        }
        if (ascii_lower(sentence).find("output format") != std::string::npos) return false;
        return true;
    }

    ExtractorPolicy policy_;
    std::regex fact_re_;
    std::regex inference_re_;
    std::regex hypothesis_re_;
    std::regex ref_re_;
};

} // namespace canary
