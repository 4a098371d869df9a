// Canary test suite

#include <canary/canary.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>

using namespace canary;

// 2023-11-14T22:13:20Z
constexpr Timestamp T0 = 1700000000000;

bool near(float a, float b) {
    return std::fabs(a - b) < 1e-5f;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Observation make_obs(const std::string& id, float confidence, Timestamp at,
                     std::optional<int64_t> ttl = std::nullopt,
                     const std::string& source = "web_search") {
    Observation obs(ObservationType::ToolReturn, source, "content of " + id, confidence, at);
    obs.id = id;
    obs.ttl_seconds = ttl;
    return obs;
}

void test_timestamps() {
    std::cout << "Testing Timestamps..." << std::endl;

    assert(format_timestamp(0) == "1970-01-01T00:00:00.000Z");
    assert(format_timestamp(T0 + 250) == "2023-11-14T22:13:20.250Z");
    assert(format_timestamp(T0 + 250).substr(11, 12) == "22:13:20.250");   // CLI log stamp

    assert(parse_timestamp("2023-11-14T22:13:20.250Z") == T0 + 250);
    assert(parse_timestamp("2023-11-14T22:13:20.25") == T0 + 250);
    assert(parse_timestamp("2023-11-14T22:13:20.250123") == T0 + 250);
    assert(parse_timestamp("2023-11-14T22:13:20") == T0);
    assert(!parse_timestamp("yesterday").has_value());
    assert(!parse_timestamp("2023-11-14T22:13:20+junk").has_value());

    std::string id = generate_id();
    assert(id.size() == 8);
    assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_text_helpers() {
    std::cout << "Testing Text helpers..." << std::endl;

    assert(utf8_length("abc") == 3);
    assert(utf8_length("数据") == 2);
    assert(excerpt("abcdef", 3) == "abc");
    assert(excerpt("数据表明", 2) == "数据");
    assert(excerpt("ab", 10) == "ab");
    assert(trim("  x y \n") == "x y");
    assert(ascii_lower("Missing DATA") == "missing data");
    assert(percent(0.85f) == "85%");

    std::cout << "  PASS" << std::endl;
}

void test_observation_confidence() {
    std::cout << "Testing Observation confidence..." << std::endl;

    Observation high(ObservationType::ToolReturn, "web_search", "x", 1.7f, T0);
    assert(high.confidence == 1.0f);

    Observation low(ObservationType::ToolReturn, "web_search", "x", -0.5f, T0);
    assert(low.confidence == 0.0f);

    Observation tool(ObservationType::ToolReturn, "web_search", "x");
    assert(tool.confidence == 1.0f);

    Observation user(ObservationType::UserInput, "user", "x");
    assert(user.confidence == defaults::user_input_confidence);

    // An explicit value is kept, even 1.0
    Observation trusted(ObservationType::UserInput, "user", "x", 1.0f);
    assert(trusted.confidence == 1.0f);

    // Non-finite values fall back to the source default
    Observation nan_tool(ObservationType::ToolReturn, "web_search", "x", std::nanf(""), T0);
    assert(nan_tool.confidence == 1.0f);
    Observation inf_user(ObservationType::UserInput, "user", "x", HUGE_VALF, T0);
    assert(inf_user.confidence == defaults::user_input_confidence);

    Observation a(ObservationType::DefinedRule, "rule", "x");
    Observation b(ObservationType::DefinedRule, "rule", "x");
    assert(a.id != b.id);

    std::cout << "  PASS" << std::endl;
}

void test_observation_expiry() {
    std::cout << "Testing Observation expiry..." << std::endl;

    Observation obs = make_obs("aaaa0001", 1.0f, T0, 60);
    assert(!obs.is_expired(T0));
    assert(!obs.is_expired(T0 + 60000));   // Exactly at TTL is still valid
    assert(obs.is_expired(T0 + 60001));

    // Once expired, stays expired
    bool seen = false;
    for (Timestamp t = T0; t < T0 + 200000; t += 7000) {
        bool expired = obs.is_expired(t);
        if (seen) assert(expired);
        seen = seen || expired;
    }
    assert(seen);

    assert(obs.remaining_ttl(T0 + 10000) == 50);
    assert(obs.remaining_ttl(T0 + 120000) == 0);

    Observation forever = make_obs("aaaa0002", 1.0f, T0);
    assert(!forever.is_expired(T0 + 1000LL * 3600 * 24 * 365));
    assert(!forever.remaining_ttl(T0).has_value());

    std::string ctx = obs.to_context(T0 + 10000);
    assert(contains(ctx, "[aaaa0001] source: tool return (web_search)"));
    assert(contains(ctx, "confidence: 100%"));
    assert(contains(ctx, "expires in: 50s"));
    assert(!contains(forever.to_context(T0), "expires in"));

    // TTL near the int64 limit never wraps into the past
    json long_lived = make_obs("aaaa0003", 1.0f, T0).to_json();
    long_lived["ttl_seconds"] = 9000000000000000000LL;
    auto loaded = Observation::from_json(long_lived);
    assert(loaded.has_value());
    assert(!loaded->is_expired(T0));
    assert(!loaded->is_expired(T0 + 1000LL * 3600 * 24 * 365 * 100));
    assert(*loaded->remaining_ttl(T0) == 9000000000000000000LL);

    Timestamp t = T0 + 1000;
    ProvenanceRegistry registry([&t] { return t; });
    registry.add_observation(*loaded);
    assert(registry.invalidate_expired().empty());
    assert(registry.determine_degradation_level() == DegradationLevel::FullAnswer);

    // Sub-second ages around the boundary
    Observation brief = make_obs("aaaa0004", 1.0f, T0, 0);
    assert(!brief.is_expired(T0));
    assert(brief.is_expired(T0 + 1));
    assert(!brief.is_expired(T0 - 500));

    std::cout << "  PASS" << std::endl;
}

void test_transform_step() {
    std::cout << "Testing TransformStep..." << std::endl;

    TransformStep step(TransformOp::Infer, "guess", {"aaaa0001"}, -3.0f);
    assert(step.confidence_delta == -1.0f);

    TransformStep undefined(TransformOp::Infer, "guess", {}, std::nanf(""));
    assert(undefined.confidence_delta == 0.0f);

    json j = step.to_json();
    assert(j["operation"] == "infer");

    auto back = TransformStep::from_json(j);
    assert(back.has_value());
    assert(back->operation == TransformOp::Infer);
    assert(back->input_ids.size() == 1);

    json bad = j;
    bad["operation"] = "teleport";
    assert(!TransformStep::from_json(bad).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_claim_weakest_link() {
    std::cout << "Testing Claim weakest-link confidence..." << std::endl;

    ObservationMap observations;
    observations.emplace("aaaa0001", make_obs("aaaa0001", 0.9f, T0));
    observations.emplace("aaaa0002", make_obs("aaaa0002", 0.6f, T0, 60));

    Claim claim;
    claim.statement = "combined";
    claim.claim_type = ClaimType::Inference;
    claim.source_observations = {"aaaa0001", "aaaa0002", "missing1"};
    claim.transform_chain.emplace_back(TransformOp::Extract, "extract", claim.source_observations, 0.0f);
    claim.transform_chain.emplace_back(TransformOp::Infer, "infer", claim.source_observations, -0.1f);

    float conf = claim.compute_confidence(observations, T0);
    assert(conf <= 0.6f);
    assert(near(conf, 0.5f));

    // Once the weaker source expires only the stronger one counts
    conf = claim.compute_confidence(observations, T0 + 61000);
    assert(near(conf, 0.8f));

    // No valid sources left
    Claim orphan;
    orphan.source_observations = {"missing1"};
    assert(orphan.compute_confidence(observations, T0) == 0.0f);

    Claim unsupported;
    assert(unsupported.compute_confidence(observations, T0) == 0.0f);

    // Positive deltas are clamped
    Claim boosted;
    boosted.source_observations = {"aaaa0001"};
    boosted.transform_chain.emplace_back(TransformOp::Combine, "corroborate",
                                         boosted.source_observations, 0.5f);
    assert(boosted.compute_confidence(observations, T0) == 1.0f);

    claim.update_confidence(observations, T0);
    std::string trail = claim.audit_trail();
    assert(contains(trail, "Claim: combined"));
    assert(contains(trail, "Type: inference"));
    assert(contains(trail, "Reasoning chain:"));
    assert(contains(trail, "2. [infer] infer"));
    assert(contains(trail, "confidence delta: -0.10"));

    std::cout << "  PASS" << std::endl;
}

void test_registry_refuse_when_empty() {
    std::cout << "Testing Registry empty ledger..." << std::endl;

    ProvenanceRegistry registry;
    assert(registry.determine_degradation_level() == DegradationLevel::Refuse);
    assert(registry.determine_degradation_level(0, 0.0f) == DegradationLevel::Refuse);
    assert(registry.to_context() == "[no valid observations]");
    assert(registry.get_valid_claims().empty());

    std::cout << "  PASS" << std::endl;
}

void test_registry_degradation_levels() {
    std::cout << "Testing Registry degradation levels..." << std::endl;

    Timestamp t = T0;
    ProvenanceRegistry registry([&t] { return t; });
    registry.add_observation(make_obs("aaaa0001", 1.0f, T0, 86400));
    registry.add_observation(make_obs("aaaa0002", 1.0f, T0, 86400));
    registry.add_observation(make_obs("aaaa0003", 1.0f, T0, 86400));

    assert(registry.determine_degradation_level(3) == DegradationLevel::FullAnswer);
    assert(registry.determine_degradation_level(1) == DegradationLevel::FullAnswer);
    // High confidence but too few observations
    assert(registry.determine_degradation_level(4) == DegradationLevel::PartialWithUncertainty);

    ProvenanceRegistry weak([&t] { return t; });
    weak.add_observation(make_obs("bbbb0001", 0.6f, T0));
    assert(weak.determine_degradation_level() == DegradationLevel::PartialWithUncertainty);

    ProvenanceRegistry weaker([&t] { return t; });
    weaker.add_observation(make_obs("cccc0001", 0.3f, T0));
    assert(weaker.determine_degradation_level() == DegradationLevel::RequestMoreInfo);

    DegradationPolicy strict;
    strict.full_confidence = 0.95f;
    assert(weak.determine_degradation_level(strict) == DegradationLevel::PartialWithUncertainty);

    // A day later everything has expired
    t = T0 + 1000LL * 86401;
    assert(registry.determine_degradation_level() == DegradationLevel::Refuse);

    std::cout << "  PASS" << std::endl;
}

void test_registry_invalidate_expired_keeps_entries() {
    std::cout << "Testing Registry expiry is a query..." << std::endl;

    Timestamp t = T0;
    ProvenanceRegistry registry([&t] { return t; });
    registry.add_observation(make_obs("aaaa0001", 1.0f, T0, 10));
    registry.add_observation(make_obs("aaaa0002", 0.7f, T0));

    assert(registry.invalidate_expired().empty());
    assert(registry.valid_observation_count() == 2);

    t = T0 + 20000;
    auto expired = registry.invalidate_expired();
    assert(expired.size() == 1);
    assert(expired[0] == "aaaa0001");

    // Still in the ledger, just not valid
    assert(registry.observation_count() == 2);
    assert(registry.get_observation("aaaa0001") != nullptr);
    assert(registry.all_observations().size() == 2);
    assert(registry.valid_observation_count() == 1);
    assert(registry.get_valid_observations(0.8f).empty());

    // Asking again gives the same answer
    assert(registry.invalidate_expired().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_registry_lookup() {
    std::cout << "Testing Registry lookup..." << std::endl;

    Timestamp t = T0;
    ProvenanceRegistry registry([&t] { return t; });
    registry.add_observation(make_obs("aaaa0001", 1.0f, T0, std::nullopt, "web_search"));
    registry.add_observation(make_obs("aaaa0002", 1.0f, T0 + 1, std::nullopt, "Read"));
    registry.add_observation(Observation(ObservationType::UserInput, "user", "I use Linux",
                                         std::nullopt, T0 + 2));
    registry.add_observation(make_obs("aaaa0004", 0.5f, T0 + 3, std::nullopt, "web_search"));

    assert(registry.observation_count() == 4);
    assert(registry.get_observation("nope0000") == nullptr);
    assert(registry.observations_by_source("web_search").size() == 2);
    assert(registry.observations_by_type(ObservationType::UserInput).size() == 1);

    auto all = registry.all_observations();
    assert(all[0].id == "aaaa0001");
    assert(all[3].id == "aaaa0004");

    // Same id replaces in place
    registry.add_observation(make_obs("aaaa0001", 0.2f, T0, std::nullopt, "web_search"));
    assert(registry.observation_count() == 4);
    assert(registry.get_observation("aaaa0001")->confidence == 0.2f);
    assert(registry.all_observations()[0].id == "aaaa0001");

    Claim fact;
    fact.statement = "fact";
    fact.claim_type = ClaimType::Fact;
    fact.source_observations = {"aaaa0002"};
    fact.confidence = 0.0f;    // Recomputed on add
    std::string fact_id = registry.add_claim(fact);
    assert(registry.get_claim(fact_id)->confidence == 1.0f);

    Claim guess;
    guess.statement = "guess";
    guess.claim_type = ClaimType::Hypothesis;
    guess.source_observations = {"aaaa0004"};
    guess.transform_chain.emplace_back(TransformOp::Infer, "guess", guess.source_observations, -0.3f);
    registry.add_claim(guess);

    assert(registry.claim_count() == 2);
    assert(registry.get_valid_claims().size() == 2);
    assert(registry.get_valid_claims(0.5f).size() == 1);
    assert(registry.get_valid_claims(0.0f, ClaimType::Hypothesis).size() == 1);
    assert(registry.get_valid_claims(0.0f, ClaimType::Inference).empty());

    registry.clear();
    assert(registry.observation_count() == 0);
    assert(registry.claim_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_registry_context() {
    std::cout << "Testing Registry context..." << std::endl;

    Timestamp t = T0 + 100000;
    ProvenanceRegistry registry([&t] { return t; });
    for (int i = 0; i < 6; ++i) {
        registry.add_observation(make_obs("ctx0000" + std::to_string(i), 1.0f, T0 + i * 1000));
    }
    registry.add_observation(make_obs("old00000", 1.0f, T0, 1));

    std::string ctx = registry.to_context();
    assert(ctx.rfind("[current observations]", 0) == 0);
    // Newest first, capped at five
    assert(contains(ctx, "[ctx00005]"));
    assert(contains(ctx, "[ctx00001]"));
    assert(!contains(ctx, "[ctx00000]"));
    assert(ctx.find("[ctx00005]") < ctx.find("[ctx00004]"));
    assert(!contains(ctx, "[old00000]"));
    assert(contains(ctx, "(expired observations: 1)"));

    assert(!contains(registry.to_context(2), "[ctx00003]"));

    std::cout << "  PASS" << std::endl;
}

void test_extractor_classification() {
    std::cout << "Testing ClaimExtractor classification..." << std::endl;

    ClaimExtractor extractor;

    auto facts = extractor.extract_claims(
        "According to the search results [a1b2c3d4], the capital of France is Paris.");
    assert(facts.size() == 1);
    assert(facts[0].claim_type == ClaimType::Fact);
    assert(facts[0].confidence_hint == "high");
    assert(facts[0].observation_refs.size() == 1);
    assert(facts[0].observation_refs[0] == "a1b2c3d4");

    auto hypotheses = extractor.extract_claims("Perhaps the market will recover next quarter.");
    assert(hypotheses.size() == 1);
    assert(hypotheses[0].claim_type == ClaimType::Hypothesis);
    assert(hypotheses[0].confidence_hint == "low");
    assert(hypotheses[0].observation_refs.empty());

    auto inference = extractor.analyze("Therefore the service is down for all users [deadbeef].");
    assert(inference.claim_type == ClaimType::Inference);
    assert(inference.confidence_hint == "medium");

    auto bare_inference = extractor.analyze("Therefore the service is down for all users.");
    assert(bare_inference.claim_type == ClaimType::Inference);
    assert(bare_inference.confidence_hint == "low");

    // A cited sentence without other markers is still a fact
    auto cited = extractor.analyze("The server responded with status 503 [0badc0de].");
    assert(cited.claim_type == ClaimType::Fact);
    assert(cited.confidence_hint == "high");

    // Unsupported and unmarked is never promoted
    auto plain = extractor.analyze("The quarterly revenue grew by twelve percent.");
    assert(plain.claim_type == ClaimType::Hypothesis);
    assert(plain.confidence_hint == "low");

    // Fact language without a reference is not enough
    auto unreferenced = extractor.analyze("According to experts the sky is green.");
    assert(unreferenced.claim_type == ClaimType::Hypothesis);

    auto zh = extractor.extract_claims("这个服务可能会在明天早上恢复正常运行");
    assert(zh.size() == 1);
    assert(zh[0].claim_type == ClaimType::Hypothesis);

    auto zh_inference = extractor.analyze("因此我们需要重新部署整个集群 [cafe0001]");
    assert(zh_inference.claim_type == ClaimType::Inference);

    // Malformed references are ignored
    assert(extractor.analyze("See [abc] and [toolongreference] for the details").observation_refs.empty());

    std::cout << "  PASS" << std::endl;
}

void test_extractor_filters() {
    std::cout << "Testing ClaimExtractor filters..." << std::endl;

    ClaimExtractor extractor;
    std::string text =
        "# Heading that is long enough\n"
        "Is the server down right now for everyone?\n"
        "Too short.\n"
        "--- separator line that is long ---\n"
        "Output format: bullet points with sources\n"
        "The first sentence is long enough. The second sentence is long enough too!\n";

    auto claims = extractor.extract_claims(text);
    assert(claims.size() == 2);
    assert(claims[0].statement == "The first sentence is long enough.");
    assert(claims[1].statement == "The second sentence is long enough too!");

    auto units = ClaimExtractor::split_sentences("A b c. D e f\nG h");
    assert(units.size() == 3);
    assert(units[0] == "A b c.");
    assert(units[1] == "D e f");
    assert(units[2] == "G h");

    // Decimal points do not split
    assert(ClaimExtractor::split_sentences("Version 3.2 is out").size() == 1);
    assert(ClaimExtractor::split_sentences("第一句话。第二句话！第三句话").size() == 3);

    assert(extractor.extract_claims("").empty());

    std::cout << "  PASS" << std::endl;
}

void test_extractor_long_sentences() {
    std::cout << "Testing ClaimExtractor long sentences..." << std::endl;

    ClaimExtractor extractor;

    // ~200 KB single sentence with an open "if ... then"
    std::string hedge = "if " + std::string(200000, 'a') + " then done";
    auto claims = extractor.extract_claims(hedge);
    assert(claims.size() == 1);
    assert(claims[0].statement.size() == hedge.size());
    assert(claims[0].claim_type == ClaimType::Hypothesis);

    std::string words = "If";
    for (int i = 0; i < 40000; ++i) words += " word";
    words += " then ok";
    auto analyzed = extractor.analyze(words);
    assert(analyzed.claim_type == ClaimType::Hypothesis);
    assert(analyzed.statement == words);

    // Markers inside the window still classify; references anywhere count
    std::string cited = "According to the search results, " + std::string(100000, 'b') + " [a1b2c3d4]";
    auto fact = extractor.analyze(cited);
    assert(fact.observation_refs.size() == 1);
    assert(fact.claim_type == ClaimType::Fact);

    std::string reasoning = "Therefore " + std::string(150000, 'c');
    assert(extractor.analyze(reasoning).claim_type == ClaimType::Inference);

    std::string zh = "\xE5\x9B\xA0\xE6\xAD\xA4";   // 因此
    for (int i = 0; i < 30000; ++i) zh += "\xE6\x95\xB0";
    assert(extractor.analyze(zh).claim_type == ClaimType::Inference);

    std::cout << "  PASS" << std::endl;
}

void test_extractor_build_claim() {
    std::cout << "Testing ClaimExtractor build_claim..." << std::endl;

    Timestamp t = T0;
    ProvenanceRegistry registry([&t] { return t; });
    registry.add_observation(make_obs("a1b2c3d4", 1.0f, T0));

    ClaimExtractor extractor;

    Claim fact = extractor.build_claim(
        extractor.analyze("According to the search results [a1b2c3d4], Paris is the capital."), registry);
    assert(fact.claim_type == ClaimType::Fact);
    assert(fact.transform_chain.size() == 1);
    assert(fact.transform_chain[0].operation == TransformOp::Extract);
    assert(fact.confidence == 1.0f);

    Claim inference = extractor.build_claim(
        extractor.analyze("Therefore the capital is in Europe [a1b2c3d4]."), registry);
    assert(inference.transform_chain.size() == 2);
    assert(inference.transform_chain[1].operation == TransformOp::Infer);
    assert(near(inference.confidence, 0.9f));

    Claim hypothesis = extractor.build_claim(
        extractor.analyze("Perhaps the capital will move [a1b2c3d4]."), registry);
    assert(near(hypothesis.confidence, 0.7f));

    // Nothing cited: the extract step is still recorded
    Claim unsupported = extractor.build_claim(
        extractor.analyze("Perhaps the capital will move someday."), registry);
    assert(unsupported.transform_chain.size() == 2);
    assert(unsupported.transform_chain[0].input_ids.empty());
    assert(unsupported.confidence == 0.0f);

    auto claims = extractor.extract_and_build(
        "According to the search results [a1b2c3d4], Paris is the capital. "
        "Maybe it has always been the capital.", registry);
    assert(claims.size() == 2);
    assert(claims[0].confidence == 1.0f);
    assert(claims[1].confidence == 0.0f);

    // Custom penalties
    ExtractorPolicy harsh;
    harsh.inference_delta = -0.5f;
    ClaimExtractor strict(harsh);
    Claim penalised = strict.build_claim(
        strict.analyze("Therefore the capital is in Europe [a1b2c3d4]."), registry);
    assert(near(penalised.confidence, 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_grounded_answer_scenarios() {
    std::cout << "Testing GroundedAnswer scenarios..." << std::endl;

    Timestamp t = T0;
    GroundedAnswerGenerator generator;

    // Three solid observations
    ProvenanceRegistry solid([&t] { return t; });
    solid.add_observation(make_obs("aaaa0001", 1.0f, T0, std::nullopt, "web_search"));
    solid.add_observation(make_obs("aaaa0002", 1.0f, T0, std::nullopt, "read_url"));
    solid.add_observation(make_obs("aaaa0003", 1.0f, T0, std::nullopt, "Read"));

    GroundedAnswer full = generator.generate("X", solid);
    assert(full.degradation_level == DegradationLevel::FullAnswer);
    assert(full.content == "X");
    assert(full.observations_used.size() == 3);
    assert(full.limitations.empty());
    assert(full.suggested_actions.empty());
    std::string out = full.to_formatted_output();
    assert(out.rfind("[Full answer]\nX", 0) == 0);
    assert(!contains(out, "[Confidence assessment]"));

    // Empty ledger
    ProvenanceRegistry empty([&t] { return t; });
    GroundedAnswer refused = generator.generate("X", empty);
    assert(refused.degradation_level == DegradationLevel::Refuse);
    assert(refused.content == answer_text::refusal);
    assert(refused.content != "X");
    assert(refused.suggested_actions.size() == 2);
    assert(contains(refused.to_formatted_output(), "[Cannot answer]"));

    // One middling observation
    ProvenanceRegistry middling([&t] { return t; });
    middling.add_observation(make_obs("bbbb0001", 0.6f, T0));
    GroundedAnswer partial = generator.generate("X", middling);
    assert(partial.degradation_level == DegradationLevel::PartialWithUncertainty);
    assert(partial.content == std::string("X") + answer_text::uncertainty_disclaimer);
    assert(partial.suggested_actions.size() == 1);
    assert(contains(partial.limitations.back(), "single source"));

    // Middling but already cross-validated: no request for more data
    ProvenanceRegistry corroborated([&t] { return t; });
    corroborated.add_observation(make_obs("bbbb0002", 0.6f, T0, std::nullopt, "web_search"));
    corroborated.add_observation(make_obs("bbbb0003", 0.6f, T0, std::nullopt, "read_url"));
    corroborated.add_observation(make_obs("bbbb0004", 0.6f, T0, std::nullopt, "Read"));
    GroundedAnswer settled = generator.generate("X", corroborated);
    assert(settled.degradation_level == DegradationLevel::PartialWithUncertainty);
    assert(settled.suggested_actions.empty());
    assert(settled.limitations.empty());

    // One weak observation
    ProvenanceRegistry weak([&t] { return t; });
    weak.add_observation(make_obs("cccc0001", 0.3f, T0));
    GroundedAnswer limited = generator.generate("X", weak);
    assert(limited.degradation_level == DegradationLevel::RequestMoreInfo);
    assert(limited.content == std::string(answer_text::limited_preamble) + "X" +
                              answer_text::limited_postamble);
    assert(contains(limited.suggested_actions[0], "web_search"));

    std::cout << "  PASS" << std::endl;
}

void test_grounded_answer_claims_and_limits() {
    std::cout << "Testing GroundedAnswer claims and limitations..." << std::endl;

    Timestamp t = T0;
    ProvenanceRegistry registry([&t] { return t; });
    registry.add_observation(make_obs("a1b2c3d4", 1.0f, T0, std::nullopt, "web_search"));
    registry.add_observation(make_obs("e5f6a7b8", 1.0f, T0, 600, "read_url"));
    registry.add_observation(make_obs("dead0001", 1.0f, T0 - 120000, 60, "read_url"));

    ClaimExtractor extractor;
    std::string raw =
        "According to the search results [a1b2c3d4], Paris is the capital. "
        "Therefore the capital is in Europe [a1b2c3d4]. "
        "Perhaps the capital will move [a1b2c3d4]. "
        "Maybe the capital will move someday.";
    auto claims = extractor.extract_and_build(raw, registry);
    assert(claims.size() == 4);

    GroundedAnswerGenerator generator;
    GroundedAnswer answer = generator.generate(raw, registry, claims);
    assert(answer.degradation_level == DegradationLevel::FullAnswer);
    assert(answer.claims.size() == 4);
    assert(answer.high_confidence_parts.size() == 2);
    assert(answer.medium_confidence_parts.size() == 1);
    assert(answer.low_confidence_parts.size() == 1);
    assert(answer.observations_used.size() == 2);

    assert(answer.limitations.size() == 2);
    assert(contains(answer.limitations[0], "about to expire"));
    assert(answer.limitations[1] == "1 observations have expired");

    json j = answer.to_json();
    assert(j["degradation_level"] == "FULL_ANSWER");
    assert(j["claims"].size() == 4);

    std::string summary = generator.format_provenance_summary(registry);
    assert(contains(summary, "Valid observations: 2"));
    assert(contains(summary, "[a1b2c3d4] web_search (confidence: 100%)"));
    assert(contains(summary, "Expired: 1"));

    ProvenanceRegistry empty([&t] { return t; });
    assert(contains(generator.format_provenance_summary(empty), "No valid observations"));

    std::cout << "  PASS" << std::endl;
}

void test_cognitive_state() {
    std::cout << "Testing CognitiveState..." << std::endl;

    CognitiveState state("Find the capital of France");
    assert(state.confidence == defaults::initial_confidence);

    state.update_confidence(1.5f);
    assert(state.confidence == 1.0f);
    state.update_confidence(-1.0f);
    assert(state.confidence == 0.0f);
    state.update_confidence(0.6f);
    state.update_confidence(std::nanf(""));
    assert(state.confidence == 0.0f);
    state.update_confidence(0.0f);

    state.add_uncertainty("which France");
    state.add_uncertainty("which France");
    assert(state.uncertainties.size() == 1);
    state.remove_uncertainty("which France");
    assert(state.uncertainties.empty());

    state.mark_stall();
    state.mark_stall();
    assert(!state.has_stalled());
    state.mark_stall();
    assert(state.has_stalled());
    state.mark_progress();
    assert(state.stall_count == 0);

    assert(state.average_observation_confidence() == 0.0f);
    state.increment_iteration();
    assert(contains(state.to_context(), "no observations have been gathered"));

    state.record_observation(1.0f);
    state.record_observation(0.6f);
    assert(state.has_tool_observations);
    assert(near(state.average_observation_confidence(), 0.8f));

    state.update_confidence(0.9f);
    assert(state.to_context().empty());

    state.update_confidence(0.2f);
    state.add_uncertainty("a");
    state.add_uncertainty("b");
    state.add_uncertainty("c");
    std::string ctx = state.to_context();
    assert(contains(ctx, "Current confidence is low (20%)"));
    assert(contains(ctx, "Uncertain areas: a, b"));
    assert(!contains(ctx, ", c"));

    json j = state.to_json();
    assert(j["goal_statement"] == "Find the capital of France");
    assert(j["uncertainties"].size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_strategy_gate() {
    std::cout << "Testing StrategyGate..." << std::endl;

    Timestamp t = T0;
    StrategyGate gate;

    CognitiveState confident;
    confident.update_confidence(0.9f);
    assert(gate.evaluate(confident).decision == StrategyDecision::Conclude);

    ProvenanceRegistry empty([&t] { return t; });
    StrategyPath ungrounded = gate.evaluate(confident, &empty);
    assert(ungrounded.decision == StrategyDecision::RequestMoreInfo);
    assert(ungrounded.suggested_action.has_value());

    ProvenanceRegistry grounded([&t] { return t; });
    grounded.add_observation(make_obs("aaaa0001", 1.0f, T0));
    assert(gate.evaluate(confident, &grounded).decision == StrategyDecision::Conclude);

    // Stale ledger
    CognitiveState working;
    working.update_confidence(0.5f);
    ProvenanceRegistry stale([&t] { return t; });
    stale.add_observation(make_obs("aaaa0001", 1.0f, T0, 10));
    t = T0 + 20000;
    StrategyPath refresh = gate.evaluate(working, &stale);
    assert(refresh.decision == StrategyDecision::RequestMoreInfo);
    assert(contains(refresh.reason, "expired"));
    t = T0;

    // Weak evidence, not yet cross-validated
    ProvenanceRegistry weak([&t] { return t; });
    weak.add_observation(make_obs("aaaa0001", 0.4f, T0));
    StrategyPath cross = gate.evaluate(working, &weak);
    assert(cross.decision == StrategyDecision::RequestMoreInfo);
    assert(contains(cross.reason, "40%"));

    // Weak but cross-validated evidence falls through to the later rules
    ProvenanceRegistry weak_many([&t] { return t; });
    weak_many.add_observation(make_obs("aaaa0001", 0.4f, T0, std::nullopt, "web_search"));
    weak_many.add_observation(make_obs("aaaa0002", 0.4f, T0, std::nullopt, "read_url"));
    weak_many.add_observation(make_obs("aaaa0003", 0.4f, T0, std::nullopt, "Read"));
    assert(gate.evaluate(working, &weak_many).decision == StrategyDecision::Continue);
    CognitiveState weak_stuck = working;
    weak_stuck.stall_count = 3;
    assert(gate.evaluate(weak_stuck, &weak_many).decision == StrategyDecision::Pivot);

    // Stalled
    CognitiveState stuck;
    stuck.update_confidence(0.2f);
    stuck.stall_count = 3;
    assert(gate.evaluate(stuck).decision == StrategyDecision::Degrade);
    stuck.update_confidence(0.5f);
    assert(gate.evaluate(stuck).decision == StrategyDecision::Pivot);

    // Goal unclear wins over data missing
    CognitiveState unclear;
    unclear.update_confidence(0.5f);
    unclear.add_uncertainty("missing data on prices");
    unclear.add_uncertainty("the user's goal is vague");
    StrategyPath ask = gate.evaluate(unclear);
    assert(ask.decision == StrategyDecision::AskUser);
    assert(*ask.suggested_action == "Ask the user about: the user's goal is vague");

    CognitiveState missing;
    missing.update_confidence(0.5f);
    missing.add_uncertainty("Missing DATA on prices");
    assert(gate.evaluate(missing).decision == StrategyDecision::Deepen);

    CognitiveState zh;
    zh.update_confidence(0.5f);
    zh.add_uncertainty("需求不明确");
    assert(gate.evaluate(zh).decision == StrategyDecision::AskUser);

    CognitiveState crowded;
    crowded.update_confidence(0.5f);
    for (int i = 0; i < 5; ++i) crowded.add_uncertainty("open point " + std::to_string(i));
    assert(gate.evaluate(crowded).decision == StrategyDecision::Degrade);

    CognitiveState fine;
    fine.update_confidence(0.5f);
    fine.add_uncertainty("open point");
    StrategyPath cont = gate.evaluate(fine);
    assert(cont.decision == StrategyDecision::Continue);
    assert(cont.to_json()["decision"] == "CONTINUE");
    assert(cont.to_json()["suggested_action"].is_null());

    // Confident but still uncertain is not done
    CognitiveState almost;
    almost.update_confidence(0.95f);
    almost.add_uncertainty("open point");
    assert(gate.evaluate(almost).decision == StrategyDecision::Continue);

    StrategyGate lenient(0.5f, 5, 10, 2);
    assert(lenient.evaluate(working).decision == StrategyDecision::Conclude);
    assert(lenient.evaluate(working, &grounded).decision == StrategyDecision::RequestMoreInfo);

    std::cout << "  PASS" << std::endl;
}

void test_minimal_commitment() {
    std::cout << "Testing MinimalCommitmentPolicy..." << std::endl;

    MinimalCommitmentPolicy policy;
    std::vector<std::pair<std::string, ToolRisk>> tools = {
        {"deploy", ToolRisk::High},
        {"edit", ToolRisk::Medium},
        {"exec", ToolRisk::Low},
        {"read", ToolRisk::Safe},
        {"list", ToolRisk::Safe},
    };

    auto ranked = policy.rank_tools(tools, 0.5f);
    assert((ranked == std::vector<std::string>{"read", "list", "exec", "edit"}));

    assert((policy.rank_tools(tools, 0.0f) == std::vector<std::string>{"read", "list"}));
    assert(policy.rank_tools(tools, 0.8f).back() == "deploy");

    assert(policy.should_proceed(ToolRisk::Safe, 0.0f));
    assert(!policy.should_proceed(ToolRisk::High, 0.79f));
    assert(policy.should_proceed(ToolRisk::High, 0.8f));

    assert(parse_tool_risk("MEDIUM") == ToolRisk::Medium);
    assert(!parse_tool_risk("medium").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_tool_catalog() {
    std::cout << "Testing ToolCatalog..." << std::endl;

    ToolCatalog catalog = default_tool_catalog();
    assert(catalog.size() == 7);
    assert(catalog.get("Bash")->risk == ToolRisk::Medium);
    assert(catalog.get("python_exec")->risk == ToolRisk::Safe);
    assert(catalog.get("Read") != nullptr);
    assert(catalog.get("Glob") != nullptr);
    assert(catalog.get("web_search")->ttl_seconds == 3600);
    assert(catalog.get("teleport") == nullptr);
    assert(catalog.by_category("filesystem").size() == 2);
    assert((catalog.categories() ==
            std::vector<std::string>{"web", "compute", "filesystem", "interaction"}));

    MinimalCommitmentPolicy policy;
    auto ranked = policy.rank_tools(catalog.risk_pairs(), 0.3f);
    assert(ranked.size() == 6);
    assert(ranked.back() == "ask_user");
    assert(policy.rank_tools(catalog.risk_pairs(), 0.5f).back() == "Bash");

    ToolSpec replacement = *catalog.get("Bash");
    replacement.risk = ToolRisk::High;
    catalog.add(replacement);
    assert(catalog.size() == 7);
    assert(catalog.get("Bash")->risk == ToolRisk::High);

    std::cout << "  PASS" << std::endl;
}

void test_tool_outcomes() {
    std::cout << "Testing tool outcomes..." << std::endl;

    Timestamp t = T0;
    ProvenanceRegistry registry([&t] { return t; });
    ToolCatalog catalog = default_tool_catalog();

    std::string big(600, 'x');
    ToolResult ok = ToolResult::from_success(big, *catalog.get("web_search"), "capitals");
    assert(ok.success);
    assert(ok.content.size() == 600);
    assert(ok.observation.content.size() == MAX_OBSERVATION_CONTENT);
    assert(ok.observation.ttl_seconds == 3600);
    assert(ok.observation.scope == "capitals");

    ToolResult failed = ToolResult::from_error("timeout", "read_url");
    assert(!failed.success);
    assert(failed.observation.confidence == 0.0f);
    assert(failed.observation.scope == "error");
    assert(failed.observation.metadata["error"] == "timeout");
    assert(*failed.error_message == "timeout");

    std::string id = record_outcome(registry, "web_search", ExecutionOutcome{ok});
    assert(id == ok.observation.id);

    std::string wrapped = record_outcome(registry, "web_search",
                                         ExecutionOutcome{std::string("plain text")}, &catalog);
    assert(registry.get_observation(wrapped)->ttl_seconds == 3600);

    std::string unknown = record_outcome(registry, "custom_tool",
                                         ExecutionOutcome{std::string("plain text")});
    const Observation* obs = registry.get_observation(unknown);
    assert(obs->confidence == 1.0f);
    assert(!obs->ttl_seconds.has_value());
    assert(obs->source_id == "custom_tool");

    std::string answer = record_outcome(registry, "ask_user",
                                        ExecutionOutcome{std::string("Linux")}, &catalog);
    assert(registry.get_observation(answer)->source_type == ObservationType::UserInput);
    assert(registry.get_observation(answer)->confidence == 0.8f);

    // Executor names resolve to their catalog policy
    std::string shell = record_outcome(registry, "Bash",
                                       ExecutionOutcome{std::string("total 0")}, &catalog);
    assert(registry.get_observation(shell)->confidence == 0.9f);

    assert(registry.observation_count() == 5);

    ExecutionOutcome bad{failed};
    ExecutionOutcome text{std::string("fine")};
    assert(outcome_failed(bad));
    assert(!outcome_failed(text));
    assert(outcome_text(bad) == "timeout");
    assert(outcome_text(text) == "fine");

    RetryPolicy retry;
    assert(retry.should_retry(1, bad));
    assert(!retry.should_retry(3, bad));
    assert(!retry.should_retry(1, text));
    assert(!retry.should_retry(1, ExecutionOutcome{ok}));
    assert(retry.delay_for(1) == 500);
    assert(retry.delay_for(2) == 1000);
    assert(retry.delay_for(3) == 2000);
    assert(retry.delay_for(10) == 8000);

    std::cout << "  PASS" << std::endl;
}

void test_serialization_roundtrip() {
    std::cout << "Testing JSON round-trip..." << std::endl;

    Observation obs(ObservationType::UserInput, "user-42", "I deploy on Fridays", 0.7f, T0 + 250);
    obs.id = "abcd1234";
    obs.scope = "deploys";
    obs.ttl_seconds = 3600;
    obs.metadata = {{"channel", "chat"}};

    json oj = obs.to_json();
    assert(oj["source_type"] == "USER_INPUT");
    assert(oj["timestamp"] == "2023-11-14T22:13:20.250Z");

    auto obs2 = Observation::from_json(oj);
    assert(obs2.has_value());
    assert(obs2->id == obs.id);
    assert(obs2->content == obs.content);
    assert(obs2->source_type == obs.source_type);
    assert(obs2->source_id == obs.source_id);
    assert(obs2->timestamp == obs.timestamp);
    assert(obs2->confidence == obs.confidence);
    assert(obs2->scope == obs.scope);
    assert(obs2->ttl_seconds == obs.ttl_seconds);
    assert(obs2->metadata == obs.metadata);

    Observation forever = make_obs("abcd0000", 1.0f, T0);
    json fj = forever.to_json();
    assert(fj["ttl_seconds"].is_null());
    assert(!Observation::from_json(fj)->ttl_seconds.has_value());

    // Missing confidence follows the source-type default
    json sparse = {{"content", "hi"}, {"source_type", "USER_INPUT"}};
    assert(Observation::from_json(sparse)->confidence == defaults::user_input_confidence);

    json bogus = oj;
    bogus["source_type"] = "RUMOUR";
    assert(!Observation::from_json(bogus).has_value());
    json wrong = oj;
    wrong["confidence"] = "high";
    assert(!Observation::from_json(wrong).has_value());

    Claim claim;
    claim.id = "claim001";
    claim.statement = "Deploys happen on Fridays";
    claim.claim_type = ClaimType::Hypothesis;
    claim.source_observations = {"abcd1234"};
    claim.transform_chain.emplace_back(TransformOp::Extract, "extract", claim.source_observations, 0.0f);
    claim.transform_chain.emplace_back(TransformOp::Infer, "guess", claim.source_observations, -0.3f);
    claim.confidence = 0.25f;
    claim.scope = "deploys";
    claim.created_at = T0 + 500;

    json cj = claim.to_json();
    assert(cj["claim_type"] == "hypothesis");

    auto claim2 = Claim::from_json(cj);
    assert(claim2.has_value());
    assert(claim2->id == claim.id);
    assert(claim2->statement == claim.statement);
    assert(claim2->claim_type == claim.claim_type);
    assert(claim2->source_observations == claim.source_observations);
    assert(claim2->transform_chain.size() == 2);
    assert(claim2->transform_chain[1].operation == TransformOp::Infer);
    assert(claim2->transform_chain[1].confidence_delta == -0.3f);
    assert(claim2->confidence == claim.confidence);
    assert(claim2->scope == claim.scope);
    assert(claim2->created_at == claim.created_at);

    std::cout << "  PASS" << std::endl;
}

void test_registry_roundtrip() {
    std::cout << "Testing Registry JSON round-trip..." << std::endl;

    Timestamp t = T0 + 1000;
    auto clock = [&t] { return t; };
    ProvenanceRegistry registry(clock);
    registry.add_observation(make_obs("zzzz0001", 1.0f, T0));
    registry.add_observation(make_obs("aaaa0002", 0.6f, T0 + 1, 60));

    Claim claim;
    claim.id = "claim001";
    claim.statement = "s";
    claim.source_observations = {"zzzz0001"};
    registry.add_claim(claim);

    json j = registry.to_json();
    assert(j["format"]["major"] == CANARY_LEDGER_FORMAT_MAJOR);

    auto loaded = ProvenanceRegistry::from_json(j, clock);
    assert(loaded.has_value());
    assert(loaded->observation_count() == 2);
    assert(loaded->claim_count() == 1);
    // Chronological order survives key-sorted JSON objects
    assert(loaded->all_observations()[0].id == "zzzz0001");
    assert(loaded->get_claim("claim001")->confidence == 1.0f);
    assert(loaded->determine_degradation_level() == registry.determine_degradation_level());

    json broken = j;
    broken["observations"]["bad00000"] = {{"source_type", "RUMOUR"}};
    auto partial = ProvenanceRegistry::from_json(broken, clock);
    assert(partial.has_value());
    assert(partial->observation_count() == 2);

    json future = j;
    future["format"]["major"] = CANARY_LEDGER_FORMAT_MAJOR + 1;
    assert(!ProvenanceRegistry::from_json(future, clock).has_value());
    assert(!ProvenanceRegistry::from_json(json::array(), clock).has_value());

    assert(version::ledger_compatible(CANARY_LEDGER_FORMAT_MAJOR, 0));
    assert(!version::ledger_compatible(CANARY_LEDGER_FORMAT_MAJOR, CANARY_LEDGER_FORMAT_MINOR + 1));

    std::cout << "  PASS" << std::endl;
}

void test_policy_config() {
    std::cout << "Testing PolicyConfig..." << std::endl;

    const std::string path = "/tmp/canary_policy_test.json";
    {
        std::ofstream out(path);
        out << R"({"degradation": {"full_confidence": 0.9}, "commitment": {"high": 0.95}})";
    }

    auto policy = load_policy(path);
    assert(policy.has_value());
    assert(near(policy->degradation.full_confidence, 0.9f));
    assert(policy->degradation.partial_confidence == defaults::partial_answer_confidence);
    assert(near(policy->commitment.high, 0.95f));
    assert(policy->strategy.stall_threshold == defaults::stall_threshold);

    MinimalCommitmentPolicy commitment(policy->commitment);
    assert(!commitment.should_proceed(ToolRisk::High, 0.9f));

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    assert(!load_policy(path).has_value());
    std::remove(path.c_str());
    assert(!load_policy(path).has_value());

    json wrong = {{"strategy", {{"stall_threshold", "three"}}}};
    assert(!PolicyConfig::from_json(wrong).has_value());

    PolicyConfig custom;
    custom.extractor.min_claim_chars = 20;
    custom.extractor.max_classify_chars = 64;
    custom.strategy.uncertainty_limit = 2;
    auto back = PolicyConfig::from_json(custom.to_json());
    assert(back.has_value());
    assert(back->extractor.min_claim_chars == 20);
    assert(back->extractor.max_classify_chars == 64);
    assert(back->strategy.uncertainty_limit == 2);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Canary Tests ===" << std::endl;
    std::cout << "Version " << CANARY_VERSION << std::endl;
    std::cout << std::endl;

    test_timestamps();
    test_text_helpers();
    test_observation_confidence();
    test_observation_expiry();
    test_transform_step();
    test_claim_weakest_link();

    std::cout << std::endl;
    std::cout << "=== Ledger ===" << std::endl;
    test_registry_refuse_when_empty();
    test_registry_degradation_levels();
    test_registry_invalidate_expired_keeps_entries();
    test_registry_lookup();
    test_registry_context();

    std::cout << std::endl;
    std::cout << "=== Extraction and answers ===" << std::endl;
    test_extractor_classification();
    test_extractor_filters();
    test_extractor_long_sentences();
    test_extractor_build_claim();
    test_grounded_answer_scenarios();
    test_grounded_answer_claims_and_limits();

    std::cout << std::endl;
    std::cout << "=== Strategy and tools ===" << std::endl;
    test_cognitive_state();
    test_strategy_gate();
    test_minimal_commitment();
    test_tool_catalog();
    test_tool_outcomes();

    std::cout << std::endl;
    std::cout << "=== Serialization and policy ===" << std::endl;
    test_serialization_roundtrip();
    test_registry_roundtrip();
    test_policy_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
