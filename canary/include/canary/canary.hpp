#pragma once
// Canary: provenance and degradation engine for an LLM assistant
//
// - Types: time, ids, text helpers
// - Policy: every threshold, loadable from JSON
// - Observation / Claim: the evidence model
// - Registry: the session ledger and the degradation decision
// - Extractor: free text -> claims
// - Grounded answer: degradation applied to the final answer
// - Cognitive state / Strategy gate: what the loop does next
// - Commitment / Tools: risk-gated tools and the observation boundary

#include "types.hpp"
#include "policy.hpp"
#include "observation.hpp"
#include "registry.hpp"
#include "extractor.hpp"
#include "grounded_answer.hpp"
#include "cognitive_state.hpp"
#include "strategy.hpp"
#include "commitment.hpp"
#include "tools.hpp"
#include "version.hpp"
