// canary: Command-line interface for auditing provenance ledgers
//
// Usage: canary <command> [options]
//
// Commands:
//   audit      Degradation verdict (and grounded answer) for a ledger
//   extract    Classify the claims in a text file
//   tools      Rank the standard tools under the commitment policy
//   version    Show version
//   help       Show this help

#include <canary/canary.hpp>
#include <algorithm>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace canary;

// argv[0] without its directory
static const char* prog_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// Set by --verbose
static std::atomic<bool> verbose_mode{false};

// One "[HH:MM:SS.mmm][component] message" line on stderr, --verbose only
static void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    // format_timestamp: YYYY-MM-DDTHH:MM:SS.mmmZ
    std::string stamp = format_timestamp(now()).substr(11, 12);
    std::cerr << "[" << stamp << "][" << component << "] " << message << "\n";
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "canary " << CANARY_VERSION << " - Provenance ledger audit\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  audit <ledger.json>    Degradation verdict for a saved ledger\n"
              << "  extract <text-file>    Classify the claims in generated text\n"
              << "  tools                  Rank the standard tools by risk\n"
              << "  version                Show version\n"
              << "  help                   Show this help\n\n"
              << "Options:\n"
              << "  --answer FILE          Raw answer to ground (audit)\n"
              << "  --ledger FILE          Ledger for claim confidence (extract)\n"
              << "  --policy FILE          JSON policy overriding default thresholds\n"
              << "  --confidence X         Session confidence for tool ranking (default: 0.3)\n"
              << "  --json                 Output as JSON\n"
              << "  --verbose              Enable verbose debug logging\n"
              << "  -v, --version          Show version\n";
}

static std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

static std::optional<ProvenanceRegistry> load_ledger(const std::string& path) {
    auto text = read_file(path);
    if (!text) {
        std::cerr << "[cli] Cannot read ledger " << path << "\n";
        return std::nullopt;
    }
    json j = json::parse(*text, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[cli] Ledger is not valid JSON: " << path << "\n";
        return std::nullopt;
    }
    auto registry = ProvenanceRegistry::from_json(j);
    if (registry) {
        log_debug("cli", "Loaded ledger %s: %zu observations, %zu claims",
                  path.c_str(), registry->observation_count(), registry->claim_count());
    }
    return registry;
}

int cmd_audit(const std::string& ledger_path, const std::optional<std::string>& answer_path,
              const PolicyConfig& policy, bool json_output) {
    auto registry = load_ledger(ledger_path);
    if (!registry) return 1;

    GroundedAnswerGenerator generator(policy.degradation);
    auto level = generator.determine_degradation(*registry);

    std::optional<GroundedAnswer> answer;
    if (answer_path) {
        auto raw = read_file(*answer_path);
        if (!raw) {
            std::cerr << "[cli] Cannot read answer " << *answer_path << "\n";
            return 1;
        }
        ClaimExtractor extractor(policy.extractor);
        auto claims = extractor.extract_and_build(*raw, *registry);
        log_debug("audit", "Extracted %zu claims from answer", claims.size());
        answer = generator.generate(*raw, *registry, std::move(claims));
    }

    if (json_output) {
        json out = {
            {"degradation_level", degradation_level_name(level)},
            {"valid_observations", registry->valid_observation_count()},
            {"expired_observations", registry->invalidate_expired().size()},
        };
        if (answer) out["answer"] = answer->to_json();
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << generator.format_provenance_summary(*registry) << "\n\n";
    std::cout << "Degradation level: " << degradation_level_name(level) << "\n";
    if (answer) {
        std::cout << "\n" << answer->to_formatted_output() << "\n";
    }
    return 0;
}

int cmd_extract(const std::string& text_path, const std::optional<std::string>& ledger_path,
                const PolicyConfig& policy, bool json_output) {
    auto text = read_file(text_path);
    if (!text) {
        std::cerr << "[cli] Cannot read " << text_path << "\n";
        return 1;
    }

    ProvenanceRegistry registry;
    if (ledger_path) {
        auto loaded = load_ledger(*ledger_path);
        if (!loaded) return 1;
        registry = std::move(*loaded);
    }

    ClaimExtractor extractor(policy.extractor);
    auto extracted = extractor.extract_claims(*text);
    Timestamp at = registry.now();

    json out = json::array();
    for (const auto& e : extracted) {
        Claim claim = extractor.build_claim(e, registry.observations(), at);
        if (json_output) {
            json entry = claim.to_json();
            entry["confidence_hint"] = e.confidence_hint;
            out.push_back(entry);
            continue;
        }
        std::cout << "[" << claim_type_name(e.claim_type) << ", " << e.confidence_hint;
        if (ledger_path) std::cout << ", " << percent(claim.confidence);
        std::cout << "] " << e.statement << "\n";
        for (const auto& ref : e.observation_refs) {
            std::cout << "    cites " << ref
                      << (registry.get_observation(ref) ? "" : " (not in ledger)") << "\n";
        }
    }

    if (json_output) {
        std::cout << out.dump(2) << "\n";
    } else if (extracted.empty()) {
        std::cout << "No claims found\n";
    }
    return 0;
}

int cmd_tools(float confidence, const PolicyConfig& policy, bool json_output) {
    ToolCatalog catalog = default_tool_catalog();
    MinimalCommitmentPolicy commitment(policy.commitment);
    auto ranked = commitment.rank_tools(catalog.risk_pairs(), confidence);

    if (json_output) {
        json out = json::array();
        for (const auto& name : ranked) {
            const ToolSpec* spec = catalog.get(name);
            out.push_back({{"name", name}, {"risk", tool_risk_name(spec->risk)}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Tools admitted at confidence " << percent(confidence) << ":\n";
    for (const auto& name : ranked) {
        const ToolSpec* spec = catalog.get(name);
        std::cout << "  " << std::left << std::setw(12) << name
                  << " " << std::setw(7) << tool_risk_name(spec->risk)
                  << " " << spec->description << "\n";
    }
    size_t withheld = catalog.size() - ranked.size();
    if (withheld > 0) {
        std::cout << withheld << " tool(s) withheld until confidence rises\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> answer_path;
    std::optional<std::string> ledger_path;
    std::optional<std::string> policy_path;
    float confidence = defaults::initial_confidence;
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--answer") == 0 && i + 1 < argc) {
            answer_path = argv[++i];
        } else if (strcmp(argv[i], "--ledger") == 0 && i + 1 < argc) {
            ledger_path = argv[++i];
        } else if (strcmp(argv[i], "--policy") == 0 && i + 1 < argc) {
            policy_path = argv[++i];
        } else if (strcmp(argv[i], "--confidence") == 0 && i + 1 < argc) {
            char* end = nullptr;
            confidence = std::strtof(argv[++i], &end);
            if (end == argv[i] || *end != '\0') {
                std::cerr << "Error: --confidence expects a number\n";
                return 1;
            }
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "canary " << CANARY_VERSION << "\n";
            return 0;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            positional.push_back(argv[i]);
        }
    }

    PolicyConfig policy;
    if (policy_path) {
        auto loaded = load_policy(*policy_path);
        if (!loaded) return 1;
        policy = *loaded;
        log_debug("cli", "Loaded policy from %s", policy_path->c_str());
    }

    if (command == "audit") {
        if (positional.empty()) {
            std::cerr << "Usage: canary audit <ledger.json> [--answer FILE]\n";
            return 1;
        }
        return cmd_audit(positional[0], answer_path, policy, json_output);
    }
    if (command == "extract") {
        if (positional.empty()) {
            std::cerr << "Usage: canary extract <text-file> [--ledger FILE]\n";
            return 1;
        }
        return cmd_extract(positional[0], ledger_path, policy, json_output);
    }
    if (command == "tools") {
        return cmd_tools(std::clamp(confidence, 0.0f, 1.0f), policy, json_output);
    }
    if (command == "version") {
        std::cout << "canary " << CANARY_VERSION << "\n";
        return 0;
    }
    if (command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
