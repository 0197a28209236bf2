// kavacha: command-line front end for the safety armor
//
// Usage: kavacha <command> [options]
//
// Commands:
//   scan       Detect attacks in text
//   sanitize   Redact attack spans from text
//   verify     Heuristic dual-mind verification of a proposal
//   patterns   List the attack catalog
//   constants  Show the sacred constants
//   help       Show this help
//
// Exit status: 0 clean/approved, 2 attack or denial, 1 usage/config error.

#include <kavacha/kavacha.hpp>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace kavacha;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_FLAGGED = 2;

// Get program name from path
const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "kavacha " << KAVACHA_VERSION << " - Safety armor for autonomous agents\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  scan [TEXT]        Detect attacks in TEXT (or each stdin line)\n"
              << "  sanitize [TEXT]    Redact attack spans from TEXT (or each stdin line)\n"
              << "  verify             Verify a proposal (--task T --proposal P)\n"
              << "  patterns           List the attack catalog\n"
              << "  constants          Show the sacred constants\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config PATH      JSON config file (default: $KAVACHA_CONFIG)\n"
              << "  --json             Output as JSON\n"
              << "  --sensitivity LVL  low|medium|high\n"
              << "  --allow TEXT       Allow-list a phrase (repeatable)\n"
              << "  --task TEXT        Task description (verify)\n"
              << "  --proposal TEXT    Proposed action (verify)\n"
              << "  --verbose          Enable debug logging\n"
              << "  -v, --version      Show version\n\n"
              << "Exit status: 0 clean/approved, 2 attack detected or denied, 1 error\n";
}

// Inputs: the positional argument, or one per stdin line
std::vector<std::string> collect_inputs(const std::vector<std::string>& positional) {
    if (!positional.empty()) return positional;
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!text::trim(line).empty()) lines.push_back(line);
    }
    return lines;
}

int cmd_scan(GodelImmunity& immunity, const std::vector<std::string>& inputs, bool json_output) {
    bool any_attack = false;
    json all = json::array();

    for (const auto& input : inputs) {
        DetectionResult r = immunity.detect_attack(input);
        any_attack = any_attack || r.is_attack;

        if (json_output) {
            json entry = r;
            entry["input"] = text::valid_utf8(input);
            all.push_back(entry);
            continue;
        }

        if (r.is_attack) {
            std::cout << "ATTACK  " << attack_type_name(r.type.value_or(AttackType::MetaManipulation))
                      << " (" << std::fixed << std::setprecision(2) << r.confidence << ")\n";
            if (r.mitigation) std::cout << "  " << *r.mitigation << "\n";
        } else if (r.confidence > 0.0f) {
            std::cout << "SUSPECT (" << std::fixed << std::setprecision(2) << r.confidence << ")";
            for (const auto& f : r.heuristic_flags) std::cout << " " << f;
            std::cout << "\n";
        } else {
            std::cout << "CLEAN\n";
        }
    }

    if (json_output) {
        std::cout << (inputs.size() == 1 ? all[0] : all).dump(2) << "\n";
    }
    return any_attack ? EXIT_FLAGGED : EXIT_OK;
}

int cmd_sanitize(GodelImmunity& immunity, const std::vector<std::string>& inputs, bool json_output) {
    bool any_modified = false;
    json all = json::array();

    for (const auto& input : inputs) {
        SanitizationResult r = immunity.sanitize(input);
        any_modified = any_modified || !r.threats.empty();
        if (json_output) {
            all.push_back(json(r));
        } else {
            std::cout << r.sanitized << "\n";
        }
    }

    if (json_output) {
        std::cout << (inputs.size() == 1 ? all[0] : all).dump(2) << "\n";
    }
    return any_modified ? EXIT_FLAGGED : EXIT_OK;
}

int cmd_verify(DualMindVerifier& verifier, const std::string& task, const std::string& proposal,
               bool json_output) {
    VerificationResult r = verifier.verify(task, proposal);

    if (json_output) {
        std::cout << json(r).dump(2) << "\n";
    } else {
        std::cout << (r.approved ? "APPROVED" : "DENIED")
                  << " (confidence " << std::fixed << std::setprecision(2) << r.confidence << ")\n";
        std::cout << "  " << r.reason << "\n";
        if (r.requires_human_review) std::cout << "  Requires human review\n";
    }
    return r.approved ? EXIT_OK : EXIT_FLAGGED;
}

int cmd_patterns(const GodelImmunity& immunity, bool json_output) {
    auto patterns = immunity.attack_patterns();

    if (json_output) {
        json arr = json::array();
        for (const auto& [type, description] : patterns) {
            arr.push_back({{"type", attack_type_name(type)}, {"description", description}});
        }
        std::cout << arr.dump(2) << "\n";
        return EXIT_OK;
    }

    std::cout << "Attack Patterns (" << patterns.size() << ")\n";
    std::cout << "═══════════════════════════════\n";
    for (const auto& [type, description] : patterns) {
        std::cout << "  " << std::left << std::setw(24) << attack_type_name(type)
                  << description << "\n";
    }
    return EXIT_OK;
}

int cmd_constants(bool json_output) {
    const SacredConstants& c = sacred_constants();
    if (json_output) {
        std::cout << json(c).dump(2) << "\n";
        return EXIT_OK;
    }
    std::cout << "Sacred Constants\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "  Max execution time:  " << c.max_execution_time_ms << " ms\n";
    std::cout << "  Max memory:          " << c.max_memory_bytes / (1024 * 1024) << " MiB\n";
    std::cout << "  Max recursion depth: " << c.max_recursion_depth << "\n";
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string config_path;
    std::string sensitivity;
    std::string task, proposal;
    std::vector<std::string> allow;
    std::vector<std::string> positional;
    bool json_output = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--sensitivity") == 0 && i + 1 < argc) {
            sensitivity = argv[++i];
        } else if (strcmp(argv[i], "--allow") == 0 && i + 1 < argc) {
            allow.push_back(argv[++i]);
        } else if (strcmp(argv[i], "--task") == 0 && i + 1 < argc) {
            task = argv[++i];
        } else if (strcmp(argv[i], "--proposal") == 0 && i + 1 < argc) {
            proposal = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return EXIT_OK;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "kavacha " << KAVACHA_VERSION << "\n";
            return EXIT_OK;
        } else if (argv[i][0] != '-' || argv[i][1] == '\0') {
            if (command.empty()) {
                command = argv[i];
            } else {
                positional.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return EXIT_ERROR;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? EXIT_ERROR : EXIT_OK;
    }

    KavachaConfig config;
    try {
        config = config_path.empty() ? load_config_from_env() : load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return EXIT_ERROR;
    }
    apply_log_level(config);
    if (verbose) set_log_level(LogLevel::Debug);

    if (!sensitivity.empty()) {
        auto s = sensitivity_from_name(sensitivity);
        if (!s) {
            std::cerr << "Unknown sensitivity: " << sensitivity << " (expected low|medium|high)\n";
            return EXIT_ERROR;
        }
        config.immunity.sensitivity = *s;
    }
    for (const auto& a : allow) {
        config.immunity.allow_list.push_back(a);
    }

    if (command == "scan" || command == "sanitize") {
        GodelImmunity immunity(config.immunity);
        auto inputs = collect_inputs(positional);
        if (inputs.empty()) {
            std::cerr << "Usage: " << prog_name(argv[0]) << " " << command << " TEXT\n";
            return EXIT_ERROR;
        }
        return command == "scan"
            ? cmd_scan(immunity, inputs, json_output)
            : cmd_sanitize(immunity, inputs, json_output);
    }

    if (command == "verify") {
        if (proposal.empty()) {
            std::cerr << "Usage: " << prog_name(argv[0]) << " verify --task T --proposal P\n";
            return EXIT_ERROR;
        }
        DualMindVerifier verifier(config.dual_mind);
        return cmd_verify(verifier, task, proposal, json_output);
    }

    if (command == "patterns") {
        GodelImmunity immunity(config.immunity);
        return cmd_patterns(immunity, json_output);
    }

    if (command == "constants") {
        return cmd_constants(json_output);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return EXIT_ERROR;
}
