#include <kavacha/config.hpp>
#include <kavacha/errors.hpp>
#include <kavacha/version.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kavacha {

namespace {

constexpr const char* COMPONENT = "config";

const json* field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

[[noreturn]] void wrong_type(const char* key, const char* expected, const json& value) {
    throw ConfigError(std::string("'") + key + "' must be " + expected +
                      ", got " + value.type_name());
}

void read(const json& j, const char* key, bool& out) {
    if (const json* v = field(j, key)) {
        if (!v->is_boolean()) wrong_type(key, "a boolean", *v);
        out = v->get<bool>();
    }
}

void read(const json& j, const char* key, float& out) {
    if (const json* v = field(j, key)) {
        if (!v->is_number()) wrong_type(key, "a number", *v);
        out = v->get<float>();
    }
}

void read(const json& j, const char* key, size_t& out) {
    if (const json* v = field(j, key)) {
        if (!v->is_number_unsigned()) wrong_type(key, "a non-negative integer", *v);
        out = v->get<size_t>();
    }
}

void read(const json& j, const char* key, int64_t& out) {
    if (const json* v = field(j, key)) {
        if (!v->is_number_integer()) wrong_type(key, "an integer", *v);
        out = v->get<int64_t>();
    }
}

void read(const json& j, const char* key, std::vector<std::string>& out) {
    if (const json* v = field(j, key)) {
        if (!v->is_array()) wrong_type(key, "an array of strings", *v);
        std::vector<std::string> items;
        for (const auto& item : *v) {
            if (!item.is_string()) wrong_type(key, "an array of strings", item);
            items.push_back(item.get<std::string>());
        }
        out = std::move(items);
    }
}

void require_object(const json& j, const char* section) {
    if (!j.is_object()) wrong_type(section, "an object", j);
}

void check_version(const json& v) {
    if (!v.is_string()) wrong_type("version", "a string", v);
    int major = 0, minor = 0;
    if (std::sscanf(v.get<std::string>().c_str(), "%d.%d", &major, &minor) != 2) {
        throw ConfigError("'version' must look like MAJOR.MINOR, got '" + v.get<std::string>() + "'");
    }
    if (!version::config_compatible(major, minor)) {
        throw ConfigError("Config version " + v.get<std::string>() +
                          " is not compatible with kavacha " KAVACHA_VERSION);
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Component configs
// ═══════════════════════════════════════════════════════════════════

void to_json(json& j, const GodelImmunityConfig& c) {
    j = json{
        {"sensitivity", sensitivity_name(c.sensitivity)},
        {"max_input_length", c.max_input_length},
        {"history_size", c.history_size},
        {"snapshot_length", c.snapshot_length},
        {"critical_threshold", c.critical_threshold},
        {"heuristic_window", c.heuristic_window},
        {"heuristic_cap", c.heuristic_cap},
        {"allow_list", c.allow_list}
    };
}

void from_json(const json& j, GodelImmunityConfig& c) {
    require_object(j, "immunity");
    if (const json* v = field(j, "sensitivity")) {
        if (!v->is_string()) wrong_type("sensitivity", "a string", *v);
        auto s = sensitivity_from_name(v->get<std::string>());
        if (!s) throw ConfigError("Unknown sensitivity '" + v->get<std::string>() + "'");
        c.sensitivity = *s;
    }
    read(j, "max_input_length", c.max_input_length);
    read(j, "history_size", c.history_size);
    read(j, "snapshot_length", c.snapshot_length);
    read(j, "critical_threshold", c.critical_threshold);
    read(j, "heuristic_window", c.heuristic_window);
    read(j, "heuristic_cap", c.heuristic_cap);
    read(j, "allow_list", c.allow_list);
}

void to_json(json& j, const DualMindConfig& c) {
    j = json{
        {"main_temperature", c.main_temperature},
        {"audit_temperature", c.audit_temperature},
        {"divergence_threshold", c.divergence_threshold},
        {"min_confidence", c.min_confidence},
        {"heuristic_confidence", c.heuristic_confidence},
        {"reasoner_timeout_ms", c.reasoner_timeout_ms},
        {"history_size", c.history_size},
        {"unhealthy_after_failures", c.unhealthy_after_failures}
    };
}

void from_json(const json& j, DualMindConfig& c) {
    require_object(j, "dual_mind");
    read(j, "main_temperature", c.main_temperature);
    read(j, "audit_temperature", c.audit_temperature);
    read(j, "divergence_threshold", c.divergence_threshold);
    read(j, "min_confidence", c.min_confidence);
    read(j, "heuristic_confidence", c.heuristic_confidence);
    read(j, "reasoner_timeout_ms", c.reasoner_timeout_ms);
    read(j, "history_size", c.history_size);
    read(j, "unhealthy_after_failures", c.unhealthy_after_failures);
    if (c.reasoner_timeout_ms <= 0) {
        throw ConfigError("'reasoner_timeout_ms' must be positive");
    }
}

void to_json(json& j, const SacredCoreConfig& c) {
    j = json{
        {"strict_mode", c.strict_mode},
        {"enable_tamper_detection", c.enable_tamper_detection},
        {"verification_interval_ms", c.verification_interval_ms},
        {"tamper_threshold", c.tamper_threshold},
        {"max_log_size", c.max_log_size}
    };
}

void from_json(const json& j, SacredCoreConfig& c) {
    require_object(j, "sacred_core");
    read(j, "strict_mode", c.strict_mode);
    read(j, "enable_tamper_detection", c.enable_tamper_detection);
    read(j, "verification_interval_ms", c.verification_interval_ms);
    read(j, "tamper_threshold", c.tamper_threshold);
    read(j, "max_log_size", c.max_log_size);
    if (c.verification_interval_ms <= 0) {
        throw ConfigError("'verification_interval_ms' must be positive");
    }
    if (c.tamper_threshold == 0) {
        throw ConfigError("'tamper_threshold' must be at least 1");
    }
}

// ═══════════════════════════════════════════════════════════════════
// Whole document
// ═══════════════════════════════════════════════════════════════════

void to_json(json& j, const KavachaConfig& c) {
    j = json{
        {"version", std::to_string(KAVACHA_VERSION_MAJOR) + "." + std::to_string(KAVACHA_VERSION_MINOR)},
        {"immunity", c.immunity},
        {"dual_mind", c.dual_mind},
        {"sacred_core", c.sacred_core}
    };
    if (c.log_level) j["log_level"] = log_level_name(*c.log_level);
}

void from_json(const json& j, KavachaConfig& c) {
    require_object(j, "config");
    if (const json* v = field(j, "version")) check_version(*v);
    if (const json* v = field(j, "immunity")) from_json(*v, c.immunity);
    if (const json* v = field(j, "dual_mind")) from_json(*v, c.dual_mind);
    if (const json* v = field(j, "sacred_core")) from_json(*v, c.sacred_core);
    if (const json* v = field(j, "log_level")) {
        if (!v->is_string()) wrong_type("log_level", "a string", *v);
        std::string name = v->get<std::string>();
        // Unknown names fall back differently on each call
        LogLevel a = parse_log_level(name, LogLevel::Debug);
        LogLevel b = parse_log_level(name, LogLevel::Off);
        if (a != b) throw ConfigError("Unknown log_level '" + name + "'");
        c.log_level = a;
    }
}

KavachaConfig parse_config(const std::string& document) {
    json j;
    try {
        j = json::parse(document);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
    }
    KavachaConfig config;
    from_json(j, config);
    return config;
}

KavachaConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        KavachaConfig config = parse_config(buffer.str());
        KAVACHA_LOG_INFO(COMPONENT, "Loaded %s", path.c_str());
        return config;
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

KavachaConfig load_config_from_env() {
    const char* path = std::getenv("KAVACHA_CONFIG");
    if (!path || !*path) {
        return KavachaConfig{};
    }
    return load_config(path);
}

void apply_log_level(const KavachaConfig& config) {
    if (config.log_level) {
        set_log_level(*config.log_level);
    }
}

} // namespace kavacha
