#pragma once
// Config: JSON view of every component's settings
//
//   {
//     "version": "1.4",
//     "log_level": "info",
//     "immunity":    { "sensitivity": "high", "allow_list": ["sentence is false"] },
//     "dual_mind":   { "min_confidence": 0.8 },
//     "sacred_core": { "tamper_threshold": 3 }
//   }
//
// Missing keys keep their defaults. A key of the wrong type is a
// ConfigError, never a silent fallback.

#include "dual_mind.hpp"
#include "godel_immunity.hpp"
#include "log.hpp"
#include "sacred_core.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace kavacha {

using json = nlohmann::json;

struct KavachaConfig {
    GodelImmunityConfig immunity;
    DualMindConfig dual_mind;
    SacredCoreConfig sacred_core;
    std::optional<LogLevel> log_level;   // Unset: leave the process level alone
};

void to_json(json& j, const GodelImmunityConfig& c);
void from_json(const json& j, GodelImmunityConfig& c);
void to_json(json& j, const DualMindConfig& c);
void from_json(const json& j, DualMindConfig& c);
void to_json(json& j, const SacredCoreConfig& c);
void from_json(const json& j, SacredCoreConfig& c);
void to_json(json& j, const KavachaConfig& c);
void from_json(const json& j, KavachaConfig& c);

// Parse a JSON document. Throws ConfigError.
KavachaConfig parse_config(const std::string& document);

// Read a JSON file. Throws ConfigError.
KavachaConfig load_config(const std::string& path);

// File named by KAVACHA_CONFIG, or defaults when unset
KavachaConfig load_config_from_env();

// Apply log_level if the config names one
void apply_log_level(const KavachaConfig& config);

} // namespace kavacha
