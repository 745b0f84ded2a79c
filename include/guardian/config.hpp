#pragma once

#include "json.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace guardian {

enum class Phase { Pre, Post };

std::string to_string(Phase phase);

// A rule is plain data; PolicyEngine is the only interpreter.
struct Rule {
    std::string id;
    std::string category;
    std::string description;
    double severity = 0.0;
    bool hard_block = false;
    bool irreversible = false;   // post phase: a hit marks the output non-reversible
    bool applies_pre = true;
    bool applies_post = false;
    std::vector<std::string> jurisdictions;  // empty: every jurisdiction
    std::vector<std::string> phrases;        // lower-cased, matched as substrings
    std::string pattern;                     // optional ECMAScript regex source
    std::optional<std::regex> regex;         // compiled from pattern, case-insensitive
    JsonObject when;                         // context key -> required value

    bool applies_to(Phase phase) const noexcept { return phase == Phase::Pre ? applies_pre : applies_post; }
};

struct Thresholds {
    double defer = 0.45;
    double halt = 0.70;
};

struct IndexCalibration {
    double protection_baseline = 0.99;
    double protection_floor = 0.0;
};

struct JurisdictionProfile {
    std::string code;
    std::string lawful_basis;
    std::string fallback;  // parent jurisdiction code, empty for a root
};

struct PolicyConfig {
    std::string default_jurisdiction = "UK";
    std::size_t max_prompt_chars = 8000;
    Thresholds thresholds;
    IndexCalibration indices;
    std::map<std::string, JurisdictionProfile> jurisdictions;
    std::map<std::string, double> audience_weights;
    std::vector<Rule> rules;
};

struct LedgerSettings {
    std::filesystem::path evidence_dir = "evidence";
    std::size_t bundle_every = 0;  // 0 disables periodic snapshots
};

struct BackendSettings {
    std::string kind = "ollama";
    std::string endpoint = "http://127.0.0.1:11434/api/generate";
    std::string model = "mistral";
    std::string api_key;
    long timeout_ms = 60000;
    int max_attempts = 2;
    int max_tokens = 40;
};

struct GuardianConfig {
    PolicyConfig policy;
    LedgerSettings ledger;
    BackendSettings backend;
};

// Parses one rule object. Throws ConfigError on type or range problems.
Rule parse_rule(const Json& value);

PolicyConfig parse_policy_config(const Json& value);
GuardianConfig parse_config(const Json& document);

// Reads and parses a JSON config file; every failure surfaces as ConfigError.
GuardianConfig load_config(const std::filesystem::path& path);

// GUARDIAN_CONFIG, or config/guardian.json when unset.
std::filesystem::path config_path_from_environment();

// GUARDIAN_EVIDENCE_DIR and GUARDIAN_HTTP_TIMEOUT_MS override the file values.
void apply_environment_overrides(GuardianConfig& config);

// Built-in rule set and jurisdiction profiles used when no config file exists.
PolicyConfig default_policy_config();

} // namespace guardian
