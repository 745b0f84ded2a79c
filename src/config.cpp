#include "../include/guardian/config.hpp"
#include "../include/guardian/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

namespace guardian {

namespace {

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0) {
        return std::nullopt;
    }
    std::unique_ptr<char, decltype(&std::free)> holder(buffer, &std::free);
    if (!buffer) {
        return std::nullopt;
    }
    return std::string(buffer);
#else
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string uppered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}

const Json& require_object(const Json& value, const std::string& where) {
    if (!value.is_object()) {
        throw ConfigError(where + ": expected an object");
    }
    return value;
}

std::string string_field(const Json& obj, const std::string& key, const std::string& where, std::string fallback) {
    const Json* member = obj.find(key);
    if (!member || member->is_null()) {
        return fallback;
    }
    if (!member->is_string()) {
        throw ConfigError(where + "." + key + ": expected a string");
    }
    return member->as_string();
}

double number_field(const Json& obj, const std::string& key, const std::string& where, double fallback) {
    const Json* member = obj.find(key);
    if (!member || member->is_null()) {
        return fallback;
    }
    if (!member->is_number() || !std::isfinite(member->as_number())) {
        throw ConfigError(where + "." + key + ": expected a number");
    }
    return member->as_number();
}

bool bool_field(const Json& obj, const std::string& key, const std::string& where, bool fallback) {
    const Json* member = obj.find(key);
    if (!member || member->is_null()) {
        return fallback;
    }
    if (!member->is_bool()) {
        throw ConfigError(where + "." + key + ": expected a boolean");
    }
    return member->as_bool();
}

std::vector<std::string> string_list(const Json& obj, const std::string& key, const std::string& where) {
    std::vector<std::string> out;
    const Json* member = obj.find(key);
    if (!member || member->is_null()) {
        return out;
    }
    if (!member->is_array()) {
        throw ConfigError(where + "." + key + ": expected an array of strings");
    }
    for (const auto& item : member->as_array()) {
        if (!item.is_string()) {
            throw ConfigError(where + "." + key + ": expected an array of strings");
        }
        out.push_back(item.as_string());
    }
    return out;
}

std::size_t size_field(const Json& obj, const std::string& key, const std::string& where, std::size_t fallback) {
    const double value = number_field(obj, key, where, static_cast<double>(fallback));
    if (value < 0.0 || std::floor(value) != value) {
        throw ConfigError(where + "." + key + ": expected a non-negative integer");
    }
    return static_cast<std::size_t>(value);
}

Rule make_rule(std::string id,
               std::string category,
               double severity,
               bool hard_block,
               std::vector<std::string> phrases,
               bool pre,
               bool post) {
    Rule rule;
    rule.id = std::move(id);
    rule.category = std::move(category);
    rule.severity = severity;
    rule.hard_block = hard_block;
    rule.phrases = std::move(phrases);
    rule.applies_pre = pre;
    rule.applies_post = post;
    return rule;
}

} // namespace

std::string to_string(Phase phase) {
    return phase == Phase::Pre ? "pre" : "post";
}

Rule parse_rule(const Json& value) {
    require_object(value, "rule");
    Rule rule;
    rule.id = string_field(value, "id", "rule", "");
    const std::string where = "rule[" + rule.id + "]";
    rule.category = string_field(value, "category", where, "general");
    rule.description = string_field(value, "description", where, "");
    rule.severity = number_field(value, "severity", where, 0.0);
    rule.hard_block = bool_field(value, "hard_block", where, false);
    rule.irreversible = bool_field(value, "irreversible", where, false);

    const auto phases = string_list(value, "phases", where);
    if (!phases.empty()) {
        rule.applies_pre = false;
        rule.applies_post = false;
        for (const auto& phase : phases) {
            const std::string name = lowered(phase);
            if (name == "pre") {
                rule.applies_pre = true;
            } else if (name == "post") {
                rule.applies_post = true;
            } else {
                throw ConfigError(where + ": unknown phase '" + phase + "'");
            }
        }
    }

    for (auto& code : string_list(value, "jurisdictions", where)) {
        rule.jurisdictions.push_back(uppered(std::move(code)));
    }
    for (auto& phrase : string_list(value, "phrases", where)) {
        if (phrase.empty()) {
            throw ConfigError(where + ": empty phrase");
        }
        rule.phrases.push_back(lowered(std::move(phrase)));
    }

    rule.pattern = string_field(value, "pattern", where, "");
    if (!rule.pattern.empty()) {
        try {
            rule.regex.emplace(rule.pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& ex) {
            throw ConfigError(where + ": invalid pattern: " + ex.what());
        }
    }

    if (const Json* when = value.find("when"); when && !when->is_null()) {
        if (!when->is_object()) {
            throw ConfigError(where + ".when: expected an object");
        }
        rule.when = when->as_object();
    }
    return rule;
}

PolicyConfig parse_policy_config(const Json& value) {
    require_object(value, "policy");
    PolicyConfig config;
    config.default_jurisdiction = uppered(string_field(value, "default_jurisdiction", "policy", config.default_jurisdiction));
    config.max_prompt_chars = size_field(value, "max_prompt_chars", "policy", config.max_prompt_chars);

    if (const Json* thresholds = value.find("thresholds")) {
        require_object(*thresholds, "policy.thresholds");
        config.thresholds.defer = number_field(*thresholds, "defer", "policy.thresholds", config.thresholds.defer);
        config.thresholds.halt = number_field(*thresholds, "halt", "policy.thresholds", config.thresholds.halt);
    }
    if (const Json* indices = value.find("indices")) {
        require_object(*indices, "policy.indices");
        config.indices.protection_baseline =
            number_field(*indices, "protection_baseline", "policy.indices", config.indices.protection_baseline);
        config.indices.protection_floor =
            number_field(*indices, "protection_floor", "policy.indices", config.indices.protection_floor);
    }
    if (const Json* audiences = value.find("audience_weights")) {
        require_object(*audiences, "policy.audience_weights");
        for (const auto& [audience, weight] : audiences->as_object()) {
            if (!weight.is_number() || weight.as_number() < 0.0) {
                throw ConfigError("policy.audience_weights." + audience + ": expected a non-negative number");
            }
            config.audience_weights[lowered(audience)] = weight.as_number();
        }
    }
    if (const Json* jurisdictions = value.find("jurisdictions")) {
        if (!jurisdictions->is_array()) {
            throw ConfigError("policy.jurisdictions: expected an array");
        }
        for (const auto& item : jurisdictions->as_array()) {
            require_object(item, "policy.jurisdictions[]");
            JurisdictionProfile profile;
            profile.code = uppered(string_field(item, "code", "jurisdiction", ""));
            if (profile.code.empty()) {
                throw ConfigError("jurisdiction: missing code");
            }
            const std::string where = "jurisdiction[" + profile.code + "]";
            profile.lawful_basis = string_field(item, "lawful_basis", where, "");
            profile.fallback = uppered(string_field(item, "fallback", where, ""));
            if (!config.jurisdictions.emplace(profile.code, profile).second) {
                throw ConfigError(where + ": duplicate jurisdiction");
            }
        }
    }
    if (const Json* rules = value.find("rules")) {
        if (!rules->is_array()) {
            throw ConfigError("policy.rules: expected an array");
        }
        for (const auto& item : rules->as_array()) {
            config.rules.push_back(parse_rule(item));
        }
    }
    return config;
}

GuardianConfig parse_config(const Json& document) {
    require_object(document, "config");
    GuardianConfig config;
    if (const Json* policy = document.find("policy")) {
        config.policy = parse_policy_config(*policy);
    } else {
        config.policy = default_policy_config();
    }
    if (const Json* ledger = document.find("ledger")) {
        require_object(*ledger, "ledger");
        config.ledger.evidence_dir = string_field(*ledger, "evidence_dir", "ledger", config.ledger.evidence_dir.string());
        config.ledger.bundle_every = size_field(*ledger, "bundle_every", "ledger", config.ledger.bundle_every);
    }
    if (const Json* backend = document.find("backend")) {
        require_object(*backend, "backend");
        auto& settings = config.backend;
        settings.kind = string_field(*backend, "kind", "backend", settings.kind);
        settings.endpoint = string_field(*backend, "endpoint", "backend", settings.endpoint);
        settings.model = string_field(*backend, "model", "backend", settings.model);
        settings.api_key = string_field(*backend, "api_key", "backend", settings.api_key);
        settings.timeout_ms = static_cast<long>(size_field(*backend, "timeout_ms", "backend",
                                                           static_cast<std::size_t>(settings.timeout_ms)));
        settings.max_attempts = static_cast<int>(size_field(*backend, "max_attempts", "backend",
                                                            static_cast<std::size_t>(settings.max_attempts)));
        settings.max_tokens = static_cast<int>(size_field(*backend, "max_tokens", "backend",
                                                          static_cast<std::size_t>(settings.max_tokens)));
        if (settings.timeout_ms <= 0) {
            throw ConfigError("backend.timeout_ms: a bounded positive timeout is required");
        }
        if (settings.max_attempts < 1) {
            throw ConfigError("backend.max_attempts: at least one attempt is required");
        }
    }
    return config;
}

GuardianConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("unable to open config " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    Json document;
    try {
        document = Json::parse(buffer.str());
    } catch (const std::runtime_error& ex) {
        throw ConfigError("config " + path.string() + ": " + ex.what());
    }
    return parse_config(document);
}

std::filesystem::path config_path_from_environment() {
    if (auto path = read_env("GUARDIAN_CONFIG"); path && !path->empty()) {
        return *path;
    }
    return "config/guardian.json";
}

void apply_environment_overrides(GuardianConfig& config) {
    if (auto dir = read_env("GUARDIAN_EVIDENCE_DIR"); dir && !dir->empty()) {
        config.ledger.evidence_dir = *dir;
    }
    if (auto raw = read_env("GUARDIAN_HTTP_TIMEOUT_MS"); raw && !raw->empty()) {
        char* end = nullptr;
        const long candidate = std::strtol(raw->c_str(), &end, 10);
        if (end == raw->c_str() || *end != '\0' || candidate <= 0) {
            throw ConfigError("GUARDIAN_HTTP_TIMEOUT_MS must be a positive integer");
        }
        config.backend.timeout_ms = candidate;
    }
}

PolicyConfig default_policy_config() {
    PolicyConfig config;

    config.jurisdictions["UK"] = {"UK", "public_task", ""};
    config.jurisdictions["EU"] = {"EU", "legitimate_interest", ""};
    config.jurisdictions["US"] = {"US", "consent_or_legal_obligation", ""};
    config.jurisdictions["IE"] = {"IE", "legitimate_interest", "EU"};
    config.jurisdictions["SCT"] = {"SCT", "public_task", "UK"};

    config.audience_weights = {{"child", 0.8}, {"teen", 0.6}, {"adult", 0.3}};

    auto& rules = config.rules;
    rules.push_back(make_rule("minor-safety.exploitation", "minor-safety", 1.0, true,
                              {"child sexual", "csam", "exploit a child"}, true, true));
    rules.push_back(make_rule("self-harm.intent", "self-harm", 1.0, true,
                              {"suicide", "how to hurt"}, true, false));
    rules.push_back(make_rule("violence.weapons", "violence", 1.0, true,
                              {"bomb", "make a weapon"}, true, false));
    rules.push_back(make_rule("cyber.intrusion", "cyber", 1.0, true, {"how to hack"}, true, false));
    rules.push_back(make_rule("manipulation.instruction-override", "manipulation", 0.5, false,
                              {"ignore previous instructions", "ignore all previous instructions",
                               "disregard your rules"}, true, false));
    rules.push_back(make_rule("manipulation.jailbreak", "manipulation", 0.5, false,
                              {"jailbreak", "developer mode"}, true, false));
    rules.push_back(make_rule("content.sensitive-terms", "content", 0.15, false,
                              {"violence", "hate", "weapon", "terror"}, true, true));
    rules.push_back(make_rule("grooming.secrecy", "minor-safety", 1.0, true,
                              {"don't tell your parents", "keep this secret", "i can meet you alone"}, false, true));

    Rule irreversible = make_rule("irreversibility.destructive-action", "irreversibility", 0.2, false,
                                  {"cannot be undone", "permanently delete", "rm -rf"}, false, true);
    irreversible.irreversible = true;
    rules.push_back(std::move(irreversible));

    Rule pii = make_rule("privacy.personal-data", "privacy", 0.3, false, {"home address of"}, true, true);
    pii.pattern = R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})";
    pii.regex.emplace(pii.pattern, std::regex::ECMAScript | std::regex::icase);
    rules.push_back(std::move(pii));

    Rule knives = make_rule("age-restricted.knife-sale", "age-restricted-goods", 0.6, false,
                            {"buy a knife", "buy knives"}, true, false);
    knives.jurisdictions = {"UK"};
    rules.push_back(std::move(knives));

    Rule child_topics = make_rule("audience.child-mature-topic", "minor-safety", 0.4, false,
                                  {"dating", "alcohol"}, true, false);
    child_topics.when["audience"] = Json("child");
    rules.push_back(std::move(child_topics));

    for (auto& rule : rules) {
        if (rule.description.empty()) {
            rule.description = rule.category + " rule";
        }
    }
    return config;
}

} // namespace guardian
