#include "../include/guardian/policy_engine.hpp"
#include "../include/guardian/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

namespace guardian {

namespace {

std::string lowered(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(out), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string uppered(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(out), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string fixed2(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string join_ids(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) {
            out += ", ";
        }
        out += id;
    }
    return out;
}

bool context_matches(const JsonObject& when, const JsonObject& context) {
    for (const auto& [key, expected] : when) {
        const auto it = context.find(key);
        if (it == context.end() || it->second.dump() != expected.dump()) {
            return false;
        }
    }
    return true;
}

// Returns the evidence string for a text hit, or nullopt when the text conditions fail.
std::optional<std::string> match_text(const Rule& rule, const std::string& text, const std::string& lowered_text) {
    for (const auto& phrase : rule.phrases) {
        if (lowered_text.find(phrase) != std::string::npos) {
            return phrase;
        }
    }
    if (rule.regex) {
        std::smatch match;
        if (std::regex_search(text, match, *rule.regex)) {
            return match.str(0);
        }
    }
    return std::nullopt;
}

std::string describe_context(const JsonObject& when) {
    std::string out = "context:";
    bool first = true;
    for (const auto& [key, value] : when) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += key + "=" + (value.is_string() ? value.as_string() : value.dump());
    }
    return out;
}

} // namespace

std::string to_string(Decision decision) {
    switch (decision) {
    case Decision::Pass: return "pass";
    case Decision::Halt: return "halt";
    case Decision::Defer: return "defer";
    }
    return "unknown";
}

Decision parse_decision(const std::string& name) {
    if (name == "pass") return Decision::Pass;
    if (name == "halt") return Decision::Halt;
    if (name == "defer") return Decision::Defer;
    throw std::invalid_argument("unknown decision: " + name);
}

double aggregate_risk(const std::vector<double>& severities) {
    double clear = 1.0;
    for (double severity : severities) {
        clear *= 1.0 - std::clamp(severity, 0.0, 1.0);
    }
    const double risk = std::clamp(1.0 - clear, 0.0, 1.0);
    return std::round(risk * 1e6) / 1e6;
}

PolicyEngine::PolicyEngine(PolicyConfig config)
    : m_config(std::move(config)) {
    validate();
}

void PolicyEngine::validate() {
    const auto& thresholds = m_config.thresholds;
    if (!(thresholds.defer >= 0.0 && thresholds.defer < thresholds.halt && thresholds.halt <= 1.0)) {
        throw ConfigError("thresholds must satisfy 0 <= defer < halt <= 1");
    }
    const auto& indices = m_config.indices;
    if (!(indices.protection_floor >= 0.0 && indices.protection_floor <= indices.protection_baseline &&
          indices.protection_baseline <= 1.0)) {
        throw ConfigError("index calibration must satisfy 0 <= floor <= baseline <= 1");
    }
    if (m_config.max_prompt_chars == 0) {
        throw ConfigError("max_prompt_chars must be positive");
    }

    m_config.default_jurisdiction = uppered(m_config.default_jurisdiction);
    if (m_config.default_jurisdiction.empty()) {
        throw ConfigError("default jurisdiction must be set");
    }
    if (m_config.jurisdictions.empty()) {
        m_config.jurisdictions[m_config.default_jurisdiction] = {m_config.default_jurisdiction, "", ""};
    }
    if (m_config.jurisdictions.count(m_config.default_jurisdiction) == 0) {
        throw ConfigError("default jurisdiction '" + m_config.default_jurisdiction + "' is not configured");
    }
    for (const auto& [code, profile] : m_config.jurisdictions) {
        std::set<std::string> visited {code};
        std::string path = code;
        std::string next = profile.fallback;
        while (!next.empty()) {
            const auto it = m_config.jurisdictions.find(next);
            if (it == m_config.jurisdictions.end()) {
                throw ConfigError("jurisdiction '" + code + "' falls back to unknown '" + next + "'");
            }
            path += " -> " + next;
            if (!visited.insert(next).second) {
                throw ConfigError("cyclic jurisdiction fallback: " + path);
            }
            next = it->second.fallback;
        }
    }

    for (const auto& rule : m_config.rules) {
        if (rule.id.empty()) {
            throw ConfigError("rule with empty id");
        }
        if (!(rule.severity >= 0.0 && rule.severity <= 1.0)) {
            throw ConfigError("rule '" + rule.id + "': severity must be within [0,1]");
        }
        if (!rule.applies_pre && !rule.applies_post) {
            throw ConfigError("rule '" + rule.id + "': applies to no phase");
        }
        if (rule.phrases.empty() && !rule.regex && rule.when.empty()) {
            throw ConfigError("rule '" + rule.id + "': has no predicate");
        }
        if (!rule.pattern.empty() && !rule.regex) {
            throw ConfigError("rule '" + rule.id + "': pattern was not compiled");
        }
        for (const auto& code : rule.jurisdictions) {
            if (m_config.jurisdictions.count(code) == 0) {
                throw ConfigError("rule '" + rule.id + "': unknown jurisdiction '" + code + "'");
            }
        }
    }

    std::sort(m_config.rules.begin(), m_config.rules.end(),
              [](const Rule& lhs, const Rule& rhs) { return lhs.id < rhs.id; });
    const auto duplicate = std::adjacent_find(m_config.rules.begin(), m_config.rules.end(),
                                              [](const Rule& lhs, const Rule& rhs) { return lhs.id == rhs.id; });
    if (duplicate != m_config.rules.end()) {
        throw ConfigError("duplicate rule id '" + duplicate->id + "'");
    }
}

std::vector<std::string> PolicyEngine::jurisdiction_chain(const std::string& tag) const {
    std::string code = uppered(tag);
    if (code.empty() || m_config.jurisdictions.count(code) == 0) {
        code = m_config.default_jurisdiction;
    }
    std::vector<std::string> chain;
    while (!code.empty()) {
        chain.push_back(code);
        code = m_config.jurisdictions.at(code).fallback;
    }
    return chain;
}

double PolicyEngine::audience_weight(const JsonObject& context) const {
    const auto it = context.find("audience");
    if (it == context.end() || !it->second.is_string()) {
        return 0.0;
    }
    const auto weight = m_config.audience_weights.find(lowered(it->second.as_string()));
    return weight == m_config.audience_weights.end() ? 0.0 : weight->second;
}

void PolicyEngine::check_input(const std::string& text) const {
    if (text.empty() || is_blank(text)) {
        throw ValidationError("text must not be empty");
    }
    if (text.size() > m_config.max_prompt_chars) {
        throw ValidationError("text exceeds " + std::to_string(m_config.max_prompt_chars) + " characters");
    }
}

Verdict PolicyEngine::evaluate(const Request& request, Phase phase) const {
    if (phase == Phase::Pre) {
        check_input(request.text);
    } else if (request.text.empty() || is_blank(request.text)) {
        throw ValidationError("text must not be empty");
    }

    Verdict verdict;
    verdict.phase = phase;
    const auto chain = jurisdiction_chain(request.jurisdiction);
    verdict.jurisdiction = chain.front();

    const std::string lowered_text = lowered(request.text);
    const double amplifier = 1.0 + audience_weight(request.context);

    std::vector<double> severities;
    const RuleHit* first_hard_block = nullptr;
    for (const auto& rule : m_config.rules) {
        if (!rule.applies_to(phase)) {
            continue;
        }
        if (!rule.jurisdictions.empty() &&
            std::none_of(chain.begin(), chain.end(), [&rule](const std::string& code) {
                return std::find(rule.jurisdictions.begin(), rule.jurisdictions.end(), code) != rule.jurisdictions.end();
            })) {
            continue;
        }
        if (!context_matches(rule.when, request.context)) {
            continue;
        }
        std::string evidence;
        if (!rule.phrases.empty() || rule.regex) {
            auto matched = match_text(rule, request.text, lowered_text);
            if (!matched) {
                continue;
            }
            evidence = std::move(*matched);
        } else {
            evidence = describe_context(rule.when);
        }

        RuleHit hit;
        hit.rule_id = rule.id;
        hit.category = rule.category;
        hit.severity = std::min(1.0, rule.severity * amplifier);
        hit.hard_block = rule.hard_block;
        hit.irreversible = rule.irreversible;
        hit.evidence = std::move(evidence);
        severities.push_back(hit.severity);
        verdict.fired.push_back(rule.id);
        verdict.hits.push_back(std::move(hit));
    }
    for (const auto& hit : verdict.hits) {
        if (hit.hard_block) {
            first_hard_block = &hit;
            break;
        }
    }

    const auto& thresholds = m_config.thresholds;
    verdict.risk = first_hard_block ? 1.0 : aggregate_risk(severities);

    if (phase == Phase::Post) {
        const RuleHit* irreversible_hit = nullptr;
        for (const auto& hit : verdict.hits) {
            if (hit.irreversible) {
                irreversible_hit = &hit;
                break;
            }
        }
        const auto flag = request.context.find("reversible");
        const bool caller_flagged = flag != request.context.end() && flag->second.is_bool() && !flag->second.as_bool();
        verdict.reversible = irreversible_hit == nullptr && !caller_flagged;
    }

    if (first_hard_block) {
        verdict.decision = Decision::Halt;
        verdict.rationale = "Guardian halt: " + first_hard_block->category + " rule '" + first_hard_block->rule_id +
                            "' matched ('" + first_hard_block->evidence + "')";
    } else if (verdict.risk >= thresholds.halt) {
        verdict.decision = Decision::Halt;
        verdict.rationale = "Guardian halt: aggregate risk " + fixed2(verdict.risk) + " >= " + fixed2(thresholds.halt) +
                            " from rules [" + join_ids(verdict.fired) + "]";
    } else if (verdict.risk >= thresholds.defer) {
        verdict.decision = Decision::Defer;
        verdict.rationale = "Guardian defer: aggregate risk " + fixed2(verdict.risk) + " >= " +
                            fixed2(thresholds.defer) + " from rules [" + join_ids(verdict.fired) +
                            "]; held for review";
    } else if (phase == Phase::Pre) {
        verdict.decision = Decision::Pass;
        verdict.rationale = "Request cleared by Guardian precheck.";
    } else {
        verdict.decision = Decision::Pass;
        if (verdict.reversible) {
            verdict.rationale = "Output is reversible and suitable for delivery.";
        } else {
            const auto hit = std::find_if(verdict.hits.begin(), verdict.hits.end(),
                                          [](const RuleHit& h) { return h.irreversible; });
            verdict.rationale = hit != verdict.hits.end()
                                    ? "Output flagged non-reversible by rule '" + hit->rule_id + "' ('" +
                                          hit->evidence + "'); delivery withheld."
                                    : "Output flagged non-reversible by caller context; delivery withheld.";
        }
    }
    return verdict;
}

} // namespace guardian
