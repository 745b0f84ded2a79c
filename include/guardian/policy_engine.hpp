#pragma once

#include "config.hpp"
#include "json.hpp"

#include <string>
#include <vector>

namespace guardian {

struct Request {
    std::string text;
    JsonObject context;
    std::string jurisdiction;  // empty: configured default
    std::string timestamp;
};

enum class Decision { Pass, Halt, Defer };

std::string to_string(Decision decision);
Decision parse_decision(const std::string& name);

struct RuleHit {
    std::string rule_id;
    std::string category;
    double severity = 0.0;  // after audience amplification
    bool hard_block = false;
    bool irreversible = false;
    std::string evidence;   // matched phrase or regex match
};

struct Verdict {
    Decision decision = Decision::Pass;
    Phase phase = Phase::Pre;
    double risk = 0.0;
    std::string rationale;
    std::vector<std::string> fired;  // ascending rule id
    std::vector<RuleHit> hits;       // same order as fired
    bool reversible = true;          // meaningful for the post phase only
    std::string jurisdiction;        // resolved code
};

// Noisy-OR over severities: 1 - prod(1 - s). Clamped to [0,1] and rounded to 6 decimals.
double aggregate_risk(const std::vector<double>& severities);

/**
 * PolicyEngine
 *
 * Stateless evaluator of text against an immutable rule set. Rules are
 * visited in ascending id order so identical inputs always produce
 * identical verdicts.
 *
 * Decision order:
 *   1. Any hard-block hit halts (risk forced to 1.0).
 *   2. risk >= halt threshold halts.
 *   3. risk >= defer threshold defers.
 *   4. Otherwise pass.
 */
class PolicyEngine {
public:
    // Validates and freezes the rule set. Throws ConfigError.
    explicit PolicyEngine(PolicyConfig config);

    // Throws ValidationError for empty text. The max_prompt_chars limit applies
    // to the pre phase only; generated output may be longer than any prompt.
    Verdict evaluate(const Request& request, Phase phase) const;

    // Caller-supplied text: non-blank and at most max_prompt_chars bytes.
    void check_input(const std::string& text) const;

    // Resolved code followed by its fallbacks; unknown tags resolve to the default.
    std::vector<std::string> jurisdiction_chain(const std::string& tag) const;

    const PolicyConfig& config() const noexcept { return m_config; }
    std::size_t rule_count() const noexcept { return m_config.rules.size(); }

private:
    PolicyConfig m_config;

    void validate();
    double audience_weight(const JsonObject& context) const;
};

} // namespace guardian
