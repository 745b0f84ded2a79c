#include "../include/guardian/gateway.hpp"
#include "../include/guardian/digest.hpp"
#include "../include/guardian/errors.hpp"
#include "../include/guardian/indices.hpp"
#include "../include/guardian/log.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace guardian {

namespace {

std::string fixed2(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string summarize(const std::string& kind, std::uint64_t sequence, Decision decision, double risk,
                      const std::vector<std::string>& fired) {
    std::string out = kind + " #" + std::to_string(sequence) + " " + to_string(decision) + " risk=" + fixed2(risk);
    if (!fired.empty()) {
        out += " rules=[";
        for (std::size_t i = 0; i < fired.size(); ++i) {
            out += (i == 0 ? "" : ",") + fired[i];
        }
        out += "]";
    }
    return out;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

JsonArray to_array(const std::vector<std::string>& values) {
    JsonArray array;
    for (const auto& value : values) {
        array.emplace_back(Json(value));
    }
    return array;
}

DecisionRecord make_record(const std::string& kind, const std::string& text, const std::string& timestamp,
                           const Verdict& verdict) {
    DecisionRecord record;
    record.timestamp = timestamp;
    record.kind = kind;
    record.request_hash = sha256_hex(text);
    record.verdict = verdict.decision;
    record.risk = verdict.risk;
    record.fired = verdict.fired;
    record.rationale = verdict.rationale;
    return record;
}

} // namespace

Json CheckResult::to_json() const {
    JsonObject out;
    out["status"] = Json(to_string(status));
    out["risk"] = Json(risk);
    out["rationale"] = Json(rationale);
    out["protection_index"] = Json(protection_index);
    out["fired"] = Json(to_array(fired));
    out["jurisdiction"] = Json(jurisdiction);
    out["lawful_basis"] = Json(lawful_basis);
    out["sequence"] = Json(sequence);
    return Json(out);
}

Json AnswerResult::to_json() const {
    JsonObject out;
    out["status"] = Json(to_string(status));
    out["blocked"] = Json(blocked);
    out["safe_output"] = safe_output ? Json(*safe_output) : Json(nullptr);
    out["rationale"] = Json(rationale);
    if (mhi) {
        out["mhi"] = Json(*mhi);
    }
    out["sequence"] = Json(sequence);
    return Json(out);
}

Json VerifyResult::to_json() const {
    JsonObject out;
    out["reversible"] = Json(reversible);
    out["blocked"] = Json(blocked);
    out["rationale"] = Json(rationale);
    out["mhi"] = Json(mhi);
    out["hash"] = Json(hash);
    out["sequence"] = Json(sequence);
    return Json(out);
}

Gateway::Gateway(const PolicyEngine& engine, Ledger& ledger, backend::Generator* generator, GatewayOptions options)
    : m_engine(engine), m_ledger(ledger), m_generator(generator), m_options(std::move(options)) {
    if (m_options.timeout_ms <= 0) {
        throw ConfigError("generation timeout must be positive");
    }
    if (m_options.max_attempts < 1) {
        throw ConfigError("max_attempts must be at least 1");
    }
}

std::filesystem::path Gateway::bundle_dir() const {
    return m_options.bundle_dir.empty() ? m_ledger.root() / "bundles" : m_options.bundle_dir;
}

AppendResult Gateway::record(DecisionRecord record) {
    const AppendResult appended = m_ledger.append(std::move(record));
    const std::size_t every = m_options.bundle_every;
    if (every > 0 && (appended.sequence + 1) % every == 0) {
        try {
            m_ledger.export_bundle(bundle_dir(), appended.sequence + 1 - every, every);
        } catch (const std::exception& ex) {
            log("Gateway", std::string("Periodic bundle export failed: ") + ex.what());
        }
    }
    return appended;
}

CheckResult Gateway::check(const std::string& prompt, const JsonObject& context, const std::string& jurisdiction) {
    const Request request {prompt, context, jurisdiction, utc_timestamp()};
    const Verdict verdict = m_engine.evaluate(request, Phase::Pre);
    const double index = protection_index(verdict, m_engine.config().indices);

    DecisionRecord entry = make_record("check", prompt, request.timestamp, verdict);
    entry.protection_index = index;
    const AppendResult appended = record(std::move(entry));
    log("Gateway", summarize("check", appended.sequence, verdict.decision, verdict.risk, verdict.fired));

    CheckResult result;
    result.status = verdict.decision;
    result.risk = verdict.risk;
    result.rationale = verdict.rationale;
    result.protection_index = index;
    result.fired = verdict.fired;
    result.jurisdiction = verdict.jurisdiction;
    result.lawful_basis = m_engine.config().jurisdictions.at(verdict.jurisdiction).lawful_basis;
    result.sequence = appended.sequence;
    return result;
}

AnswerResult Gateway::answer(const std::string& prompt, const JsonObject& context, const std::string& jurisdiction) {
    const Request request {prompt, context, jurisdiction, utc_timestamp()};
    const Verdict pre = m_engine.evaluate(request, Phase::Pre);

    DecisionRecord pre_entry = make_record("answer-pre", prompt, request.timestamp, pre);
    pre_entry.protection_index = protection_index(pre, m_engine.config().indices);
    const AppendResult pre_appended = record(std::move(pre_entry));
    log("Gateway", summarize("answer-pre", pre_appended.sequence, pre.decision, pre.risk, pre.fired));

    AnswerResult result;
    if (pre.decision != Decision::Pass) {
        result.status = pre.decision;
        result.blocked = true;
        result.rationale = "Request paused by Guardian: " + pre.rationale;
        result.sequence = pre_appended.sequence;
        return result;
    }

    std::string output;
    try {
        output = generate_with_retry(prompt);
    } catch (const GenerationTimeoutError& ex) {
        Verdict deferred;
        deferred.decision = Decision::Defer;
        deferred.risk = pre.risk;
        deferred.rationale = "Guardian defer: generation backend timed out after " +
                             std::to_string(m_options.max_attempts) + " attempt(s); held for review";
        const AppendResult appended = record(make_record("answer-generation", prompt, request.timestamp, deferred));
        log("Gateway", summarize("answer-generation", appended.sequence, deferred.decision, deferred.risk, {}) +
                           " (" + ex.what() + ")");
        result.status = Decision::Defer;
        result.blocked = true;
        result.rationale = deferred.rationale;
        result.sequence = appended.sequence;
        return result;
    } catch (const GenerationError& ex) {
        Verdict failed;
        failed.decision = Decision::Halt;
        failed.risk = pre.risk;
        failed.rationale = std::string("Guardian halt: generation failed; ") + ex.what();
        const AppendResult appended = record(make_record("answer-generation", prompt, request.timestamp, failed));
        log("Gateway", summarize("answer-generation", appended.sequence, failed.decision, failed.risk, {}));
        throw;
    }

    const Request post_request {output, context, jurisdiction, request.timestamp};
    const Verdict post = m_engine.evaluate(post_request, Phase::Post);
    const double mhi = moral_health_index(post);
    const bool blocked = post.decision != Decision::Pass || !post.reversible;

    DecisionRecord post_entry = make_record("answer-post", output, request.timestamp, post);
    post_entry.mhi = mhi;
    const AppendResult appended = record(std::move(post_entry));
    log("Gateway", summarize("answer-post", appended.sequence, post.decision, post.risk, post.fired) +
                       (blocked ? " withheld" : " delivered"));

    result.status = post.decision;
    result.blocked = blocked;
    if (!blocked) {
        result.safe_output = output;
    }
    result.rationale = post.rationale;
    result.mhi = mhi;
    result.sequence = appended.sequence;
    return result;
}

VerifyResult Gateway::verify_output(const std::string& output, const JsonObject& meta, const std::string& jurisdiction) {
    m_engine.check_input(output);
    const Request request {output, meta, jurisdiction, utc_timestamp()};
    const Verdict verdict = m_engine.evaluate(request, Phase::Post);
    const double mhi = moral_health_index(verdict);

    DecisionRecord entry = make_record("verify", output, request.timestamp, verdict);
    entry.mhi = mhi;
    const AppendResult appended = record(std::move(entry));
    log("Gateway", summarize("verify", appended.sequence, verdict.decision, verdict.risk, verdict.fired));

    VerifyResult result;
    result.reversible = verdict.reversible;
    result.blocked = verdict.decision != Decision::Pass || !verdict.reversible;
    result.rationale = verdict.rationale;
    result.mhi = mhi;
    result.hash = sha256_hex(output);
    result.sequence = appended.sequence;
    return result;
}

std::filesystem::path Gateway::export_bundle() {
    return m_ledger.export_bundle(bundle_dir());
}

std::string Gateway::generate_with_retry(const std::string& prompt) {
    if (!m_generator) {
        throw GenerationError("no generation backend configured");
    }
    int timeouts = 0;
    std::string last_error;
    for (int attempt = 1; attempt <= m_options.max_attempts; ++attempt) {
        try {
            std::string text = m_generator->generate(prompt, m_options.timeout_ms);
            if (!text.empty() && !is_blank(text)) {
                return text;
            }
            last_error = "empty response";
        } catch (const GenerationTimeoutError& ex) {
            ++timeouts;
            last_error = ex.what();
        } catch (const GenerationError& ex) {
            last_error = ex.what();
        }
        log("Gateway", m_generator->describe() + " attempt " + std::to_string(attempt) + "/" +
                           std::to_string(m_options.max_attempts) + " failed: " + last_error);
    }
    if (timeouts == m_options.max_attempts) {
        throw GenerationTimeoutError("generation timed out after " + std::to_string(timeouts) + " attempt(s)");
    }
    throw GenerationError("generation failed after " + std::to_string(m_options.max_attempts) +
                          " attempt(s): " + last_error);
}

} // namespace guardian
