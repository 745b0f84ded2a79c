#pragma once

#include "backend/generator.hpp"
#include "json.hpp"
#include "ledger.hpp"
#include "policy_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace guardian {

struct GatewayOptions {
    long timeout_ms = 60000;
    int max_attempts = 2;
    std::size_t bundle_every = 0;          // 0 disables periodic snapshots
    std::filesystem::path bundle_dir;      // empty: <ledger root>/bundles
};

struct CheckResult {
    Decision status = Decision::Pass;
    double risk = 0.0;
    std::string rationale;
    double protection_index = 0.0;
    std::vector<std::string> fired;
    std::string jurisdiction;  // resolved code
    std::string lawful_basis;  // from the resolved jurisdiction profile, may be empty
    std::uint64_t sequence = 0;

    Json to_json() const;
};

struct AnswerResult {
    Decision status = Decision::Pass;
    bool blocked = true;
    std::optional<std::string> safe_output;
    std::string rationale;
    std::optional<double> mhi;  // absent when no post-check ran
    std::uint64_t sequence = 0;

    Json to_json() const;
};

struct VerifyResult {
    bool reversible = false;
    bool blocked = true;
    std::string rationale;
    double mhi = 0.0;
    std::string hash;  // SHA-256 of the verified output
    std::uint64_t sequence = 0;

    Json to_json() const;
};

/**
 * Gateway
 *
 * Sequences one request through pre-check, generation, post-check, indices
 * and the ledger. Every decision is appended before its response is
 * returned. Holds no per-request state; the ledger is the only shared
 * mutable resource and is owned by the caller.
 *
 * Generation runs with a per-attempt timeout and at most max_attempts
 * attempts. When every attempt times out the request is deferred and the
 * deferral recorded; any other exhaustion records a halt and raises
 * GenerationError.
 */
class Gateway {
public:
    // generator may be null; answer() then raises GenerationError.
    Gateway(const PolicyEngine& engine, Ledger& ledger, backend::Generator* generator, GatewayOptions options = {});

    CheckResult check(const std::string& prompt, const JsonObject& context, const std::string& jurisdiction = {});
    AnswerResult answer(const std::string& prompt, const JsonObject& context, const std::string& jurisdiction = {});
    VerifyResult verify_output(const std::string& output, const JsonObject& meta, const std::string& jurisdiction = {});

    // Exports the whole ledger under the bundle directory.
    std::filesystem::path export_bundle();

    const Ledger& ledger() const noexcept { return m_ledger; }

private:
    const PolicyEngine& m_engine;
    Ledger& m_ledger;
    backend::Generator* m_generator;
    GatewayOptions m_options;

    std::string generate_with_retry(const std::string& prompt);
    AppendResult record(DecisionRecord record);
    std::filesystem::path bundle_dir() const;
};

} // namespace guardian
