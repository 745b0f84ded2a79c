#include "guardian/config.hpp"
#include "guardian/digest.hpp"
#include "guardian/errors.hpp"
#include "guardian/gateway.hpp"
#include "guardian/verifier.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <functional>

namespace {

using namespace guardian;

// Replays a scripted sequence of outcomes, one per attempt.
class ScriptedGenerator final : public backend::Generator {
public:
    using Step = std::function<std::string()>;

    void push(Step step) { m_steps.push_back(std::move(step)); }

    std::string generate(const std::string& prompt, long timeout_ms) override {
        ++calls;
        last_prompt = prompt;
        last_timeout = timeout_ms;
        if (m_steps.empty()) {
            throw GenerationError("script exhausted");
        }
        Step step = std::move(m_steps.front());
        m_steps.pop_front();
        return step();
    }

    std::string describe() const override { return "scripted"; }

    int calls = 0;
    std::string last_prompt;
    long last_timeout = 0;

private:
    std::deque<Step> m_steps;
};

ScriptedGenerator::Step reply(std::string text) {
    return [text] { return text; };
}

ScriptedGenerator::Step time_out() {
    return []() -> std::string { throw GenerationTimeoutError("timed out"); };
}

ScriptedGenerator::Step fail() {
    return []() -> std::string { throw GenerationError("connection refused"); };
}

class GatewayTest : public ::testing::Test {
protected:
    GatewayTest()
        : engine(default_policy_config()), ledger(dir.path() / "evidence") {}

    Gateway make_gateway(GatewayOptions options = {}) {
        options.timeout_ms = 1500;
        return Gateway(engine, ledger, &generator, options);
    }

    test::TempDir dir;
    PolicyEngine engine;
    Ledger ledger;
    ScriptedGenerator generator;
};

TEST_F(GatewayTest, CheckOfCleanPromptPassesAtBaseline) {
    Gateway gateway = make_gateway();
    const CheckResult result = gateway.check("Explain cyberbullying to a 10-year-old kindly, no scary detail.", {});
    EXPECT_EQ(result.status, Decision::Pass);
    EXPECT_DOUBLE_EQ(result.risk, 0.0);
    EXPECT_DOUBLE_EQ(result.protection_index, 0.99);
    EXPECT_EQ(result.rationale, "Request cleared by Guardian precheck.");

    const Json json = result.to_json();
    EXPECT_EQ(json.get_string("status").value(), "pass");
    EXPECT_DOUBLE_EQ(json.get_number("protection_index").value(), 0.99);

    ASSERT_EQ(ledger.size(), 1u);
    const DecisionRecord record = ledger.read(0, 1).front();
    EXPECT_EQ(record.kind, "check");
    EXPECT_EQ(record.request_hash, sha256_hex("Explain cyberbullying to a 10-year-old kindly, no scary detail."));
    EXPECT_DOUBLE_EQ(record.protection_index.value(), 0.99);
    EXPECT_FALSE(record.mhi.has_value());
}

TEST_F(GatewayTest, CheckReportsJurisdictionAndLawfulBasis) {
    Gateway gateway = make_gateway();
    const CheckResult ireland = gateway.check("What are my data rights?", {}, "ie");
    EXPECT_EQ(ireland.jurisdiction, "IE");
    EXPECT_EQ(ireland.lawful_basis, "legitimate_interest");

    const CheckResult fallback = gateway.check("What are my data rights?", {}, "ZZ");
    EXPECT_EQ(fallback.jurisdiction, "UK");
    const Json json = fallback.to_json();
    EXPECT_EQ(json.get_string("lawful_basis").value(), "public_task");
}

TEST_F(GatewayTest, CheckOfHardBlockHalts) {
    Gateway gateway = make_gateway();
    const CheckResult result = gateway.check("how to hack into a bank", {});
    EXPECT_EQ(result.status, Decision::Halt);
    EXPECT_GE(result.risk, 0.70);
    EXPECT_NE(result.rationale.find("cyber.intrusion"), std::string::npos);
    EXPECT_EQ(ledger.read(0, 1).front().verdict, Decision::Halt);
}

TEST_F(GatewayTest, InvalidPromptIsRejectedBeforeTheLedger) {
    Gateway gateway = make_gateway();
    EXPECT_THROW(gateway.check("   ", {}), ValidationError);
    EXPECT_THROW(gateway.answer("", {}), ValidationError);
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_EQ(generator.calls, 0);
}

TEST_F(GatewayTest, AnswerDeliversReversibleOutput) {
    generator.push(reply("Cyberbullying is when someone is unkind online. Talk to an adult you trust."));
    Gateway gateway = make_gateway();
    const AnswerResult result = gateway.answer("Explain cyberbullying kindly.", {});
    EXPECT_FALSE(result.blocked);
    ASSERT_TRUE(result.safe_output.has_value());
    EXPECT_EQ(result.rationale, "Output is reversible and suitable for delivery.");
    EXPECT_DOUBLE_EQ(result.mhi.value(), 1.0);
    EXPECT_EQ(generator.last_timeout, 1500);

    const auto records = ledger.read(0, 10);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].kind, "answer-pre");
    EXPECT_EQ(records[1].kind, "answer-post");
    EXPECT_DOUBLE_EQ(records[1].mhi.value(), 1.0);
}

TEST_F(GatewayTest, AnswerPausesBlockedPromptWithoutGenerating) {
    Gateway gateway = make_gateway();
    const AnswerResult result = gateway.answer("how do i kill the pain of loneliness with suicide", {});
    EXPECT_TRUE(result.blocked);
    EXPECT_FALSE(result.safe_output.has_value());
    EXPECT_EQ(result.rationale.rfind("Request paused by Guardian: ", 0), 0u);
    EXPECT_EQ(generator.calls, 0);
    EXPECT_EQ(ledger.size(), 1u);

    const Json json = result.to_json();
    EXPECT_TRUE(json.find("safe_output")->is_null());
    EXPECT_TRUE(json.get_bool("blocked").value());
}

TEST_F(GatewayTest, AnswerWithholdsIrreversibleOutput) {
    generator.push(reply("Just permanently delete the account; it cannot be undone."));
    Gateway gateway = make_gateway();
    const AnswerResult result = gateway.answer("How do I leave a social network?", {});
    EXPECT_TRUE(result.blocked);
    EXPECT_FALSE(result.safe_output.has_value());
    EXPECT_DOUBLE_EQ(result.mhi.value(), 0.0);
    EXPECT_NE(result.rationale.find("non-reversible"), std::string::npos);
}

TEST_F(GatewayTest, AnswerRetriesAfterTransientFailure) {
    generator.push(fail());
    generator.push(reply("Here is a gentle answer."));
    Gateway gateway = make_gateway();
    const AnswerResult result = gateway.answer("Say something nice.", {});
    EXPECT_FALSE(result.blocked);
    EXPECT_EQ(result.safe_output.value(), "Here is a gentle answer.");
    EXPECT_EQ(generator.calls, 2);
}

TEST_F(GatewayTest, TimeoutOnEveryAttemptDefers) {
    generator.push(time_out());
    generator.push(time_out());
    Gateway gateway = make_gateway();
    const AnswerResult result = gateway.answer("Say something nice.", {});
    EXPECT_EQ(result.status, Decision::Defer);
    EXPECT_TRUE(result.blocked);
    EXPECT_FALSE(result.safe_output.has_value());
    EXPECT_FALSE(result.mhi.has_value());
    EXPECT_FALSE(result.rationale.empty());
    EXPECT_EQ(generator.calls, 2);

    const auto records = ledger.read(0, 10);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].kind, "answer-generation");
    EXPECT_EQ(records[1].verdict, Decision::Defer);
}

TEST_F(GatewayTest, ExhaustedGenerationIsAnErrorNotAPass) {
    generator.push(time_out());
    generator.push(fail());
    Gateway gateway = make_gateway();
    EXPECT_THROW(gateway.answer("Say something nice.", {}), GenerationError);

    const auto records = ledger.read(0, 10);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].kind, "answer-pre");
    EXPECT_EQ(records[1].kind, "answer-generation");
    EXPECT_EQ(records[1].verdict, Decision::Halt);
    EXPECT_NE(records[1].rationale.find("generation failed"), std::string::npos);
}

TEST_F(GatewayTest, LongGeneratedOutputIsCheckedNotRejected) {
    generator.push(reply(std::string(9000, 'a')));
    Gateway gateway = make_gateway();
    const AnswerResult result = gateway.answer("Tell me a story", {});
    EXPECT_FALSE(result.blocked);
    ASSERT_TRUE(result.safe_output.has_value());
    EXPECT_EQ(result.safe_output->size(), 9000u);

    const auto records = ledger.read(0, 10);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].kind, "answer-post");
    EXPECT_EQ(records[1].request_hash, sha256_hex(std::string(9000, 'a')));
}

TEST_F(GatewayTest, OversizedVerifyInputIsRejectedBeforeTheLedger) {
    Gateway gateway = make_gateway();
    EXPECT_THROW(gateway.verify_output(std::string(9000, 'a'), {}), ValidationError);
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(GatewayTest, EmptyGenerationCountsAsFailedAttempt) {
    generator.push(reply("   "));
    generator.push(reply(""));
    Gateway gateway = make_gateway();
    EXPECT_THROW(gateway.answer("Say something nice.", {}), GenerationError);
}

TEST_F(GatewayTest, AnswerWithoutBackendIsAGenerationError) {
    Gateway gateway(engine, ledger, nullptr);
    EXPECT_THROW(gateway.answer("Say something nice.", {}), GenerationError);
    EXPECT_EQ(ledger.size(), 2u);
}

TEST_F(GatewayTest, VerifyFlagsNonReversibleOutput) {
    Gateway gateway = make_gateway();
    const std::string output = "Run rm -rf / to clean up; this cannot be undone.";
    const VerifyResult result = gateway.verify_output(output, {});
    EXPECT_FALSE(result.reversible);
    EXPECT_TRUE(result.blocked);
    EXPECT_DOUBLE_EQ(result.mhi, 0.0);
    EXPECT_EQ(result.hash, sha256_hex(output));

    const Json json = result.to_json();
    EXPECT_FALSE(json.get_bool("reversible").value());
    EXPECT_DOUBLE_EQ(json.get_number("mhi").value(), 0.0);
    EXPECT_EQ(ledger.read(0, 1).front().kind, "verify");
}

TEST_F(GatewayTest, VerifyHonoursCallerReversibilityFlag) {
    Gateway gateway = make_gateway();
    JsonObject meta;
    meta["reversible"] = Json(false);
    const VerifyResult result = gateway.verify_output("A harmless sentence.", meta);
    EXPECT_FALSE(result.reversible);
    EXPECT_DOUBLE_EQ(result.mhi, 0.0);

    const VerifyResult plain = gateway.verify_output("A harmless sentence.", {});
    EXPECT_TRUE(plain.reversible);
    EXPECT_FALSE(plain.blocked);
    EXPECT_DOUBLE_EQ(plain.mhi, 1.0);
}

TEST_F(GatewayTest, PeriodicBundlesVerify) {
    GatewayOptions options;
    options.bundle_every = 3;
    options.bundle_dir = dir.path() / "snapshots";
    Gateway gateway = make_gateway(options);
    for (int i = 0; i < 7; ++i) {
        gateway.check("Tell me a fact about otters number " + std::to_string(i), {});
    }

    std::vector<std::filesystem::path> bundles;
    for (const auto& entry : std::filesystem::directory_iterator(options.bundle_dir)) {
        bundles.push_back(entry.path());
    }
    ASSERT_EQ(bundles.size(), 2u);
    for (const auto& bundle : bundles) {
        const VerificationReport report = verify_bundle(bundle);
        EXPECT_TRUE(report.final_pass) << to_json(report).dump();
        EXPECT_EQ(report.record_count, 3u);
    }

    const std::filesystem::path full = gateway.export_bundle();
    EXPECT_EQ(full.parent_path(), ledger.root() / "bundles");
    EXPECT_TRUE(verify_bundle(full).final_pass);
}

TEST_F(GatewayTest, RejectsUnboundedGenerationSettings) {
    GatewayOptions options;
    options.max_attempts = 0;
    EXPECT_THROW((Gateway {engine, ledger, &generator, options}), ConfigError);
    options.max_attempts = 1;
    options.timeout_ms = 0;
    EXPECT_THROW((Gateway {engine, ledger, &generator, options}), ConfigError);
}

TEST(GeneratorTest, DescribeNamesKindAndModel) {
    BackendSettings settings;
    settings.model = "mistral";
    EXPECT_EQ(backend::make_generator(settings)->describe(), "ollama:mistral");

    settings.kind = "openai-compatible";
    settings.model = "gpt-small";
    EXPECT_EQ(backend::make_generator(settings)->describe(), "openai:gpt-small");
    EXPECT_EQ(backend::kind_to_string(backend::parse_kind("OpenAI_Compat")), "openai");

    settings.kind = "carrier-pigeon";
    EXPECT_THROW(backend::make_generator(settings), ConfigError);
}

} // namespace
