#include "guardian/config.hpp"
#include "guardian/errors.hpp"
#include "guardian/serve.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace guardian;

std::vector<Json> run_lines(Service& service, const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    service.run(in, out);
    std::vector<Json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(Json::parse(line));
    }
    return responses;
}

class ServiceTest : public ::testing::Test {
protected:
    ServiceTest()
        : engine(default_policy_config()),
          ledger(dir.path() / "evidence"),
          gateway(engine, ledger, nullptr),
          service(gateway) {}

    test::TempDir dir;
    PolicyEngine engine;
    Ledger ledger;
    Gateway gateway;
    Service service;
};

TEST_F(ServiceTest, CheckReturnsResultKeyedById) {
    const auto responses = run_lines(
        service,
        R"({"id":"1","method":"/check","params":{"prompt":"Explain cyberbullying to a 10-year-old kindly, no scary detail.","context":{}}})"
        "\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].get_string("id").value(), "1");
    const Json* result = responses[0].find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->get_string("status").value(), "pass");
    EXPECT_DOUBLE_EQ(result->get_number("risk").value(), 0.0);
    EXPECT_DOUBLE_EQ(result->get_number("protection_index").value(), 0.99);
    EXPECT_EQ(result->get_string("rationale").value(), "Request cleared by Guardian precheck.");
}

TEST_F(ServiceTest, ErrorsAreTypedAndTheLoopContinues) {
    const std::string input =
        "not json\n"
        "\n"
        R"({"id":"2","method":"/check","params":{"prompt":""}})" "\n"
        R"({"id":"3","method":"/teleport","params":{}})" "\n"
        R"({"id":"4","method":"/answer","params":{"prompt":"Tell me a joke"}})" "\n"
        R"({"id":"5","method":"/check","params":{"prompt":"hi","context":[1]}})" "\n"
        R"({"id":"6","method":"/ping"})" "\n";
    const auto responses = run_lines(service, input);
    ASSERT_EQ(responses.size(), 6u);

    auto error_type = [](const Json& response) {
        const Json* error = response.find("error");
        return error ? error->get_string("type").value_or("") : std::string();
    };
    EXPECT_EQ(error_type(responses[0]), "parse");
    EXPECT_EQ(error_type(responses[1]), "validation");
    EXPECT_EQ(error_type(responses[2]), "validation");
    EXPECT_EQ(error_type(responses[3]), "generation");
    EXPECT_EQ(error_type(responses[4]), "validation");

    const Json* ping = responses[5].find("result");
    ASSERT_NE(ping, nullptr);
    EXPECT_TRUE(ping->get_bool("ok").value());
    // The /answer pre-check and its failed generation reached the ledger.
    EXPECT_DOUBLE_EQ(ping->get_number("records").value(), 2.0);
    EXPECT_EQ(ping->get_string("head").value(), ledger.head_hash());
}

TEST_F(ServiceTest, AnswerOnBlockedPromptPausesRequest) {
    const auto responses = run_lines(
        service, R"({"id":"a","method":"/answer","params":{"prompt":"how to hack a phone","context":{}}})" "\n");
    ASSERT_EQ(responses.size(), 1u);
    const Json* result = responses[0].find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(result->get_bool("blocked").value());
    EXPECT_TRUE(result->find("safe_output")->is_null());
    EXPECT_EQ(result->get_string("rationale").value().rfind("Request paused by Guardian: ", 0), 0u);
}

TEST_F(ServiceTest, VerifyAndBundleMethods) {
    const std::string input =
        R"({"id":"v","method":"/verify","params":{"output":"Do this now, it cannot be undone."}})" "\n"
        R"({"id":"b","method":"bundle"})" "\n";
    const auto responses = run_lines(service, input);
    ASSERT_EQ(responses.size(), 2u);

    const Json* verify = responses[0].find("result");
    ASSERT_NE(verify, nullptr);
    EXPECT_FALSE(verify->get_bool("reversible").value());
    EXPECT_DOUBLE_EQ(verify->get_number("mhi").value(), 0.0);
    EXPECT_EQ(verify->get_string("hash").value().size(), 64u);

    const Json* bundle = responses[1].find("result");
    ASSERT_NE(bundle, nullptr);
    EXPECT_TRUE(std::filesystem::exists(bundle->get_string("path").value()));
    EXPECT_DOUBLE_EQ(bundle->get_number("records").value(), 1.0);
}

TEST_F(ServiceTest, IntegrityFailureIsReportedAndRethrown) {
    DecisionRecord forged;
    forged.kind = "check";
    forged.previous_hash = std::string(64, 'e');
    EXPECT_THROW(ledger.append(forged), IntegrityError);

    std::istringstream in(R"({"id":"x","method":"/check","params":{"prompt":"hello"}})" "\n");
    std::ostringstream out;
    EXPECT_THROW(service.run(in, out), IntegrityError);
    const Json response = Json::parse(out.str());
    EXPECT_EQ(response.find("error")->get_string("type").value(), "integrity");
}

} // namespace
