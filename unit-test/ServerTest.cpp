#include <map>
#include <sstream>
#include <thread>
#include "api/server.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fake_sandbox.hpp"
#include "test/kata_dir.hpp"
#include "test/mock_transport.hpp"

using namespace std;
using namespace kata;
using namespace kata::test;
using namespace nlohmann;
using ::testing::_;
using ::testing::AtMost;
using ::testing::Invoke;
using ::testing::Return;

static const char *JUDGMENT = R"({"scores": {"clarity": 90}, "feedback": "Clear", "reasoning": "Concise"})";

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_config config;
        config.run_dir = filesystem::temp_directory_path() / "kata-server-test";
        config.workers = 2;
        config.ai.api_key = "sk-test";
        config.ai.retry.base_delay = chrono::milliseconds(1);

        auto sandbox = make_unique<fake_sandbox>();
        sandbox->respond = all_toolchains;
        sb = sandbox.get();
        auto mock = make_unique<mock_transport>();
        transport = mock.get();
        eng = make_unique<engine>(move(config), move(sandbox), move(mock));
    }

    // 运行所有请求，按 id 返回响应
    map<string, json> serve(const string &input) {
        istringstream in(input);
        ostringstream out;
        line_server server(*eng, in, out);
        server.serve();

        map<string, json> responses;
        istringstream lines(out.str());
        string line;
        while (getline(lines, line)) {
            json response = json::parse(line);
            responses[response.at("id").dump()] = response;
        }
        return responses;
    }

    fake_sandbox *sb = nullptr;
    mock_transport *transport = nullptr;
    unique_ptr<engine> eng;
};

TEST_F(ServerTest, ChecksDependencies) {
    auto responses = serve(R"({"id": 1, "method": "checkDependencies"})"
                           "\n");

    ASSERT_EQ(responses.count("1"), 1);
    const json &result = responses["1"].at("result");
    EXPECT_TRUE(result.at("allAvailable").get<bool>());
    EXPECT_EQ(result.at("python").at("version"), "3.11.4");
    EXPECT_EQ(result.at("cpp").at("command"), "g++");
}

TEST_F(ServerTest, ReportsProtocolErrors) {
    auto responses = serve("this is not json\n"
                           R"({"id": "x", "method": "compile"})"
                           "\n\n");

    ASSERT_EQ(responses.size(), 2);
    EXPECT_EQ(responses["null"].at("error").at("code"), "parse_error");
    EXPECT_EQ(responses["\"x\""].at("error").at("code"), "invalid_request");
}

TEST_F(ServerTest, InvalidExecuteRequestIsRejected) {
    auto responses = serve(R"({"id": 1, "method": "execute", "params": {"language": "py", "sourceCode": "", "kataPath": "/nonexistent/kata"}})"
                           "\n"
                           R"({"id": 2, "method": "execute", "params": {"language": "cobol", "sourceCode": "", "kataPath": "/tmp"}})"
                           "\n");

    EXPECT_EQ(responses["1"].at("error").at("code"), "invalid_argument");
    EXPECT_EQ(responses["2"].at("error").at("code"), "invalid_argument");
    EXPECT_EQ(sb->spawn_count(), 0);
}

TEST_F(ServerTest, ExecutesSubmission) {
    kata_dir dir;
    dir.write("tests.py", "def test_ok(): pass\n");
    sb->respond = [](const runguard_options &opt) {
        if (opt.command.size() == 2 && opt.command[1] == "--version") return all_toolchains(opt);
        write_report(opt, "{\"name\": \"test_ok\", \"passed\": true}\n");
        return exited(0, "hi\n");
    };

    json request = {{"id", 7},
                    {"method", "execute"},
                    {"params", {{"language", "py"}, {"sourceCode", "print('hi')"}, {"kataPath", dir.path().string()}}}};
    auto responses = serve(request.dump() + "\n");

    const json &result = responses["7"].at("result");
    EXPECT_TRUE(result.at("success").get<bool>());
    EXPECT_EQ(result.at("score"), 100);
    EXPECT_EQ(result.at("stdout"), "hi\n");
    EXPECT_TRUE(result.at("failure").is_null());
}

TEST_F(ServerTest, EvaluatesAnswer) {
    auto responses = serve(
        R"({"id": 5, "method": "evaluateAnswer", "params": {"kataType": "multiple-choice", "answer": ["b", "a"],)"
        R"( "multipleChoiceConfig": {"question": "Pick two", "options": [{"id": "a", "text": "A"}, {"id": "b", "text": "B"},)"
        R"( {"id": "c", "text": "C"}], "correctAnswers": ["a", "b"], "allowMultiple": true}}})"
        "\n"
        R"({"id": 6, "method": "evaluateAnswer", "params": {"kataType": "one-liner", "answer": "nope",)"
        R"( "oneLinerConfig": {"question": "Q", "expectedAnswer": "git status"}}})"
        "\n"
        R"({"id": 8, "method": "evaluateAnswer", "params": {"kataType": "shortform", "answer": "x",)"
        R"( "shortformConfig": {"question": ""}}})"
        "\n");

    const json &correct = responses["5"].at("result");
    EXPECT_TRUE(correct.at("success").get<bool>());
    EXPECT_EQ(correct.at("score"), 100);
    EXPECT_EQ(correct.at("testResults").at(0).at("name"), "Answer Validation");

    const json &wrong = responses["6"].at("result");
    EXPECT_FALSE(wrong.at("success").get<bool>());
    EXPECT_EQ(wrong.at("failure"), "tests_failed");
    EXPECT_EQ(wrong.at("stdout"), "Incorrect. Expected: git status");

    EXPECT_EQ(responses["8"].at("error").at("code"), "invalid_argument");
    EXPECT_EQ(sb->spawn_count(), 0);
}

TEST_F(ServerTest, JudgesExplanation) {
    EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(completion(JUDGMENT)));

    auto responses = serve(
        R"({"id": 3, "method": "judgeExplanation", "params": {"explanation": "x", "rubric": {"keys": ["clarity"]}}})"
        "\n");

    const json &result = responses["3"].at("result");
    EXPECT_EQ(result.at("score"), 90);
    EXPECT_TRUE(result.at("passed").get<bool>());
    EXPECT_EQ(result.at("feedback"), "Clear");
}

TEST_F(ServerTest, AIFailureIsReturnedAsError) {
    EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http_status(401, R"({"error": "Incorrect API key"})")));

    auto responses = serve(
        R"({"id": 4, "method": "judgeCodebase", "params": {"analysis": "x", "rubric": {"keys": ["depth"]}}})"
        "\n");

    const json &error = responses["4"].at("error");
    EXPECT_EQ(error.at("code"), "ai_service_error");
    EXPECT_EQ(error.at("errorType"), "auth");
    EXPECT_FALSE(error.at("retryable").get<bool>());
}

TEST_F(ServerTest, CancelsInflightRequest) {
    // cancel 可能在请求发出之前到达，此时不会调用 post
    EXPECT_CALL(*transport, post(_, _))
        .Times(AtMost(1))
        .WillOnce(Invoke([](const http_request &, const cancellation_token *cancel) -> http_response {
            while (!is_cancelled(cancel)) this_thread::sleep_for(chrono::milliseconds(5));
            throw network_error(network_failure::CANCELLED, "Callback aborted");
        }));

    auto responses = serve(
        R"({"id": "slow", "method": "generate", "params": {"prompt": "Create a kata", "schema": {"required": ["entry"]}}})"
        "\n"
        R"({"id": "c", "method": "cancel", "params": {"id": "slow"}})"
        "\n"
        R"({"id": "d", "method": "cancel", "params": {"id": "unknown"}})"
        "\n");

    EXPECT_TRUE(responses["\"c\""].at("result").at("cancelled").get<bool>());
    EXPECT_FALSE(responses["\"d\""].at("result").at("cancelled").get<bool>());
    const json &error = responses["\"slow\""].at("error");
    EXPECT_EQ(error.at("code"), "ai_service_error");
    EXPECT_TRUE(error.at("cancelled").get<bool>());
}

TEST(RpcMethodTest, ParsesMethodNames) {
    EXPECT_EQ(parse_rpc_method("execute"), rpc_method::EXECUTE);
    EXPECT_EQ(parse_rpc_method("checkDependencies"), rpc_method::CHECK_DEPENDENCIES);
    EXPECT_EQ(parse_rpc_method("judgeTemplate"), rpc_method::JUDGE_TEMPLATE);
    EXPECT_EQ(parse_rpc_method("evaluateAnswer"), rpc_method::EVALUATE_ANSWER);
    EXPECT_EQ(parse_rpc_method("cancel"), rpc_method::CANCEL);
    EXPECT_THROW(parse_rpc_method("shutdown"), invalid_argument);
}
