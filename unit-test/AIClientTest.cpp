#include <nlohmann/json.hpp>
#include <vector>
#include "ai/client.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/mock_transport.hpp"

using namespace std;
using namespace kata;
using namespace kata::test;
using namespace nlohmann;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

static const char *GOOD_JUDGMENT =
    R"({"scores": {"clarity": 80, "accuracy": 90}, "feedback": "Well explained", "reasoning": "Covers the key points"})";

static ai_config test_config() {
    ai_config config;
    config.api_key = "sk-test";
    config.base_url = "https://ai.example.com/v1/";
    config.retry.base_delay = chrono::milliseconds(1);
    config.retry.max_delay = chrono::milliseconds(50);
    return config;
}

static explanation_request explanation() {
    explanation_request request;
    request.explanation = "A closure captures variables from its enclosing scope.";
    request.rubric.keys = {"clarity", "accuracy"};
    request.rubric.threshold = {{"min_total", 70}};
    request.topic = "closures";
    return request;
}

TEST(AIClientTest, JudgesExplanation) {
    ai_config config = test_config();
    mock_transport transport;
    http_request sent;
    EXPECT_CALL(transport, post(_, _)).WillOnce(Invoke([&](const http_request &request, const cancellation_token *) {
        sent = request;
        return completion(string("```json\n") + GOOD_JUDGMENT + "\n```");
    }));

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation());

    ASSERT_TRUE(holds_alternative<judge_result>(result));
    const judge_result &judgment = get<judge_result>(result);
    EXPECT_DOUBLE_EQ(judgment.score, 85);
    EXPECT_TRUE(judgment.passed);
    EXPECT_EQ(judgment.feedback, "Well explained");
    EXPECT_EQ(judgment.reasoning, "Covers the key points");

    EXPECT_EQ(sent.url, "https://ai.example.com/v1/chat/completions");
    EXPECT_THAT(sent.headers, ::testing::Contains("Authorization: Bearer sk-test"));
    json body = json::parse(sent.body);
    EXPECT_EQ(body["model"], config.model);
    ASSERT_EQ(body["messages"].size(), 1);
    string prompt = body["messages"][0]["content"];
    EXPECT_NE(prompt.find("A closure captures variables"), string::npos);
    EXPECT_NE(prompt.find("closures"), string::npos);
    EXPECT_NE(prompt.find("clarity"), string::npos);
}

TEST(AIClientTest, RateLimitIsRetriedWithIncreasingDelays) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _))
        .WillOnce(Return(http_status(429, R"({"error": {"message": "Rate limit reached"}})")))
        .WillOnce(Return(http_status(429, R"({"error": {"message": "Rate limit reached"}})")))
        .WillOnce(Return(completion(GOOD_JUDGMENT)));

    ai_client client(config, transport);
    vector<retry_state> retries;
    client.on_retry([&](const retry_state &state, const ai_service_error &error) {
        EXPECT_EQ(error.type, ai_error_type::RATE_LIMIT);
        retries.push_back(state);
    });

    auto result = client.judge_explanation(explanation());

    ASSERT_TRUE(holds_alternative<judge_result>(result));
    ASSERT_EQ(retries.size(), 2);
    EXPECT_EQ(retries[0].attempt, 0);
    EXPECT_EQ(retries[1].attempt, 1);
    EXPECT_EQ(retries[0].max_attempts, 3);
    EXPECT_LT(retries[0].next_delay, retries[1].next_delay);
}

TEST(AIClientTest, RetriesStopAfterMaxAttempts) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(3).WillRepeatedly(Return(http_status(503, "Service Unavailable")));

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation());

    ASSERT_TRUE(holds_alternative<ai_service_error>(result));
    const ai_service_error &error = get<ai_service_error>(result);
    EXPECT_EQ(error.type, ai_error_type::SERVER);
    EXPECT_TRUE(error.retryable);
    EXPECT_EQ(error.attempts, 3);
    EXPECT_EQ(error.user_message(), "AI service temporarily unavailable");
}

TEST(AIClientTest, AuthErrorIsNotRetried) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(1).WillOnce(Return(http_status(401, R"({"error": "invalid api key"})")));

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation());

    ASSERT_TRUE(holds_alternative<ai_service_error>(result));
    EXPECT_EQ(get<ai_service_error>(result).type, ai_error_type::AUTH);
    EXPECT_EQ(get<ai_service_error>(result).attempts, 1);
}

TEST(AIClientTest, MalformedAnswerIsValidationError) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(1).WillOnce(Return(completion("I think it deserves a B+.")));

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation());

    ASSERT_TRUE(holds_alternative<ai_service_error>(result));
    EXPECT_EQ(get<ai_service_error>(result).type, ai_error_type::VALIDATION);
    EXPECT_FALSE(get<ai_service_error>(result).retryable);
}

TEST(AIClientTest, NetworkErrorIsRetried) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _))
        .WillOnce(Invoke([](const http_request &, const cancellation_token *) -> http_response {
            throw network_error(network_failure::CONNECTION, "Couldn't connect to server");
        }))
        .WillOnce(Return(completion(GOOD_JUDGMENT)));

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation());
    EXPECT_TRUE(holds_alternative<judge_result>(result));
}

TEST(AIClientTest, MissingApiKeySendsNoRequest) {
    ai_config config = test_config();
    config.api_key.clear();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(0);

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation());

    ASSERT_TRUE(holds_alternative<ai_service_error>(result));
    EXPECT_EQ(get<ai_service_error>(result).type, ai_error_type::AUTH);
    EXPECT_EQ(get<ai_service_error>(result).attempts, 0);
}

TEST(AIClientTest, CancelledBeforeStartSendsNoRequest) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(0);
    cancellation_token token;
    token.cancel();

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation(), &token);

    ASSERT_TRUE(holds_alternative<ai_service_error>(result));
    EXPECT_TRUE(get<ai_service_error>(result).cancelled);
}

TEST(AIClientTest, CancellationInterruptsBackoff) {
    ai_config config = test_config();
    config.retry.base_delay = chrono::milliseconds(60000);
    config.retry.max_delay = chrono::milliseconds(60000);
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(1).WillOnce(Return(http_status(500)));
    cancellation_token token;

    ai_client client(config, transport);
    client.on_retry([&](const retry_state &, const ai_service_error &) { token.cancel(); });
    auto result = client.judge_explanation(explanation(), &token);

    ASSERT_TRUE(holds_alternative<ai_service_error>(result));
    EXPECT_TRUE(get<ai_service_error>(result).cancelled);
    EXPECT_EQ(get<ai_service_error>(result).attempts, 1);
}

TEST(AIClientTest, CancelledTransportIsNotRetried) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(1).WillOnce(Invoke([](const http_request &, const cancellation_token *) -> http_response {
        throw network_error(network_failure::CANCELLED, "Callback aborted");
    }));

    ai_client client(config, transport);
    auto result = client.judge_explanation(explanation());

    ASSERT_TRUE(holds_alternative<ai_service_error>(result));
    EXPECT_TRUE(get<ai_service_error>(result).cancelled);
}

TEST(AIClientTest, JudgesTemplateAndCodebase) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _)).Times(2).WillRepeatedly(Return(completion(GOOD_JUDGMENT)));
    ai_client client(config, transport);

    template_request tpl;
    tpl.template_content = "name: ci\non: [push]";
    tpl.rubric.keys = {"clarity"};
    tpl.expected_structure = json{{"jobs", "object"}};
    auto tpl_result = client.judge_template(tpl);
    ASSERT_TRUE(holds_alternative<judge_result>(tpl_result));
    EXPECT_DOUBLE_EQ(get<judge_result>(tpl_result).score, 80);

    codebase_request codebase;
    codebase.analysis = "The service uses a layered architecture.";
    codebase.rubric.keys = {"accuracy"};
    auto codebase_result = client.judge_codebase(codebase);
    ASSERT_TRUE(holds_alternative<judge_result>(codebase_result));
    EXPECT_DOUBLE_EQ(get<judge_result>(codebase_result).score, 90);
}

TEST(AIClientTest, GeneratesArtifact) {
    ai_config config = test_config();
    mock_transport transport;
    EXPECT_CALL(transport, post(_, _))
        .WillOnce(Return(completion("```python entry.py\ndef add(a, b):\n    return a + b\n```\n"
                                    "```python tests.py\nfrom entry import add\n```\n")));
    ai_client client(config, transport);

    artifact_schema schema;
    schema.required = {"entry", "tests"};
    auto result = client.generate("Create a kata about addition", schema);

    ASSERT_TRUE(holds_alternative<generated_artifact>(result));
    EXPECT_EQ(get<generated_artifact>(result).blocks.at("entry"), "def add(a, b):\n    return a + b");
}
