#include "api/messages.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace kata;
using namespace nlohmann;

TEST(MessagesTest, ParsesExecutionRequest) {
    auto request = json::parse(R"({
        "language": "ts",
        "sourceCode": "export const x = 1;",
        "kataPath": "/katas/closures",
        "includeHidden": true,
        "timeoutMs": 2500
    })").get<execution_request>();

    EXPECT_EQ(request.language, kata::language::TYPESCRIPT);
    EXPECT_EQ(request.source_code, "export const x = 1;");
    EXPECT_EQ(request.kata_path, filesystem::path("/katas/closures"));
    EXPECT_TRUE(request.include_hidden);
    ASSERT_TRUE(request.timeout_ms);
    EXPECT_EQ(*request.timeout_ms, 2500);
}

TEST(MessagesTest, ExecutionRequestDefaults) {
    auto request = json::parse(R"({"language": "py", "sourceCode": "", "kataPath": "/k"})").get<execution_request>();
    EXPECT_FALSE(request.include_hidden);
    EXPECT_FALSE(request.timeout_ms);
}

TEST(MessagesTest, RejectsInvalidExecutionRequest) {
    EXPECT_THROW(json::parse(R"({"language": "rust", "sourceCode": "", "kataPath": "/k"})").get<execution_request>(),
                 invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "py", "sourceCode": ""})").get<execution_request>(), invalid_argument);
}

TEST(MessagesTest, ParsesJudgeRequests) {
    auto explanation = json::parse(R"({
        "explanation": "Closures capture variables.",
        "rubric": {"keys": ["clarity"], "threshold": {"min_total": 60}},
        "topic": "closures"
    })").get<explanation_request>();
    EXPECT_EQ(explanation.rubric.keys, vector<string>{"clarity"});
    EXPECT_EQ(explanation.topic.value_or(""), "closures");
    EXPECT_FALSE(explanation.context);

    auto tpl = json::parse(R"({
        "templateContent": "FROM alpine",
        "rubric": {"keys": ["structure"]},
        "expectedStructure": {"stages": 2},
        "templateType": "dockerfile"
    })").get<template_request>();
    ASSERT_TRUE(tpl.expected_structure);
    EXPECT_JSON_EQ(*tpl.expected_structure, json({{"stages", 2}}));
    EXPECT_EQ(tpl.template_type.value_or(""), "dockerfile");

    auto codebase = json::parse(R"({"analysis": "Layered.", "rubric": {"keys": ["depth"]}})").get<codebase_request>();
    EXPECT_EQ(codebase.analysis, "Layered.");
    EXPECT_FALSE(codebase.codebase_description);
}

TEST(MessagesTest, EncodesExecutionResult) {
    execution_result result;
    result.success = false;
    result.stdout_data = "out";
    result.test_results = {{"test_a", true, ""}, {"test_b", false, "Expected 1"}};
    result.duration_ms = 42;
    result.score = 50;
    result.exit_code = 1;
    result.status = status::TESTS_FAILED;

    EXPECT_JSON_EQ(json(result), json::parse(R"({
        "success": false,
        "stdout": "out",
        "stderr": "",
        "testResults": [
            {"name": "test_a", "passed": true, "message": ""},
            {"name": "test_b", "passed": false, "message": "Expected 1"}
        ],
        "durationMs": 42,
        "score": 50,
        "exitCode": 1,
        "timedOut": false,
        "outputTruncated": false,
        "failure": "tests_failed",
        "diagnostic": ""
    })"));
}

TEST(MessagesTest, AcceptedResultHasNoFailure) {
    execution_result result;
    result.success = true;
    result.status = status::ACCEPTED;

    json j = result;
    EXPECT_TRUE(j.at("failure").is_null());
    EXPECT_TRUE(j.at("exitCode").is_null());
}

TEST(MessagesTest, InvalidUtf8InOutputIsReplaced) {
    // 过长编码、超出 U+10FFFF 的码点、代理区
    for (string bytes : {"\xE0\x80\x80", "\xF0\x80\x80\x80", "\xF4\x90\x80\x80", "\xED\xA0\x80", "\xC0\xAF"}) {
        EXPECT_FALSE(utf8_check_is_valid(bytes));

        execution_result result;
        result.stdout_data = sanitize_utf8("out: " + bytes);
        string encoded;
        EXPECT_NO_THROW(encoded = json(result).dump());
        EXPECT_NE(encoded.find("\xEF\xBF\xBD"), string::npos);
    }

    for (string text : {"plain", "caf\xC3\xA9", "\xE0\xA0\x80", "\xF0\x9F\x98\x80", "\xF4\x8F\xBF\xBF"}) {
        EXPECT_TRUE(utf8_check_is_valid(text)) << text;
        EXPECT_EQ(sanitize_utf8(text), text);
    }
    EXPECT_EQ(sanitize_utf8("a\xE0\x80\x80" "b"), "a\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD" "b");
}

TEST(MessagesTest, EncodesDependencies) {
    dependency_status missing;
    missing.name = "C++ Compiler";
    missing.error = "g++ not found";
    missing.installation_guide = "Install build-essential";

    json j = missing;
    EXPECT_JSON_EQ(j, json::parse(R"({
        "name": "C++ Compiler",
        "available": false,
        "version": null,
        "error": "g++ not found",
        "installationGuide": "Install build-essential",
        "command": null
    })"));
}

TEST(MessagesTest, EncodesJudgeResultAndError) {
    judge_result result;
    result.score = 72.5;
    result.passed = true;
    result.feedback = "Good";
    result.criteria = {{"clarity", 70}, {"accuracy", 75}};

    json j = result;
    EXPECT_EQ(j.at("score"), 72.5);
    EXPECT_JSON_EQ(j.at("criteriaBreakdown"), json({{"accuracy", 75}, {"clarity", 70}}));

    ai_service_error error;
    error.type = ai_error_type::RATE_LIMIT;
    error.message = "AI API request failed: 429";
    error.status_code = 429;
    error.retryable = true;
    error.attempts = 3;

    json e = error;
    EXPECT_EQ(e.at("errorType"), "rate_limit");
    EXPECT_EQ(e.at("statusCode"), 429);
    EXPECT_EQ(e.at("attempts"), 3);
    EXPECT_EQ(e.at("userMessage"), "AI service rate limit exceeded - please try again later");
    EXPECT_FALSE(e.at("recoverySuggestions").empty());
}
