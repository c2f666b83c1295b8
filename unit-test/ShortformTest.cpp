#include <nlohmann/json.hpp>
#include "api/messages.hpp"
#include "exec/shortform.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace kata;
using namespace nlohmann;

static answer_request multiple_choice(vector<string> answer, vector<string> correct) {
    multiple_choice_config config;
    config.question = "Which are sorting algorithms?";
    config.options = {{"a", "Quicksort"}, {"b", "Dijkstra"}, {"c", "Mergesort"}};
    config.correct_answers = move(correct);
    config.allow_multiple = config.correct_answers.size() > 1;
    return {kata_type::MULTIPLE_CHOICE, move(answer), config};
}

static answer_request text_answer(kata_type type, const string &answer, text_answer_config config) {
    if (config.question.empty()) config.question = "Which command lists changed files?";
    return {type, {answer}, config};
}

TEST(MultipleChoiceTest, SelectionOrderDoesNotMatter) {
    execution_result result = evaluate_answer(multiple_choice({"c", "a"}, {"a", "c"}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.score, 100);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].name, "Answer Validation");
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_EQ(result.stdout_data, "Correct! Well done.");
    EXPECT_EQ(result.stderr_data, "");
}

TEST(MultipleChoiceTest, PartialSelectionIsIncorrect) {
    execution_result result = evaluate_answer(multiple_choice({"a"}, {"a", "c"}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, status::TESTS_FAILED);
    EXPECT_EQ(result.score, 0);
    EXPECT_EQ(result.stderr_data, "Answer incorrect");
    EXPECT_EQ(result.test_results[0].message, "Incorrect. The correct answers are: Quicksort, Mergesort");
}

TEST(MultipleChoiceTest, SingleAnswerFeedbackNamesTheOption) {
    execution_result result = evaluate_answer(multiple_choice({"b"}, {"a"}));
    EXPECT_EQ(result.test_results[0].message, "Incorrect. The correct answer is: Quicksort");
}

TEST(MultipleChoiceTest, ExplanationFollowsFeedback) {
    answer_request request = multiple_choice({"a"}, {"a"});
    get<multiple_choice_config>(request.config).explanation = "Dijkstra finds shortest paths.";

    execution_result result = evaluate_answer(request);
    EXPECT_EQ(result.stdout_data, "Correct! Well done.\n\nDijkstra finds shortest paths.");
    EXPECT_EQ(result.test_results[0].message, "Correct! Well done.");
}

TEST(MultipleChoiceTest, RejectsInvalidConfiguration) {
    answer_request request = multiple_choice({"a"}, {});
    get<multiple_choice_config>(request.config).options.resize(1);

    vector<string> errors = validate_answer_request(request);
    EXPECT_EQ(errors.size(), 2);
    EXPECT_THROW(evaluate_answer(request), invalid_argument);
}

TEST(TextAnswerTest, IgnoresCaseAndSurroundingWhitespace) {
    text_answer_config config;
    config.expected_answer = "git status";

    EXPECT_TRUE(text_answer_matches("  Git Status\n", config));
    config.case_sensitive = true;
    EXPECT_FALSE(text_answer_matches("Git Status", config));
    EXPECT_TRUE(text_answer_matches(" git status ", config));
}

TEST(TextAnswerTest, AcceptsAlternativeAnswers) {
    text_answer_config config;
    config.acceptable_answers = {"git status", "git status -s"};

    EXPECT_TRUE(text_answer_matches("GIT STATUS -S", config));
    EXPECT_FALSE(text_answer_matches("git diff", config));
}

TEST(TextAnswerTest, AnyAnswerIsCorrectWithoutCriteria) {
    EXPECT_TRUE(text_answer_matches("", text_answer_config()));
    EXPECT_TRUE(evaluate_answer(text_answer(kata_type::SHORTFORM, "anything", {})).success);
}

TEST(TextAnswerTest, ShortformFeedback) {
    text_answer_config config;
    config.expected_answer = "git status";
    config.acceptable_answers = {"git st"};

    execution_result correct = evaluate_answer(text_answer(kata_type::SHORTFORM, "git status", config));
    EXPECT_EQ(correct.stdout_data, "Correct! Your answer matches the expected response.");

    execution_result wrong = evaluate_answer(text_answer(kata_type::SHORTFORM, "git log", config));
    EXPECT_FALSE(wrong.success);
    EXPECT_EQ(wrong.stdout_data, "Incorrect. Expected: git status (Acceptable answers: git st)");
}

TEST(TextAnswerTest, OneLinerFeedback) {
    text_answer_config config;
    config.acceptable_answers = {"ls -la"};

    execution_result correct = evaluate_answer(text_answer(kata_type::ONE_LINER, "ls -la", config));
    EXPECT_EQ(correct.stdout_data, "Correct! Your answer is right on target.");

    execution_result wrong = evaluate_answer(text_answer(kata_type::ONE_LINER, "ls", config));
    EXPECT_EQ(wrong.stdout_data, "Incorrect. Expected: See acceptable answers (Acceptable answers: ls -la)");
}

TEST(TextAnswerTest, MaxLengthCountsCharacters) {
    text_answer_config config;
    config.max_length = 3;

    // 三个字符，九个字节
    EXPECT_TRUE(evaluate_answer(text_answer(kata_type::SHORTFORM, "\xE4\xBD\xA0\xE5\xA5\xBD\xE5\x90\x97", config)).success);

    execution_result result = evaluate_answer(text_answer(kata_type::SHORTFORM, "abcd", config));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stdout_data, "Answer exceeds maximum length of 3 characters");

    config.max_length = 0;
    EXPECT_THROW(evaluate_answer(text_answer(kata_type::SHORTFORM, "a", config)), invalid_argument);
}

TEST(TextAnswerTest, ConfigMustMatchKataType) {
    answer_request request = multiple_choice({"a"}, {"a"});
    request.type = kata_type::ONE_LINER;
    EXPECT_FALSE(validate_answer_request(request).empty());

    request.type = kata_type::CODE;
    EXPECT_THROW(evaluate_answer(request), invalid_argument);
}

TEST(AnswerRequestTest, DecodesSingleStringAnswer) {
    answer_request request = json::parse(R"({
        "kataType": "shortform",
        "answer": "git status",
        "shortformConfig": {"question": "Q", "expectedAnswer": "git status", "caseSensitive": true, "maxLength": 20}
    })").get<answer_request>();

    EXPECT_EQ(request.type, kata_type::SHORTFORM);
    EXPECT_EQ(request.answer, vector<string>{"git status"});
    auto &config = get<text_answer_config>(request.config);
    EXPECT_TRUE(config.case_sensitive);
    EXPECT_EQ(config.max_length, 20);
    EXPECT_EQ(config.expected_answer, "git status");
}

TEST(AnswerRequestTest, RejectsMissingConfiguration) {
    EXPECT_THROW(json::parse(R"({"kataType": "one-liner", "answer": "x"})").get<answer_request>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"kataType": "code", "answer": "x"})").get<answer_request>(), invalid_argument);
}
