#include "exec/shortform.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <stdexcept>
#include "common/utils.hpp"

namespace kata {
using namespace std;

static const char *TEST_NAME = "Answer Validation";

// 按 UTF-8 码点计数
static size_t count_characters(const string &text) {
    return count_if(text.begin(), text.end(), [](char c) { return ((unsigned char)c & 0xC0) != 0x80; });
}

vector<string> validate_answer_request(const answer_request &request) {
    vector<string> errors;
    switch (request.type) {
        case kata_type::MULTIPLE_CHOICE: {
            auto *config = get_if<multiple_choice_config>(&request.config);
            if (!config) {
                errors.push_back("multiple choice configuration is required");
                break;
            }
            if (config->question.empty())
                errors.push_back("question is required");
            if (config->options.size() < 2)
                errors.push_back("options must have at least 2 items");
            for (size_t i = 0; i < config->options.size(); ++i) {
                if (config->options[i].id.empty()) errors.push_back(fmt::format("option {} must have an id", i));
                if (config->options[i].text.empty()) errors.push_back(fmt::format("option {} must have a text", i));
            }
            if (config->correct_answers.empty())
                errors.push_back("correctAnswers must not be empty");
            break;
        }
        case kata_type::SHORTFORM:
        case kata_type::ONE_LINER: {
            auto *config = get_if<text_answer_config>(&request.config);
            if (!config) {
                errors.push_back(to_string(request.type) + " configuration is required");
                break;
            }
            if (config->question.empty())
                errors.push_back("question is required");
            if (config->max_length && *config->max_length < 1)
                errors.push_back("maxLength must be a positive number");
            break;
        }
        default:
            errors.push_back("kata type " + to_string(request.type) + " cannot be evaluated without running code or a judge");
    }
    return errors;
}

bool text_answer_matches(const string &answer, const text_answer_config &config) {
    if (!config.expected_answer && config.acceptable_answers.empty())
        return true;

    auto normalize = [&config](const string &text) {
        string normalized = boost::algorithm::trim_copy(text);
        return config.case_sensitive ? normalized : boost::algorithm::to_lower_copy(normalized);
    };

    string actual = normalize(answer);
    if (config.expected_answer && normalize(*config.expected_answer) == actual)
        return true;
    return any_of(config.acceptable_answers.begin(), config.acceptable_answers.end(),
                  [&](const string &acceptable) { return normalize(acceptable) == actual; });
}

static string incorrect_text_feedback(const text_answer_config &config) {
    string feedback = "Incorrect. Expected: " + config.expected_answer.value_or("See acceptable answers");
    if (!config.acceptable_answers.empty())
        feedback += " (Acceptable answers: " + boost::algorithm::join(config.acceptable_answers, ", ") + ")";
    return feedback;
}

static bool evaluate_multiple_choice(const answer_request &request, const multiple_choice_config &config, string &feedback) {
    vector<string> expected = config.correct_answers, actual = request.answer;
    sort(expected.begin(), expected.end());
    sort(actual.begin(), actual.end());
    if (expected == actual) {
        feedback = "Correct! Well done.";
        return true;
    }

    vector<string> correct_options;
    for (auto &option : config.options)
        if (find(config.correct_answers.begin(), config.correct_answers.end(), option.id) != config.correct_answers.end())
            correct_options.push_back(option.text);
    feedback = fmt::format("Incorrect. The correct answer{}: {}", correct_options.size() > 1 ? "s are" : " is",
                           boost::algorithm::join(correct_options, ", "));
    return false;
}

static bool evaluate_text(const answer_request &request, const text_answer_config &config, string &feedback) {
    string answer = request.answer.empty() ? "" : request.answer.front();
    if (request.type == kata_type::SHORTFORM && config.max_length &&
        count_characters(answer) > static_cast<size_t>(*config.max_length)) {
        feedback = fmt::format("Answer exceeds maximum length of {} characters", *config.max_length);
        return false;
    }

    if (text_answer_matches(answer, config)) {
        feedback = request.type == kata_type::ONE_LINER ? "Correct! Your answer is right on target."
                                                        : "Correct! Your answer matches the expected response.";
        return true;
    }
    feedback = incorrect_text_feedback(config);
    return false;
}

execution_result evaluate_answer(const answer_request &request) {
    elapsed_time elapsed;
    vector<string> errors = validate_answer_request(request);
    if (!errors.empty())
        throw invalid_argument("invalid answer request: " + boost::algorithm::join(errors, "; "));

    string feedback;
    optional<string> explanation;
    bool correct;
    if (request.type == kata_type::MULTIPLE_CHOICE) {
        auto &config = get<multiple_choice_config>(request.config);
        correct = evaluate_multiple_choice(request, config, feedback);
        explanation = config.explanation;
    } else {
        auto &config = get<text_answer_config>(request.config);
        correct = evaluate_text(request, config, feedback);
        explanation = config.explanation;
    }
    DLOG(INFO) << "evaluated " << to_string(request.type) << " answer: " << (correct ? "correct" : "incorrect");

    execution_result result;
    result.success = correct;
    result.status = correct ? status::ACCEPTED : status::TESTS_FAILED;
    result.stdout_data = explanation ? feedback + "\n\n" + *explanation : feedback;
    result.stderr_data = correct ? "" : "Answer incorrect";
    result.test_results.push_back({TEST_NAME, correct, feedback});
    result.score = correct ? 100 : 0;
    result.duration_ms = elapsed.duration<chrono::milliseconds>().count();
    return result;
}

}  // namespace kata
