#include "api/messages.hpp"
#include "common/json_utils.hpp"

namespace kata {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, execution_request &request) {
    request.language = parse_language(get_value<string>(j, "language"));
    request.source_code = get_value<string>(j, "sourceCode");
    request.kata_path = get_value<string>(j, "kataPath");
    request.include_hidden = get_value_def<bool>(j, false, "includeHidden");
    assign_optional(j, request.timeout_ms, "timeoutMs");
}

void from_json(const json &j, explanation_request &request) {
    request.explanation = get_value<string>(j, "explanation");
    request.rubric = get_value<rubric>(j, "rubric");
    assign_optional(j, request.topic, "topic");
    assign_optional(j, request.context, "context");
}

void from_json(const json &j, template_request &request) {
    request.template_content = get_value<string>(j, "templateContent");
    request.rubric = get_value<rubric>(j, "rubric");
    if (exists(j, "expectedStructure")) request.expected_structure.emplace(j.at("expectedStructure"));
    assign_optional(j, request.template_type, "templateType");
    assign_optional(j, request.context, "context");
}

void from_json(const json &j, codebase_request &request) {
    request.analysis = get_value<string>(j, "analysis");
    request.rubric = get_value<rubric>(j, "rubric");
    assign_optional(j, request.codebase_description, "codebaseDescription");
    assign_optional(j, request.context, "context");
}

void from_json(const json &j, choice_option &option) {
    option.id = get_value<string>(j, "id");
    option.text = get_value<string>(j, "text");
}

void from_json(const json &j, multiple_choice_config &config) {
    config.question = get_value<string>(j, "question");
    config.options = get_value<vector<choice_option>>(j, "options");
    config.correct_answers = get_value<vector<string>>(j, "correctAnswers");
    config.allow_multiple = get_value_def<bool>(j, false, "allowMultiple");
    assign_optional(j, config.explanation, "explanation");
}

void from_json(const json &j, text_answer_config &config) {
    config.question = get_value<string>(j, "question");
    assign_optional(j, config.expected_answer, "expectedAnswer");
    config.acceptable_answers = get_value_def<vector<string>>(j, {}, "acceptableAnswers");
    config.case_sensitive = get_value_def<bool>(j, false, "caseSensitive");
    assign_optional(j, config.max_length, "maxLength");
    assign_optional(j, config.explanation, "explanation");
}

void from_json(const json &j, answer_request &request) {
    request.type = parse_kata_type(get_value<string>(j, "kataType"));
    if (exists(j, "answer") && j.at("answer").is_string())
        request.answer = {j.at("answer").get<string>()};
    else
        request.answer = get_value<vector<string>>(j, "answer");

    switch (request.type) {
        case kata_type::MULTIPLE_CHOICE:
            request.config = get_value<multiple_choice_config>(j, "multipleChoiceConfig");
            break;
        case kata_type::SHORTFORM:
            request.config = get_value<text_answer_config>(j, "shortformConfig");
            break;
        case kata_type::ONE_LINER:
            request.config = get_value<text_answer_config>(j, "oneLinerConfig");
            break;
        default:
            throw invalid_argument("kata type " + to_string(request.type) + " does not take a direct answer");
    }
}

void to_json(json &j, const test_result &result) {
    j = {{"name", result.name}, {"passed", result.passed}, {"message", result.message}};
}

void to_json(json &j, const execution_result &result) {
    j = {{"success", result.success},
         {"stdout", result.stdout_data},
         {"stderr", result.stderr_data},
         {"testResults", result.test_results},
         {"durationMs", result.duration_ms},
         {"score", result.score},
         {"exitCode", optional_json(result.exit_code)},
         {"timedOut", result.timed_out},
         {"outputTruncated", result.output_truncated},
         {"failure", result.status == status::ACCEPTED ? json(nullptr) : json(to_string(result.status))},
         {"diagnostic", result.diagnostic}};
}

void to_json(json &j, const dependency_status &status) {
    j = {{"name", status.name},
         {"available", status.available},
         {"version", optional_json(status.version)},
         {"error", optional_json(status.error)},
         {"installationGuide", optional_json(status.installation_guide)},
         {"command", status.command.empty() ? json(nullptr) : json(status.command)}};
}

void to_json(json &j, const system_dependencies &deps) {
    j = {{"python", deps.python},
         {"nodejs", deps.nodejs},
         {"typescript", deps.typescript},
         {"cpp", deps.cpp},
         {"allAvailable", deps.all_available}};
}

void to_json(json &j, const judge_result &result) {
    j = {{"score", result.score},
         {"passed", result.passed},
         {"feedback", result.feedback},
         {"reasoning", result.reasoning},
         {"criteriaBreakdown", result.criteria}};
}

void to_json(json &j, const generated_artifact &artifact) {
    j = {{"blocks", artifact.blocks}};
}

void to_json(json &j, const ai_service_error &error) {
    j = {{"errorType", to_string(error.type)},
         {"message", error.message},
         {"statusCode", optional_json(error.status_code)},
         {"retryable", error.retryable},
         {"attempts", error.attempts},
         {"cancelled", error.cancelled},
         {"userMessage", error.user_message()},
         {"recoverySuggestions", error.recovery_suggestions()}};
}

}  // namespace kata
