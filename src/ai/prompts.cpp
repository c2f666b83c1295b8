#include "ai/prompts.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>

namespace kata {
using namespace std;

static string criteria_lines(const rubric &r, const string &subject) {
    string lines;
    for (const string &key : r.keys)
        lines += fmt::format("- {}: Evaluate the {} of the {}\n", key, key, subject);
    return lines;
}

static string response_format(const rubric &r, const string &reasoning) {
    vector<string> scores;
    for (const string &key : r.keys)
        scores.push_back(fmt::format("    \"{}\": <score_0_to_100>", key));

    return fmt::format(R"(RESPONSE FORMAT:
You must respond with valid JSON in exactly this format:
{{
  "scores": {{
{}
  }},
  "feedback": "<detailed constructive feedback explaining the scores and areas for improvement>",
  "reasoning": "<{}>"
}}

Important: Respond ONLY with the JSON object, no additional text.)",
                       boost::algorithm::join(scores, ",\n"), reasoning);
}

static string optional_line(const optional<string> &value, const char *label) {
    return value && !value->empty() ? fmt::format("{}: {}\n\n", label, *value) : "";
}

string make_explanation_prompt(const explanation_request &request) {
    return fmt::format(R"(You are an expert technical reviewer evaluating a student's explanation. Please provide a detailed assessment.

{}{}EXPLANATION TO EVALUATE:
{}

EVALUATION CRITERIA:
Please score the explanation on each of these criteria (0-100 scale):
{}
REQUIREMENTS:
- Provide scores for each criterion: {}
- Give constructive feedback explaining your assessment
- Be fair but thorough in your evaluation
- Consider technical accuracy, clarity, and completeness

{})",
                       optional_line(request.topic, "The topic being explained is"),
                       optional_line(request.context, "Additional context"),
                       request.explanation,
                       criteria_lines(request.rubric, "explanation"),
                       boost::algorithm::join(request.rubric.keys, ", "),
                       response_format(request.rubric, "brief explanation of your overall assessment"));
}

string make_template_prompt(const template_request &request) {
    string structure;
    if (request.expected_structure)
        structure = fmt::format("Expected structure elements: {}\n\n", request.expected_structure->dump(2));

    return fmt::format(R"(You are an expert software architect evaluating a project template. Please provide a detailed assessment of whether this template would serve as a good starting point for developers.

{}{}{}TEMPLATE TO EVALUATE:
{}

EVALUATION CRITERIA:
Please score the template on each of these criteria (0-100 scale):
{}
ASSESSMENT GUIDELINES:
- Structure: Is the project well-organized with logical file/folder hierarchy?
- Completeness: Are all essential components present for a working template?
- Best Practices: Does it follow framework/language conventions and best practices?
- Documentation: Are setup instructions and usage clear?
- Functionality: Would this template actually work as a starting point?

Use "close enough" evaluation - templates don't need to be perfect, but should be functional and well-structured starting points.

{})",
                       optional_line(request.template_type, "Template type"),
                       structure,
                       optional_line(request.context, "Additional context"),
                       request.template_content,
                       criteria_lines(request.rubric, "template"),
                       response_format(request.rubric, "brief explanation of your overall assessment and whether this is 'close enough' to be useful"));
}

string make_codebase_prompt(const codebase_request &request) {
    return fmt::format(R"(You are an expert software engineer evaluating a student's codebase analysis. Please provide a detailed assessment of their understanding and explanation of the code.

{}{}CODEBASE ANALYSIS TO EVALUATE:
{}

EVALUATION CRITERIA:
Please score the analysis on each of these criteria (0-100 scale):
{}
ASSESSMENT GUIDELINES:
- Comprehension: Does the student demonstrate clear understanding of what the code does?
- Structure: Is the analysis well-organized and easy to follow?
- Detail: Does the analysis provide appropriate technical depth without being overwhelming?
- Accuracy: Are the technical explanations correct and precise?
- Insights: Does the student provide thoughtful observations and improvement suggestions?

Look for evidence that the student has carefully read and understood the codebase, can explain how components interact, and demonstrates good software engineering judgment.

{})",
                       optional_line(request.codebase_description, "Codebase being analyzed"),
                       optional_line(request.context, "Additional context"),
                       request.analysis,
                       criteria_lines(request.rubric, "codebase analysis"),
                       response_format(request.rubric, "brief explanation of your overall assessment of the student's codebase analysis"));
}

}  // namespace kata
