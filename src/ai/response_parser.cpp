#include "ai/response_parser.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <cmath>
#include <nlohmann/json.hpp>
#include <set>
#include "common/stl_utils.hpp"

namespace kata {
using namespace std;
using namespace nlohmann;

static const set<string> KNOWN_FILES = {"entry", "tests", "solution", "hidden_tests"};
static const set<string> CODE_LANGUAGES = {"python", "py", "javascript", "js", "typescript", "ts", "cpp", "c++"};

response_format_error::response_format_error(const string &message) : kata_exception(message) {}

// 回答中最外层的 JSON 对象，模型经常在 JSON 前后附加说明文字或者 ```json 标记
static string extract_json_object(const string &response) {
    size_t begin = response.find('{');
    size_t end = response.rfind('}');
    if (begin == string::npos || end == string::npos || end < begin)
        throw response_format_error("response contains no JSON object");
    return response.substr(begin, end - begin + 1);
}

ai_judgment parse_judgment(const string &response) {
    json j;
    try {
        j = json::parse(extract_json_object(response));
    } catch (json::parse_error &ex) {
        throw response_format_error(fmt::format("response is not valid JSON: {}", ex.what()));
    }

    if (!j.is_object() || !j.count("scores") || !j.at("scores").is_object())
        throw response_format_error("response missing scores object");
    if (!j.count("feedback") || !j.at("feedback").is_string())
        throw response_format_error("response missing feedback string");

    ai_judgment judgment;
    for (auto &[key, value] : j.at("scores").items()) {
        if (!value.is_number())
            throw response_format_error(fmt::format("invalid score for {}: {}", key, value.dump()));
        double score = value.get<double>();
        if (!isfinite(score) || score < 0 || score > 100)
            throw response_format_error(fmt::format("invalid score for {}: {}", key, value.dump()));
        judgment.scores[key] = score;
    }
    judgment.feedback = j.at("feedback").get<string>();
    if (j.count("reasoning") && j.at("reasoning").is_string())
        judgment.reasoning = j.at("reasoning").get<string>();
    return judgment;
}

judge_result process_judgment(const ai_judgment &judgment, const rubric &r) {
    double weighted = 0, total_weight = 0;
    for (const string &key : r.keys) {
        auto it = judgment.scores.find(key);
        if (it == judgment.scores.end())
            throw response_format_error(fmt::format("response missing score for {}", key));
        weighted += it->second * r.weight_of(key);
        total_weight += r.weight_of(key);
    }

    judge_result result;
    result.criteria = judgment.scores;
    result.feedback = judgment.feedback;
    result.reasoning = judgment.reasoning;
    double total = total_weight > 0 ? weighted / total_weight : 0;
    result.score = round(total * 100) / 100;

    result.passed = true;
    for (auto &[name, minimum] : r.threshold) {
        if (name == "min_total") {
            result.passed &= result.score >= minimum;
        } else if (name.rfind("min_", 0) == 0) {
            auto it = judgment.scores.find(name.substr(4));
            if (it != judgment.scores.end())
                result.passed &= it->second >= minimum;
        }
    }
    return result;
}

map<string, string> extract_code_blocks(const string &response) {
    map<string, string> blocks;
    const string fence = "```";
    size_t pos = 0;
    while ((pos = response.find(fence, pos)) != string::npos) {
        size_t header_end = response.find('\n', pos);
        if (header_end == string::npos) break;
        size_t close = response.find(fence, header_end + 1);
        if (close == string::npos) break;

        // 代码块头部为 "<lang>" 或者 "<lang> <name>"
        string header = trim_copy(response.substr(pos + fence.size(), header_end - pos - fence.size()));
        string lang = header.substr(0, header.find(' '));
        string name = header.find(' ') == string::npos ? "" : trim_copy(header.substr(header.find(' ') + 1));
        string content = trim_copy(response.substr(header_end + 1, close - header_end - 1));
        pos = close + fence.size();

        if (name.empty()) {
            if (lang == "yaml" || lang == "yml") name = "meta.yaml";
            else if (lang == "markdown" || lang == "md") name = "statement.md";
            else if (CODE_LANGUAGES.count(lang)) name = "entry";
            else continue;
        }

        string stem = name.substr(0, name.find('.'));
        blocks[KNOWN_FILES.count(stem) ? stem : name] = content;
    }
    return blocks;
}

generated_artifact parse_artifact(const string &response, const artifact_schema &schema) {
    generated_artifact artifact;
    artifact.blocks = extract_code_blocks(response);

    vector<string> missing;
    for (const string &name : schema.required)
        if (!artifact.blocks.count(name)) missing.push_back(name);
    if (!missing.empty())
        throw response_format_error(fmt::format("response missing required blocks: {}", boost::algorithm::join(missing, ", ")));
    return artifact;
}

void from_json(const json &j, artifact_schema &schema) {
    if (j.count("required")) j.at("required").get_to(schema.required);
    if (j.count("optional")) j.at("optional").get_to(schema.optional);
}

}  // namespace kata
