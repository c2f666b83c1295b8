#pragma once

#include <nlohmann/json.hpp>
#include "ai/error.hpp"
#include "ai/judgment.hpp"
#include "exec/dependency_prober.hpp"
#include "exec/result.hpp"
#include "exec/shortform.hpp"

/**
 * 对外接口的 JSON 编码
 * 请求和响应的字段名使用 camelCase，比如 sourceCode、testResults、installationGuide。
 */
namespace kata {

void from_json(const nlohmann::json &j, execution_request &request);
void from_json(const nlohmann::json &j, explanation_request &request);
void from_json(const nlohmann::json &j, template_request &request);
void from_json(const nlohmann::json &j, codebase_request &request);
void from_json(const nlohmann::json &j, choice_option &option);
void from_json(const nlohmann::json &j, multiple_choice_config &config);
void from_json(const nlohmann::json &j, text_answer_config &config);

/**
 * answer 可以是字符串或字符串数组；按 kataType 读取 multipleChoiceConfig、
 * shortformConfig 或 oneLinerConfig
 */
void from_json(const nlohmann::json &j, answer_request &request);

void to_json(nlohmann::json &j, const test_result &result);
void to_json(nlohmann::json &j, const execution_result &result);
void to_json(nlohmann::json &j, const dependency_status &status);
void to_json(nlohmann::json &j, const system_dependencies &deps);
void to_json(nlohmann::json &j, const judge_result &result);
void to_json(nlohmann::json &j, const generated_artifact &artifact);
void to_json(nlohmann::json &j, const ai_service_error &error);

}  // namespace kata
