#pragma once

#include <string>
#include "ai/judgment.hpp"

namespace kata {

/**
 * 评分提示词
 * 提示词由评分标准、提交内容和可选的上下文组成，
 * 最后要求模型只返回如下格式的 JSON：
 * {"scores": {"<key>": <0-100>}, "feedback": "...", "reasoning": "..."}
 */

std::string make_explanation_prompt(const explanation_request &request);

std::string make_template_prompt(const template_request &request);

std::string make_codebase_prompt(const codebase_request &request);

}  // namespace kata
