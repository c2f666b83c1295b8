#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "exec/kata.hpp"
#include "exec/result.hpp"

namespace kata {

struct choice_option {
    std::string id;
    std::string text;
};

/**
 * @brief 选择题（multiple-choice）配置
 */
struct multiple_choice_config {
    std::string question;
    std::vector<choice_option> options;

    /**
     * @brief 正确选项的 id，回答必须恰好选中这些选项
     */
    std::vector<std::string> correct_answers;

    bool allow_multiple = false;
    std::optional<std::string> explanation;
};

/**
 * @brief 简答题（shortform）与填空题（one-liner）的配置
 * 比较前去除首尾空白，case_sensitive 为 false 时忽略大小写。
 * expected_answer 与 acceptable_answers 都为空时不做校验，任何回答都正确。
 */
struct text_answer_config {
    std::string question;
    std::optional<std::string> expected_answer;
    std::vector<std::string> acceptable_answers;
    bool case_sensitive = false;

    /**
     * @brief 回答的最大字符数，只有 shortform 使用
     */
    std::optional<int> max_length;

    std::optional<std::string> explanation;
};

/**
 * @brief 不需要运行代码的题目的回答
 */
struct answer_request {
    kata_type type = kata_type::SHORTFORM;

    /**
     * @brief 选择题可以有多个回答，其他题型只使用第一个
     */
    std::vector<std::string> answer;

    std::variant<multiple_choice_config, text_answer_config> config;
};

/**
 * @brief 检查回答请求，返回所有问题，为空表示合法
 */
std::vector<std::string> validate_answer_request(const answer_request &request);

/**
 * @brief 按配置判断文本回答是否正确
 */
bool text_answer_matches(const std::string &answer, const text_answer_config &config);

/**
 * @brief 判定选择题、简答题、填空题的回答
 * 结果只有一个名为 "Answer Validation" 的测试点，正确时得 100 分，否则 0 分。
 * @throw std::invalid_argument 请求不合法，见 validate_answer_request
 */
execution_result evaluate_answer(const answer_request &request);

}  // namespace kata
