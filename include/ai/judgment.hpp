#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "exec/kata.hpp"

namespace kata {

/**
 * @brief 解释题的评分请求
 */
struct explanation_request {
    std::string explanation;
    kata::rubric rubric;
    std::optional<std::string> topic;
    std::optional<std::string> context;
};

/**
 * @brief 项目模板题的评分请求
 */
struct template_request {
    std::string template_content;
    kata::rubric rubric;

    /**
     * @brief 期望模板包含的结构，原样放入提示词
     */
    std::optional<nlohmann::json> expected_structure;

    std::optional<std::string> template_type;
    std::optional<std::string> context;
};

/**
 * @brief 代码库分析题的评分请求
 */
struct codebase_request {
    std::string analysis;
    kata::rubric rubric;
    std::optional<std::string> codebase_description;
    std::optional<std::string> context;
};

/**
 * @brief 模型返回的原始评分
 */
struct ai_judgment {
    std::map<std::string, double> scores;
    std::string feedback;
    std::string reasoning;
};

/**
 * @brief 按评分标准处理后的评分结果
 */
struct judge_result {
    /**
     * @brief 各评分项按权重的加权平均，保留两位小数，范围 [0, 100]
     */
    double score = 0;

    /**
     * @brief 总分不低于 min_total，并且每一个 min_<key> 都满足
     */
    bool passed = false;

    std::string feedback;
    std::string reasoning;

    /**
     * @brief 每个评分项的分数
     */
    std::map<std::string, double> criteria;
};

/**
 * @brief 生成题目时要求模型返回的代码块
 * 模型的回答由若干 ```<lang> <name> 代码块组成，
 * required 中的代码块缺失时视为 validation 错误
 */
struct artifact_schema {
    std::vector<std::string> required;
    std::vector<std::string> optional;
};

/**
 * @brief 生成结果，键为代码块名称，比如 entry、tests、meta.yaml、statement.md
 */
struct generated_artifact {
    std::map<std::string, std::string> blocks;
};

void from_json(const nlohmann::json &j, artifact_schema &schema);

}  // namespace kata
