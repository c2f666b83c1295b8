#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "exec/language.hpp"

namespace kata {

/**
 * @brief 题目类型
 * code 与 template 类型要求元数据中的 timeout_ms 大于 0
 */
enum class kata_type {
    CODE,
    EXPLAIN,
    TEMPLATE,
    CODEBASE,
    SHORTFORM,
    MULTIPLE_CHOICE,
    ONE_LINER
};

kata_type parse_kata_type(const std::string &name);

std::string to_string(kata_type type);

/**
 * @brief AI 评分标准
 * keys 为评分项，weights 为各评分项权重（缺省为 1），
 * threshold 中 min_total 为总分下限，min_<key> 为对应评分项的下限
 */
struct rubric {
    std::vector<std::string> keys;
    std::map<std::string, double> weights;
    std::map<std::string, double> threshold;

    double weight_of(const std::string &key) const;
};

void from_json(const nlohmann::json &j, rubric &r);
void to_json(nlohmann::json &j, const rubric &r);

/**
 * @brief 题目元数据，对应题目目录下的 meta.json
 *
 * 题目目录结构：
 * kata_path
 * ├── meta.json // 题目元数据
 * ├── entry.py // 选手代码模板，执行时会被选手代码覆盖
 * ├── tests.py // 公开测试
 * └── hidden_tests.py // 隐藏测试，可选
 */
struct kata_metadata {
    std::string slug;
    std::string title;
    std::optional<kata::language> language;
    kata_type type = kata_type::CODE;
    std::string difficulty;

    /**
     * @brief 默认的运行时间限制，执行请求没有指定 timeout 时使用
     */
    std::optional<int> timeout_ms;

    std::optional<kata::rubric> rubric;
};

void from_json(const nlohmann::json &j, kata_metadata &meta);

/**
 * @brief 读取题目目录下的 meta.json
 * @param kata_path 题目目录
 * @return 题目元数据，meta.json 不存在时返回默认值（code 类型，没有默认时间限制）
 * @throw std::invalid_argument meta.json 格式错误，或者 code/template 类型的 timeout_ms 不大于 0
 */
kata_metadata load_kata_metadata(const std::filesystem::path &kata_path);

}  // namespace kata
