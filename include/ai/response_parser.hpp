#pragma once

#include <map>
#include <string>
#include "ai/judgment.hpp"
#include "common/exceptions.hpp"

namespace kata {

/**
 * @brief 模型的回答不符合约定的格式
 * AI 客户端将其归类为 validation 错误，不会重试
 */
struct response_format_error : public kata_exception {
    explicit response_format_error(const std::string &message);
};

/**
 * @brief 解析评分回答
 * 去除 markdown 代码块标记，取最外层的 {...}，要求 scores 为对象且每一项都是
 * [0, 100] 之间的数字，feedback 为字符串，reasoning 可选。
 * @throw response_format_error 回答格式错误
 */
ai_judgment parse_judgment(const std::string &response);

/**
 * @brief 按评分标准计算总分和是否通过
 * @throw response_format_error 回答中缺少评分标准要求的评分项
 */
judge_result process_judgment(const ai_judgment &judgment, const rubric &r);

/**
 * @brief 提取回答中所有的 ```<lang> <name> 代码块
 * 没有名称的代码块按语言命名：yaml 为 meta.yaml，markdown 为 statement.md，
 * 代码为 entry；entry.py、tests.ts 等带扩展名的名称只保留主文件名。
 */
std::map<std::string, std::string> extract_code_blocks(const std::string &response);

/**
 * @brief 解析生成回答
 * @throw response_format_error 缺少 schema 要求的代码块
 */
generated_artifact parse_artifact(const std::string &response, const artifact_schema &schema);

}  // namespace kata
