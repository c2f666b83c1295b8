#pragma once

#include <string>
#include <vector>
#include "exec/result.hpp"

namespace kata {

/**
 * @brief 测试框架输出协议的解析结果
 */
struct test_report {
    /**
     * @brief 合法的测试结果，保持输出顺序；
     * 如果存在非法行，末尾会附加一条名为 harness 的失败诊断
     */
    std::vector<test_result> results;

    /**
     * @brief 非法行的数量，大于 0 时本次执行视为 HARNESS_PARSE_ERROR
     */
    size_t malformed_lines = 0;

    std::string first_error;

    /**
     * @brief 报告以令牌匹配、计数一致的完成记录结尾
     * 为 false 说明测试驱动没有跑完，比如选手代码中途调用了 exit
     */
    bool complete = false;
};

/**
 * @brief 解析测试框架的输出
 * 协议为每行一个 JSON 对象：{"name": string, "passed": bool, "message": string}，
 * message 可以省略或为 null，空行被忽略。
 * 测试驱动跑完所有测试后写入完成记录 {"done": true, "count": N, "token": string}，
 * 其中 N 为之前写入的测试结果数，token 为本次运行的令牌。
 * 令牌或计数不符的完成记录、完成记录之后的任何内容以及其余无法识别的行都视为非法行。
 * @param raw 测试框架写入报告文件的内容
 * @param token 本次运行的令牌，为空时任何完成记录都不被接受
 */
test_report parse_test_report(const std::string &raw, const std::string &token = "");

/**
 * @brief 将一个测试结果编码为协议中的一行（不含换行符）
 * C++ 的测试由引擎自己驱动，使用该函数生成与其他语言相同的报告
 */
std::string format_test_line(const test_result &result);

/**
 * @brief 编码完成记录（不含换行符）
 */
std::string format_completion_line(size_t count, const std::string &token);

}  // namespace kata
