#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "exec/language.hpp"

namespace kata {

/**
 * @brief 单个测试点的结果，对应测试框架输出的一行
 */
struct test_result {
    std::string name;
    bool passed = false;
    std::string message;
};

/**
 * @brief 执行请求
 */
struct execution_request {
    kata::language language = kata::language::PYTHON;

    /**
     * @brief 选手代码，会被写入对应语言的入口文件
     */
    std::string source_code;

    /**
     * @brief 题目目录，包含公开测试、可选的隐藏测试和 meta.json
     */
    std::filesystem::path kata_path;

    bool include_hidden = false;

    /**
     * @brief 运行时间限制，为空时使用 meta.json 的 timeout_ms，再为空时使用配置的默认值
     */
    std::optional<int> timeout_ms;
};

/**
 * @brief 执行结果
 * 保证：timed_out 时 success 为 false；success 时所有测试点通过；
 * 除工具链缺失和编译错误外 test_results 非空。
 */
struct execution_result {
    bool success = false;
    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 按测试框架输出的顺序排列，公开测试在隐藏测试之前
     */
    std::vector<test_result> test_results;

    int64_t duration_ms = 0;

    /**
     * @brief round(100 * 通过数 / 总数)，没有测试点时为 0
     */
    int score = 0;

    std::optional<int> exit_code;
    bool timed_out = false;
    bool output_truncated = false;

    kata::status status = kata::status::INTERNAL_ERROR;
    std::string diagnostic;
};

}  // namespace kata
