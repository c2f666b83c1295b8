#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "exec/result.hpp"
#include "exec/sandbox.hpp"

namespace kata {

/**
 * @brief 表示选手代码编译错误
 * 适配器抛出该异常后不会运行测试，dispatcher 将其转换为 COMPILATION_ERROR 结果
 */
struct compilation_error : public std::runtime_error {
    std::string error_log;

    compilation_error(const std::string &message, const std::string &error_log);
};

/**
 * @brief 测试驱动的原始输出
 */
struct harness_output {
    /**
     * @brief 运行测试的进程结果；C++ 为所有测试点运行结果的汇总
     */
    runguard_result run;

    /**
     * @brief 测试驱动按协议输出的测试结果，每行一个 JSON 对象
     */
    std::string report;

    /**
     * @brief 本次运行的令牌，用于校验报告的完成记录
     */
    std::string token;

    /**
     * @brief 测试驱动或选手程序异常退出
     * 测试驱动约定全部通过返回 0、有测试失败返回 1，其他退出码和信号都视为异常退出
     */
    bool crashed = false;
};

/**
 * @brief 一次执行中适配器需要的全部信息，由 dispatcher 构造
 */
struct adapter_context {
    const execution_request &request;
    std::filesystem::path workdir;

    /**
     * @brief 运行测试的时间限制
     */
    std::chrono::milliseconds timeout;

    std::chrono::milliseconds compile_timeout;
    std::chrono::milliseconds kill_grace;
    int64_t output_limit;

    /**
     * @brief 本次运行的令牌，测试驱动在加载选手代码前从 TOKEN_FILE 读出并删除该文件
     */
    std::string report_token;

    kata::sandbox &sandbox;
    const cancellation_token *cancel;
};

/**
 * @brief 语言适配器
 * 负责把选手代码和测试文件放入工作目录、必要时编译、运行测试驱动。
 * 无论底层测试框架是什么，测试驱动都输出同一种协议，
 * 见 parse_test_report。
 */
struct language_adapter {
    virtual ~language_adapter();

    virtual kata::language language() const = 0;

    /**
     * @brief 选手代码写入的入口文件名，比如 entry.py
     */
    virtual std::string entry_file() const = 0;

    /**
     * @brief 公开测试文件名，比如 tests.py
     */
    virtual std::string public_tests_file() const = 0;

    /**
     * @brief 隐藏测试文件名，比如 hidden_tests.py
     */
    virtual std::string hidden_tests_file() const = 0;

    /**
     * @brief 准备工作目录、编译并运行测试
     * @throw compilation_error 编译失败
     * @throw std::invalid_argument 题目目录缺少公开测试文件
     * @throw std::system_error 无法创建进程或写入工作目录
     */
    virtual harness_output execute(const adapter_context &ctx) = 0;

protected:
    /**
     * @brief 写入入口文件，复制公开测试以及（include_hidden 时）隐藏测试
     * @return 工作目录中的测试文件名，公开测试在前
     */
    std::vector<std::string> prepare_workspace(const adapter_context &ctx) const;

    /**
     * @brief 构造运行命令的基本设置：工作目录、输出上限、报告文件环境变量
     */
    runguard_options make_options(const adapter_context &ctx, std::chrono::milliseconds limit) const;

    /**
     * @brief 运行测试驱动并读取报告文件
     */
    harness_output run_harness(const adapter_context &ctx, const std::vector<std::string> &command,
                               const std::vector<std::string> &env = {}) const;

    /**
     * @brief 在沙箱中运行编译命令
     * @return 编译期间被取消时返回 false
     * @throw compilation_error 编译器返回非零或者编译超时
     */
    bool compile(const adapter_context &ctx, const std::vector<std::string> &command) const;
};

/**
 * @brief 报告文件名，测试驱动通过 KATA_REPORT_FILE 环境变量得到完整路径
 */
extern const char *REPORT_FILE;

/**
 * @brief 令牌文件名，位于工作目录下
 */
extern const char *TOKEN_FILE;

}  // namespace kata
