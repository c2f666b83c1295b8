#pragma once

#include <string>

namespace kata {

/**
 * @brief 表示一次代码执行的结果分类
 * 除 ACCEPTED 外都对应 success = false 的 execution_result
 */
enum class status {
    /**
     * @brief 所有测试点都通过
     */
    ACCEPTED = 0,

    /**
     * @brief 测试框架正常运行结束，但是有测试点没有通过
     */
    TESTS_FAILED = 1,

    /**
     * @brief 选手语言对应的工具链（解释器或编译器）不可用
     * 此时不会创建任何进程，testResults 为空
     */
    TOOLCHAIN_MISSING = 2,

    /**
     * @brief 选手程序编译错误
     * 对于 C++ 是编译器返回非零，对于 TypeScript 是 tsc 返回非零。
     * 此时不会运行测试，testResults 为空
     */
    COMPILATION_ERROR = 3,

    /**
     * @brief 测试框架或选手程序异常退出
     * 退出码不是测试框架约定的 0/1，或者被信号终止
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 运行时间超过 timeout_ms，进程组已被杀死
     */
    TIME_LIMIT_EXCEEDED = 5,

    /**
     * @brief 测试框架输出了不符合协议的行
     * 已经解析出来的测试结果仍然会返回，并附加一条诊断
     */
    HARNESS_PARSE_ERROR = 6,

    /**
     * @brief 调用方取消了本次执行，与超时走相同的杀进程路径
     */
    CANCELLED = 7,

    /**
     * @brief 内部错误，引擎自身出错
     * 比如无法创建工作目录、无法 fork
     */
    INTERNAL_ERROR = 8
};

const char *get_display_message(status);

/**
 * @brief 用于 JSON 协议的状态名，比如 "toolchain_missing"
 */
std::string to_string(status);

}  // namespace kata
