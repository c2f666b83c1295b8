#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "exec/adapter.hpp"
#include "exec/dependency_prober.hpp"

namespace kata {

struct python_config {
    std::string interpreter = "python3";
};

struct javascript_config {
    std::string node = "node";
};

struct typescript_config {
    std::string node = "node";
    std::string compiler = "tsc";
    std::vector<std::string> compiler_flags = {
        "--target", "es2020", "--module", "commonjs", "--esModuleInterop",
        "--allowSyntheticDefaultImports", "--moduleResolution", "node", "--skipLibCheck"};
};

struct cpp_config {
    std::string compiler = "g++";
    std::vector<std::string> compiler_flags = {"-std=c++17", "-O2"};
};

/**
 * @brief 每种语言的适配器配置
 * 与 language 一一对应，新增语言需要在这里增加一项
 */
using adapter_config = std::variant<python_config, javascript_config, typescript_config, cpp_config>;

/**
 * @brief 根据探测到的工具链构造语言对应的适配器配置
 * 比如 Python 可能是 python3 或者 python，C++ 可能是 g++ 或者 clang++
 */
adapter_config make_adapter_config(language lang, const system_dependencies &deps);

std::unique_ptr<language_adapter> make_adapter(const adapter_config &config);

/**
 * @brief 运行 tests.py、hidden_tests.py 中以 test 开头的函数
 * 按定义顺序执行，断言失败或者抛出异常都视为测试失败
 */
struct python_adapter : public language_adapter {
    explicit python_adapter(python_config config);

    kata::language language() const override;
    std::string entry_file() const override;
    std::string public_tests_file() const override;
    std::string hidden_tests_file() const override;
    harness_output execute(const adapter_context &ctx) override;

private:
    python_config config;
};

/**
 * @brief 运行 tests.js、hidden_tests.js
 * 测试可以调用全局的 test(name, fn) 注册，也可以导出以 test 开头的函数，异步测试会被等待
 */
struct javascript_adapter : public language_adapter {
    explicit javascript_adapter(javascript_config config);

    kata::language language() const override;
    std::string entry_file() const override;
    std::string public_tests_file() const override;
    std::string hidden_tests_file() const override;
    harness_output execute(const adapter_context &ctx) override;

private:
    javascript_config config;
};

/**
 * @brief 先用 tsc 将入口文件和测试编译为 CommonJS，再按 JavaScript 的方式运行
 */
struct typescript_adapter : public language_adapter {
    explicit typescript_adapter(typescript_config config);

    kata::language language() const override;
    std::string entry_file() const override;
    std::string public_tests_file() const override;
    std::string hidden_tests_file() const override;
    harness_output execute(const adapter_context &ctx) override;

private:
    typescript_config config;
};

/**
 * @brief 编译 entry.cpp，然后逐个运行 tests.txt、hidden_tests.txt 中的输入输出测试
 *
 * 测试文件格式：测试点之间用一行 === 分隔，每个测试点的输入和期望输出之间用一行 --- 分隔，
 * 比较时忽略首尾空白字符。
 * @code
 * 1 2
 * ---
 * 3
 * ===
 * 5 7
 * ---
 * 12
 * @endcode
 */
struct cpp_adapter : public language_adapter {
    explicit cpp_adapter(cpp_config config);

    kata::language language() const override;
    std::string entry_file() const override;
    std::string public_tests_file() const override;
    std::string hidden_tests_file() const override;
    harness_output execute(const adapter_context &ctx) override;

private:
    cpp_config config;
};

/**
 * @brief 输入输出测试点
 */
struct io_case {
    std::string input;
    std::string expected;
    bool well_formed = true;
};

/**
 * @brief 解析 C++ 题目的输入输出测试文件
 */
std::vector<io_case> parse_io_cases(const std::string &content);

/**
 * @brief JavaScript 测试驱动的源码，TypeScript 编译后复用
 */
extern const char *JAVASCRIPT_RUNNER;

}  // namespace kata
