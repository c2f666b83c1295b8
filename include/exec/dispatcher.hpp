#pragma once

#include "common/cancellation.hpp"
#include "config.hpp"
#include "exec/adapter.hpp"
#include "exec/dependency_prober.hpp"
#include "exec/result.hpp"
#include "exec/sandbox.hpp"

namespace kata {

/**
 * @brief 执行选手代码并评测
 *
 * 一次执行的流程：
 * 1. 检查请求参数，读取题目元数据
 * 2. 检查语言对应的工具链，缺失时直接返回 TOOLCHAIN_MISSING，不创建任何进程
 * 3. 创建工作目录，由语言适配器写入代码和测试、编译、运行测试驱动
 * 4. 解析测试驱动的报告，计算分数和最终状态
 *
 * 执行失败（编译错误、超时、运行时错误等）都通过 execution_result 返回，
 * 只有非法的请求会抛出异常。可以被多个 worker 线程同时调用。
 */
struct execution_dispatcher {
    execution_dispatcher(const engine_config &config, kata::sandbox &sandbox, dependency_prober &prober);

    /**
     * @throw std::invalid_argument kata_path 不存在、timeout_ms 不为正、题目缺少公开测试或 meta.json 非法
     */
    execution_result execute(const execution_request &request, const cancellation_token *cancel = nullptr);

private:
    const engine_config &config;
    kata::sandbox &sandbox;
    dependency_prober &prober;
};

/**
 * @brief 根据测试驱动的输出填充测试结果、分数和状态
 * @param timeout 本次执行的时间限制，用于生成诊断信息
 */
void assemble_result(execution_result &result, const harness_output &output, std::chrono::milliseconds timeout);

/**
 * @brief round(100 * 通过数 / 总数)，没有测试点时为 0
 */
int compute_score(const std::vector<test_result> &results);

}  // namespace kata
