#pragma once

#include "common/cancellation.hpp"
#include "runguard_options.hpp"

namespace kata {

/**
 * @brief 运行一个受控子进程
 * 语言适配器和依赖探测只通过该接口创建进程，测试中可以替换为假实现，
 * 从而验证在工具链缺失时没有创建任何进程。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 运行 opt.command，阻塞直到进程结束、超时或被取消
     * @param opt 命令、工作目录、时间限制、输出上限等
     * @param cancel 取消信号，可以为空
     * @throw std::system_error 无法创建进程
     */
    virtual runguard_result run(const runguard_options &opt, const cancellation_token *cancel) = 0;
};

/**
 * @brief 使用 fork/exec 和进程组实现的沙箱
 */
struct process_sandbox : public sandbox {
    runguard_result run(const runguard_options &opt, const cancellation_token *cancel) override;
};

}  // namespace kata
