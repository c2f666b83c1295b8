#pragma once

#include <memory>
#include "ai/client.hpp"
#include "ai/transport.hpp"
#include "config.hpp"
#include "exec/dependency_prober.hpp"
#include "exec/dispatcher.hpp"
#include "exec/sandbox.hpp"
#include "exec/shortform.hpp"
#include "worker.hpp"

namespace kata {

/**
 * @brief 引擎上下文，持有所有服务
 * 启动时构造一次，所有服务都通过它访问，没有全局实例。
 * 成员按依赖顺序构造：配置、沙箱、依赖探测、执行、AI 客户端，最后是 worker 线程池，
 * 析构时线程池最先停止，保证没有任务还在使用其他服务。
 */
struct engine {
    explicit engine(engine_config config);

    /**
     * @brief 使用指定的沙箱和传输层，测试中用于注入假实现
     */
    engine(engine_config config, std::unique_ptr<kata::sandbox> sandbox, std::unique_ptr<completion_transport> transport);

    engine(const engine &) = delete;
    engine &operator=(const engine &) = delete;

    /**
     * @brief 同步执行，在调用线程中运行
     * @throw std::invalid_argument 请求非法
     */
    execution_result execute(const execution_request &request, const cancellation_token *cancel = nullptr);

    /**
     * @brief 获取工具链探测结果
     * @param refresh 为 true 时重新探测，否则返回缓存
     */
    std::shared_ptr<const system_dependencies> check_dependencies(bool refresh = false);

    /**
     * @brief 判定选择题、简答题、填空题，不启动子进程
     * @throw std::invalid_argument 请求非法
     */
    execution_result evaluate_answer(const answer_request &request);

    ai_result<judge_result> judge_explanation(const explanation_request &request, const cancellation_token *cancel = nullptr);
    ai_result<judge_result> judge_template(const template_request &request, const cancellation_token *cancel = nullptr);
    ai_result<judge_result> judge_codebase(const codebase_request &request, const cancellation_token *cancel = nullptr);
    ai_result<generated_artifact> generate(const std::string &prompt, const artifact_schema &schema,
                                           const cancellation_token *cancel = nullptr);

    const engine_config &config() const noexcept;

    worker_pool &workers() noexcept;

private:
    engine_config cfg;
    std::unique_ptr<kata::sandbox> sandbox;
    dependency_prober prober;
    execution_dispatcher dispatcher;
    std::unique_ptr<curl_global> curl;
    std::unique_ptr<completion_transport> transport;
    ai_client ai;
    worker_pool pool;
};

}  // namespace kata
