#pragma once

#include <functional>
#include <string>
#include <variant>
#include "ai/error.hpp"
#include "ai/judgment.hpp"
#include "ai/retry_policy.hpp"
#include "ai/transport.hpp"
#include "common/cancellation.hpp"
#include "config.hpp"

namespace kata {

/**
 * @brief AI 调用的结果，成功时为 T，失败时为归类后的错误
 */
template <typename T>
using ai_result = std::variant<T, ai_service_error>;

/**
 * @brief 调用 OpenAI 兼容的 chat completions 接口完成评分和题目生成
 *
 * 每次调用的流程：构造提示词，发送请求，失败时归类错误；
 * 可重试的错误按退避时间等待后重试，直到成功或者次数用尽。
 * 所有失败都作为 ai_service_error 返回，不抛出异常。
 * 取消信号会中止正在进行的请求和退避等待，并且不再发起新的请求。
 */
struct ai_client {
    using retry_callback = std::function<void(const retry_state &, const ai_service_error &)>;

    ai_client(const ai_config &config, completion_transport &transport);

    ai_result<judge_result> judge_explanation(const explanation_request &request, const cancellation_token *cancel = nullptr);

    ai_result<judge_result> judge_template(const template_request &request, const cancellation_token *cancel = nullptr);

    ai_result<judge_result> judge_codebase(const codebase_request &request, const cancellation_token *cancel = nullptr);

    /**
     * @brief 生成题目内容
     * @param prompt 完整的提示词
     * @param schema 回答中必须包含的代码块
     */
    ai_result<generated_artifact> generate(const std::string &prompt, const artifact_schema &schema,
                                           const cancellation_token *cancel = nullptr);

    /**
     * @brief 每次决定重试时调用，必须在发起调用之前设置
     */
    void on_retry(retry_callback callback);

private:
    template <typename T, typename Parser>
    ai_result<T> call(const char *operation, const std::string &prompt, Parser parse, const cancellation_token *cancel);

    http_request make_request(const std::string &prompt) const;

    const ai_config &config;
    completion_transport &transport;
    retry_policy policy;
    retry_callback retry_listener;
};

}  // namespace kata
