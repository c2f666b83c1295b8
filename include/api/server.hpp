#pragma once

#include <future>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "engine.hpp"

namespace kata {

enum class rpc_method {
    EXECUTE,
    CHECK_DEPENDENCIES,
    JUDGE_EXPLANATION,
    JUDGE_TEMPLATE,
    JUDGE_CODEBASE,
    GENERATE,
    EVALUATE_ANSWER,
    CANCEL
};

/**
 * @throw std::invalid_argument 未知的方法名
 */
rpc_method parse_rpc_method(const std::string &name);

/**
 * @brief 基于行的 JSON 请求/响应服务
 *
 * 每行一个请求：{"id": ..., "method": "execute", "params": {...}}，
 * 每个请求对应一行响应：{"id": ..., "result": ...} 或者 {"id": ..., "error": {...}}。
 * 请求提交到 worker 线程池中执行，响应按完成顺序输出，调用方通过 id 对应请求。
 * {"method": "cancel", "params": {"id": ...}} 取消一个还在执行的请求。
 *
 * 方法名：execute、checkDependencies、judgeExplanation、judgeTemplate、
 * judgeCodebase、generate、evaluateAnswer、cancel。
 */
struct line_server {
    line_server(engine &eng, std::istream &in, std::ostream &out);

    /**
     * @brief 读取请求直到输入结束，然后等待所有请求完成
     */
    void serve();

    /**
     * @brief 处理一行请求，cancel 在当前线程完成，其他方法提交到线程池
     */
    void handle_line(const std::string &line);

    /**
     * @brief 等待所有已经提交的请求完成
     */
    void wait();

private:
    nlohmann::json invoke(rpc_method method, const nlohmann::json &params, const cancellation_token *cancel);
    void write(const nlohmann::json &response);
    void write_error(const nlohmann::json &id, const std::string &code, const std::string &message);
    bool cancel(const nlohmann::json &id);

    engine &eng;
    std::istream &in;
    std::ostream &out;
    std::mutex output_mutex;

    std::mutex inflight_mutex;
    // 键为请求 id 的 JSON 编码
    std::map<std::string, std::shared_ptr<cancellation_token>> inflight;
    std::vector<std::future<void>> pending;
};

}  // namespace kata
