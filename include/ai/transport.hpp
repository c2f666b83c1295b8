#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "common/cancellation.hpp"

namespace kata {

struct http_request {
    std::string url;
    std::vector<std::string> headers;  // "Name: value"
    std::string body;
    std::chrono::milliseconds timeout{60000};
};

struct http_response {
    long status_code = 0;
    std::string body;
};

/**
 * @brief 向 AI 服务发送请求的传输层
 * 收到任何 HTTP 响应（包括 4xx、5xx）都正常返回，由调用方根据状态码分类；
 * 没有收到响应时抛出 network_error。测试中替换为 mock。
 */
struct completion_transport {
    virtual ~completion_transport();

    /**
     * @brief 发送 POST 请求，阻塞直到收到响应、超时或被取消
     * @throw network_error 连接失败、超时或者被取消
     */
    virtual http_response post(const http_request &request, const cancellation_token *cancel) = 0;
};

/**
 * @brief 管理 CURL 的全局初始化
 * curl_global_init 不是线程安全的，必须在创建任何 worker 线程之前构造
 */
struct curl_global {
    curl_global();
    curl_global(const curl_global &) = delete;
    ~curl_global();

    curl_global &operator=(const curl_global &) = delete;
};

/**
 * @brief 使用 libcurl 的传输层实现
 * 每次请求使用独立的 easy handle，可以被多个线程同时调用
 */
struct curl_transport : public completion_transport {
    http_response post(const http_request &request, const cancellation_token *cancel) override;
};

}  // namespace kata
