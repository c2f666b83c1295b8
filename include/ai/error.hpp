#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"

namespace kata {

/**
 * @brief AI 服务错误的分类
 */
enum class ai_error_type {
    /**
     * @brief 401、403 或者 API key 无效，不重试
     */
    AUTH,

    /**
     * @brief 429 或者额度用尽，重试
     */
    RATE_LIMIT,

    /**
     * @brief 连接被拒绝、被重置、域名解析失败，重试
     */
    NETWORK,

    /**
     * @brief 5xx，重试
     */
    SERVER,

    /**
     * @brief 返回内容格式错误，不重试
     */
    VALIDATION,

    /**
     * @brief 请求超过客户端设置的超时时间，重试
     */
    TIMEOUT,

    UNKNOWN
};

std::string to_string(ai_error_type type);

/**
 * @brief 错误类型是否可以重试，只由错误类型决定
 */
bool is_retryable(ai_error_type type);

/**
 * @brief 分类之前的原始错误信息
 * 由 AI 客户端根据 HTTP 状态码、传输层异常或者响应解析失败构造
 */
struct raw_error {
    std::optional<int> status_code;
    std::optional<network_failure> transport;

    /**
     * @brief 响应内容无法按约定的格式解析
     */
    bool malformed_body = false;

    std::string message;
};

/**
 * @brief AI 服务错误，作为 AI 调用失败时的返回值
 */
struct ai_service_error {
    ai_error_type type = ai_error_type::UNKNOWN;
    std::string message;
    std::optional<int> status_code;
    bool retryable = false;

    /**
     * @brief 返回该错误之前一共发出的请求数
     */
    int attempts = 0;

    /**
     * @brief 调用被取消，此时 type 为 UNKNOWN
     */
    bool cancelled = false;

    /**
     * @brief 展示给用户的错误描述
     */
    std::string user_message() const;

    /**
     * @brief 针对错误类型的恢复建议
     */
    std::vector<std::string> recovery_suggestions() const;
};

/**
 * @brief 将原始错误归类
 * 判断顺序：HTTP 状态码、传输层错误、响应格式错误、错误信息中的关键字
 */
ai_service_error classify_error(const raw_error &error);

}  // namespace kata
