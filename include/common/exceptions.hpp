#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace kata {

struct kata_exception : std::exception {
    kata_exception();
    explicit kata_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const kata_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示引擎本身的内部错误
 * 比如无法创建管道、无法 fork 子进程、无法创建工作目录等
 */
struct internal_error : public kata_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 网络请求失败的原因，由传输层根据 CURL 的错误码归类
 */
enum class network_failure {
    /**
     * @brief 连接被拒绝、被重置、TLS 握手失败等
     */
    CONNECTION,

    /**
     * @brief 域名解析失败
     */
    DNS,

    /**
     * @brief 请求超过了客户端设置的超时时间
     */
    TIMEOUT,

    /**
     * @brief 请求被调用方通过 cancellation_token 取消
     */
    CANCELLED,

    OTHER
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public kata_exception {
    network_error(network_failure failure, const std::string &message);

    network_failure failure() const noexcept;

private:
    network_failure kind;
};

}  // namespace kata
