#pragma once

#include <chrono>
#include <mutex>
#include <random>

namespace kata {

struct ai_service_error;

struct retry_config {
    /**
     * @brief 最多尝试的次数（包括第一次请求），默认 3 次，即最多重试 2 次
     */
    int max_attempts = 3;

    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};

    /**
     * @brief 抖动占退避时间的比例上限，取值 [0, 1)
     * 小于 1 时未封顶的退避时间严格递增
     */
    double jitter_ratio = 0.2;
};

/**
 * @brief 重试状态，每次决定重试时通知调用方
 */
struct retry_state {
    int attempt = 0;  // 失败的请求序号，从 0 开始
    int max_attempts = 0;
    std::chrono::milliseconds next_delay{0};
};

/**
 * @brief 指数退避的重试策略
 * delay(attempt) = base_delay * 2^attempt * (1 + jitter)，jitter 均匀分布于 [0, jitter_ratio)，
 * 结果不超过 max_delay。
 */
struct retry_policy {
    explicit retry_policy(const retry_config &config);
    retry_policy(const retry_config &config, unsigned seed);

    /**
     * @brief 第 attempt 次请求（从 0 开始）失败后是否需要重试
     * 只有可重试的错误类型才会重试，并且总尝试次数不超过 max_attempts
     */
    bool should_retry(const ai_service_error &error, int attempt) const;

    /**
     * @brief 第 attempt 次请求失败后，下一次请求之前需要等待的时间
     */
    std::chrono::milliseconds next_delay(int attempt);

    const retry_config &config() const noexcept;

private:
    retry_config cfg;
    std::mutex rng_mutex;
    std::mt19937 rng;
};

}  // namespace kata
