#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace kata {

/**
 * @brief 调用方持有的取消信号
 * 沙箱轮询 is_cancelled 来决定是否走超时的杀进程路径；
 * AI 客户端在退避等待时通过 wait_for 被立即唤醒。
 * 同一个 token 可以被多个线程同时读取，cancel 可以在任意线程调用。
 */
struct cancellation_token {
    void cancel();

    bool is_cancelled() const noexcept;

    /**
     * @brief 等待 timeout 或者直到被取消
     * @return 等待期间被取消返回 true
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> cancelled{false};
    mutable std::mutex mut;
    mutable std::condition_variable cond;
};

inline bool is_cancelled(const cancellation_token *token) {
    return token && token->is_cancelled();
}

}  // namespace kata
