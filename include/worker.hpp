#pragma once

#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>
#include "common/concurrent_queue.hpp"

/**
 * worker 线程池
 * 执行请求和 AI 调用都是阻塞的，由调用方提交到线程池中并发执行。
 * worker 数量在启动时由配置决定，任务在队列中按提交顺序等待空闲的 worker。
 *
 * 停止时先关闭队列，worker 处理完队列中剩余的任务后退出，
 * 因此已经提交的任务一定会被执行。
 */
namespace kata {

struct worker_pool {
    /**
     * @param workers worker 线程数，必须大于 0
     * @throw std::invalid_argument workers 为 0
     */
    explicit worker_pool(size_t workers);
    worker_pool(const worker_pool &) = delete;
    ~worker_pool();

    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 提交一个任务
     * @return 任务的结果，任务抛出的异常通过 future 传给调用方
     * @throw std::runtime_error 线程池已经停止
     */
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F f) {
        using result_t = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<result_t()>>(std::move(f));
        std::future<result_t> future = task->get_future();
        if (!tasks.push([task] { (*task)(); }))
            throw std::runtime_error("worker pool has been stopped");
        return future;
    }

    /**
     * @brief 等待队列中的任务
     */
    size_t pending() const;

    size_t size() const;

    /**
     * @brief 停止接受新任务，等待所有 worker 退出
     */
    void stop();

private:
    void worker_loop(size_t worker_id);

    concurrent_queue<std::function<void()>> tasks;
    std::vector<std::thread> threads;
};

}  // namespace kata
