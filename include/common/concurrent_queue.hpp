#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace kata {

/**
 * @brief 并发队列，写者读者模型
 * 队列关闭后不再接受新元素，读者取完剩余元素后 pop 返回 false，
 * worker 据此退出循环。
 * @param <T> 队列元素类型，只要求可移动
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭
     * @param element 保存弹出的队头元素
     * @return 队列关闭且已经为空时返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 队列已经关闭时返回 false，元素被丢弃
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列并唤醒所有等待的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    size_t size() const {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    bool closed = false;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace kata
