#include "worker.hpp"
#include <glog/logging.h>

namespace kata {
using namespace std;

worker_pool::worker_pool(size_t workers) {
    if (workers == 0)
        throw invalid_argument("worker pool requires at least one worker");

    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << workers << " workers";
}

worker_pool::~worker_pool() {
    stop();
}

size_t worker_pool::pending() const {
    return tasks.size();
}

size_t worker_pool::size() const {
    return threads.size();
}

void worker_pool::stop() {
    tasks.close();
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
}

void worker_pool::worker_loop(size_t worker_id) {
    DLOG(INFO) << "Worker " << worker_id << " started";

    function<void()> task;
    // 队列关闭并且取空后 pop 返回 false，worker 自然退出
    while (tasks.pop(task)) {
        // packaged_task 会捕获任务抛出的异常并保存到 future 中
        task();
        task = nullptr;
    }

    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace kata
