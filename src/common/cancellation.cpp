#include "common/cancellation.hpp"

namespace kata {
using namespace std;

void cancellation_token::cancel() {
    {
        lock_guard<mutex> lock(mut);
        cancelled = true;
    }
    cond.notify_all();
}

bool cancellation_token::is_cancelled() const noexcept {
    return cancelled.load();
}

bool cancellation_token::wait_for(chrono::milliseconds timeout) const {
    unique_lock<mutex> lock(mut);
    return cond.wait_for(lock, timeout, [this] { return cancelled.load(); });
}

}  // namespace kata
