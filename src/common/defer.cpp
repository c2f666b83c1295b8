#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace kata {

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(std::function<void()> f) : f(std::move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数不能抛出异常，清理失败只记录日志
    try {
        f();
    } catch (std::exception &ex) {
        LOG(ERROR) << "cleanup failed: " << ex.what();
    }
}

scoped_guard scoped_guard::operator+(std::function<void()> f) const {
    return scoped_guard(std::move(f));
}

void scoped_guard::dismiss() noexcept {
    f = nullptr;
}

}  // namespace kata
