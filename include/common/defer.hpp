#pragma once

#include <functional>

#define KATA_DEFER_1(x, y) x##y
#define KATA_DEFER_2(x, y) KATA_DEFER_1(x, y)
#define KATA_DEFER_0(x) KATA_DEFER_2(x, __COUNTER__)
#define defer auto KATA_DEFER_0(_defered_option) = kata::scoped_guard() + [&]

namespace kata {

/**
 * @brief 离开作用域时执行清理函数
 * 调用 dismiss 后不再执行，比如调试模式下需要保留工作目录
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

    void dismiss() noexcept;

private:
    std::function<void()> f;
};

}  // namespace kata
